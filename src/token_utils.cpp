#include "token_utils.hpp"
#include "realmauth/constants.hpp"
#include "realmauth/keypair.hpp"
#include "base64url.hpp"
#include <nlohmann/json.hpp>
#include <chrono>

namespace realmauth::internal {

std::int64_t getCurrentTimestamp() {
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

std::string createHeader() {
    nlohmann::json header;
    header["alg"] = JWT_ALGORITHM;
    header["typ"] = JWT_TYPE;
    return header.dump();
}

std::string signToken(const std::string& payload_json, const Keypair& key) {
    std::string signing_input =
        base64url_encode(createHeader()) + "." + base64url_encode(payload_json);

    std::span<const std::uint8_t> signing_bytes(
        reinterpret_cast<const std::uint8_t*>(signing_input.data()),
        signing_input.size()
    );

    auto signature = key.sign(signing_bytes);
    return signing_input + "." + base64url_encode(signature);
}

}
