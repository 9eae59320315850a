#include "realmauth/device_id.hpp"
#include "base64url.hpp"
#include "openssl_utils.hpp"

namespace realmauth {

std::array<std::uint8_t, DEVICE_ID_BYTES> generateUuidV4() {
    std::array<std::uint8_t, DEVICE_ID_BYTES> uuid{};
    internal::secureRandomBytes(uuid);

    // RFC 4122: version 4 in the high nibble of byte 6, variant 10xx in byte 8
    uuid[6] = static_cast<std::uint8_t>((uuid[6] & 0x0F) | 0x40);
    uuid[8] = static_cast<std::uint8_t>((uuid[8] & 0x3F) | 0x80);
    return uuid;
}

std::string generateDeviceId() {
    auto uuid = generateUuidV4();
    return internal::base64url_encode(uuid);
}

} // namespace realmauth
