#include "openssl_utils.hpp"
#include <openssl/err.h>
#include <openssl/rand.h>
#include <climits>

namespace realmauth::internal {

CryptoError opensslError(const std::string& what) {
    std::string message = what;
    bool first = true;
    while (unsigned long code = ERR_get_error()) {
        char buf[256];
        ERR_error_string_n(code, buf, sizeof(buf));
        message += first ? ": " : "; ";
        message += buf;
        first = false;
    }
    return CryptoError(message);
}

void secureRandomBytes(std::span<std::uint8_t> out) {
    if (out.empty()) {
        return;
    }
    if (out.size() > static_cast<std::size_t>(INT_MAX)) {
        throw CryptoError("Random request too large");
    }
    if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
        throw opensslError("Secure random source failed");
    }
}

std::string bioToString(BIO* bio) {
    char* data = nullptr;
    long len = BIO_get_mem_data(bio, &data);
    if (len <= 0 || data == nullptr) {
        return {};
    }
    return std::string(data, static_cast<std::size_t>(len));
}

} // namespace realmauth::internal
