#pragma once
#include <stdexcept>
#include <string>

namespace realmauth {

/// Raised when an OpenSSL operation fails (random source, key generation,
/// key parsing, PEM encoding, signing). The message carries the OpenSSL
/// error queue.
class CryptoError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Raised for a token type name outside the claim taxonomy
class InvalidTokenType : public std::invalid_argument {
public:
    explicit InvalidTokenType(const std::string& given);

    [[nodiscard]] const std::string& given() const noexcept { return given_; }

private:
    std::string given_;
};

} // namespace realmauth
