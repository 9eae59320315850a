#pragma once
#include "realmauth/constants.hpp"
#include "realmauth/token_type.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace realmauth {

class Keypair;

/**
 * Mint an access token for one API family.
 * @param type Token type name ("housekeeping", "realm-management", ...)
 * @param privateKeyPem RSA private key, PKCS#1 or PKCS#8 PEM
 * @param accessPatterns Patterns to grant, empty means WILDCARD_ACCESS_PATTERN
 * @param expirySeconds Offset of "exp" from "iat" in seconds, 0 means no "exp" claim
 * @return Compact RS256 JWT
 * @throws InvalidTokenType before the key is parsed if type is unknown
 * @throws CryptoError if the key cannot be parsed or signing fails
 */
[[nodiscard]] std::string mintToken(std::string_view type,
                                    std::string_view privateKeyPem,
                                    const std::vector<std::string>& accessPatterns = {},
                                    std::int64_t expirySeconds = DEFAULT_EXPIRY_SECONDS);

/// Mint an access token with an already parsed key
[[nodiscard]] std::string mintToken(TokenType type,
                                    const Keypair& key,
                                    const std::vector<std::string>& accessPatterns = {},
                                    std::int64_t expirySeconds = DEFAULT_EXPIRY_SECONDS);

/// Mint the short lived token used to authenticate pairing operations
[[nodiscard]] std::string mintPairingToken(const Keypair& key);

/**
 * Mint the pairing authentication token for a realm.
 * @throws std::invalid_argument if realmName or privateKeyPath is empty
 * @throws std::runtime_error if the key file cannot be read
 * @throws CryptoError if the key cannot be parsed or signing fails
 */
[[nodiscard]] std::string mintPairingToken(const std::string& realmName,
                                           const std::filesystem::path& privateKeyPath);

} // namespace realmauth
