#include "realmauth/token_minter.hpp"
#include "realmauth/claims.hpp"
#include "realmauth/keypair.hpp"
#include <stdexcept>

namespace realmauth {

std::string mintToken(std::string_view type,
                      std::string_view privateKeyPem,
                      const std::vector<std::string>& accessPatterns,
                      std::int64_t expirySeconds) {
    // Reject unknown types before any cryptographic work
    TokenType tokenType = parseTokenType(type);

    auto key = Keypair::fromPrivateKeyPem(privateKeyPem);
    return mintToken(tokenType, key, accessPatterns, expirySeconds);
}

std::string mintToken(TokenType type,
                      const Keypair& key,
                      const std::vector<std::string>& accessPatterns,
                      std::int64_t expirySeconds) {
    AccessClaims claims(type);
    claims.setAccessPatterns(accessPatterns);
    claims.setExpiresIn(expirySeconds);
    return claims.encode(key);
}

std::string mintPairingToken(const Keypair& key) {
    return PairingClaims{}.encode(key);
}

std::string mintPairingToken(const std::string& realmName,
                             const std::filesystem::path& privateKeyPath) {
    if (privateKeyPath.empty()) {
        throw std::invalid_argument("realm key is required");
    }
    if (realmName.empty()) {
        throw std::invalid_argument("realm name is required");
    }

    auto key = Keypair::fromPrivateKeyFile(privateKeyPath);
    return mintPairingToken(key);
}

} // namespace realmauth
