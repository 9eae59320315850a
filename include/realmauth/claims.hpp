#pragma once
#include "realmauth/token_type.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace realmauth {

class Keypair;

/// Base class for access token claim sets.
///
/// Subclasses decide which claim key is populated, with which access
/// patterns and for how long. encode() is shared: it builds the payload
/// {iat, <claimKey>: [patterns], exp?} and signs it RS256.
class Claims {
public:
    virtual ~Claims() = default;

    /// Claim key carrying the access patterns
    [[nodiscard]] virtual std::string claimKey() const = 0;

    /// Access patterns written under claimKey()
    [[nodiscard]] virtual std::vector<std::string> accessPatterns() const = 0;

    /// Lifetime in seconds, 0 = the token never expires
    [[nodiscard]] virtual std::int64_t expiresIn() const = 0;

    /// Check the claim set before encoding
    virtual void validate() const = 0;

    /// Pinned issued-at timestamp (Unix seconds, 0 = current time at encode)
    [[nodiscard]] std::int64_t issuedAt() const { return issuedAt_; }
    void setIssuedAt(std::int64_t iat) { issuedAt_ = iat; }

    /// Encode the claims to a compact JWT signed with the given key
    [[nodiscard]] std::string encode(const Keypair& key) const;

private:
    std::int64_t issuedAt_ = 0;
};

/// General purpose claims for one API family
class AccessClaims : public Claims {
public:
    explicit AccessClaims(TokenType type);
    ~AccessClaims() override;

    AccessClaims(AccessClaims&&) noexcept;
    AccessClaims& operator=(AccessClaims&&) noexcept;

    // Claims interface
    [[nodiscard]] std::string claimKey() const override;
    [[nodiscard]] std::vector<std::string> accessPatterns() const override;
    [[nodiscard]] std::int64_t expiresIn() const override;
    void validate() const override;

    [[nodiscard]] TokenType tokenType() const;

    /// Replace the access patterns. An empty list means WILDCARD_ACCESS_PATTERN.
    void setAccessPatterns(std::vector<std::string> patterns);
    void addAccessPattern(const std::string& pattern);

    /// Lifetime in seconds (default DEFAULT_EXPIRY_SECONDS, 0 = never)
    void setExpiresIn(std::int64_t seconds);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/// Fixed policy used to authenticate against the pairing API:
/// PAIRING_ACCESS_PATTERN, PAIRING_TOKEN_EXPIRY_SECONDS
class PairingClaims : public Claims {
public:
    [[nodiscard]] std::string claimKey() const override;
    [[nodiscard]] std::vector<std::string> accessPatterns() const override;
    [[nodiscard]] std::int64_t expiresIn() const override;
    void validate() const override {}
};

} // namespace realmauth
