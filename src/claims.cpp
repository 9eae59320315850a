#include "realmauth/claims.hpp"
#include "realmauth/constants.hpp"
#include "realmauth/keypair.hpp"
#include "token_utils.hpp"
#include <nlohmann/json.hpp>

namespace realmauth {

std::string Claims::encode(const Keypair& key) const {
    using namespace internal;
    using json = nlohmann::json;

    validate();

    std::int64_t iat = (issuedAt_ == 0) ? getCurrentTimestamp() : issuedAt_;

    json payload = {
        {CLAIM_ISSUED_AT, iat},
        {claimKey(), accessPatterns()}
    };

    if (std::int64_t lifetime = expiresIn(); lifetime != 0) {
        payload[CLAIM_EXPIRES] = iat + lifetime;
    }

    return signToken(payload.dump(), key);
}

class AccessClaims::Impl {
public:
    explicit Impl(TokenType type) : type_(type) {}

    TokenType type_;
    std::vector<std::string> patterns_;
    std::int64_t expiresIn_ = DEFAULT_EXPIRY_SECONDS;
};

AccessClaims::AccessClaims(TokenType type)
    : impl_(std::make_unique<Impl>(type)) {}

AccessClaims::~AccessClaims() = default;
AccessClaims::AccessClaims(AccessClaims&&) noexcept = default;
AccessClaims& AccessClaims::operator=(AccessClaims&&) noexcept = default;

std::string AccessClaims::claimKey() const {
    return std::string(realmauth::claimKey(impl_->type_));
}

std::vector<std::string> AccessClaims::accessPatterns() const {
    if (impl_->patterns_.empty()) {
        return {WILDCARD_ACCESS_PATTERN};
    }
    return impl_->patterns_;
}

std::int64_t AccessClaims::expiresIn() const { return impl_->expiresIn_; }
TokenType AccessClaims::tokenType() const { return impl_->type_; }

void AccessClaims::setAccessPatterns(std::vector<std::string> patterns) {
    impl_->patterns_ = std::move(patterns);
}

void AccessClaims::addAccessPattern(const std::string& pattern) {
    impl_->patterns_.push_back(pattern);
}

void AccessClaims::setExpiresIn(std::int64_t seconds) { impl_->expiresIn_ = seconds; }

// Any offset and any pattern list is acceptable: a negative offset yields
// an already expired token, an empty pattern list means the wildcard.
void AccessClaims::validate() const {}

std::string PairingClaims::claimKey() const {
    return std::string(realmauth::claimKey(TokenType::Pairing));
}

std::vector<std::string> PairingClaims::accessPatterns() const {
    return {PAIRING_ACCESS_PATTERN};
}

std::int64_t PairingClaims::expiresIn() const { return PAIRING_TOKEN_EXPIRY_SECONDS; }

} // namespace realmauth
