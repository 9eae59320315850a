#include "realmauth/token_type.hpp"
#include "realmauth/errors.hpp"

namespace realmauth {

namespace {
    struct TaxonomyEntry {
        TokenType type;
        std::string_view name;
        std::string_view claimKey;
    };

    // Stable external contract: extend, never renumber
    constexpr std::array<TaxonomyEntry, ALL_TOKEN_TYPES.size()> taxonomy = {{
        {TokenType::Housekeeping, "housekeeping", "a_ha"},
        {TokenType::RealmManagement, "realm-management", "a_rma"},
        {TokenType::Pairing, "pairing", "a_pa"},
        {TokenType::AppEngine, "appengine", "a_aea"},
        {TokenType::Channels, "channels", "a_ch"},
    }};

    const TaxonomyEntry& entryFor(TokenType type) {
        for (const auto& entry : taxonomy) {
            if (entry.type == type) {
                return entry;
            }
        }
        throw std::invalid_argument("Unknown token type value: " +
                                    std::to_string(static_cast<int>(type)));
    }
}

InvalidTokenType::InvalidTokenType(const std::string& given)
    : std::invalid_argument("Invalid type. Valid types are: " + validTokenTypeNames()),
      given_(given) {}

std::string_view tokenTypeName(TokenType type) {
    return entryFor(type).name;
}

std::string_view claimKey(TokenType type) {
    return entryFor(type).claimKey;
}

TokenType parseTokenType(std::string_view name) {
    for (const auto& entry : taxonomy) {
        if (entry.name == name) {
            return entry.type;
        }
    }
    throw InvalidTokenType(std::string(name));
}

std::string validTokenTypeNames() {
    std::string names;
    for (const auto& entry : taxonomy) {
        if (!names.empty()) {
            names += ", ";
        }
        names += entry.name;
    }
    return names;
}

} // namespace realmauth
