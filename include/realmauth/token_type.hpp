#pragma once
#include <array>
#include <string>
#include <string_view>

namespace realmauth {

/// API families a token can be minted for
enum class TokenType {
    Housekeeping,
    RealmManagement,
    Pairing,
    AppEngine,
    Channels
};

/// Every token type, in the order they are listed to users
inline constexpr std::array<TokenType, 5> ALL_TOKEN_TYPES = {
    TokenType::Housekeeping,
    TokenType::RealmManagement,
    TokenType::Pairing,
    TokenType::AppEngine,
    TokenType::Channels
};

/// Name used on the command line (e.g. "realm-management")
[[nodiscard]] std::string_view tokenTypeName(TokenType type);

/// Claim key carrying the access patterns (e.g. "a_rma")
[[nodiscard]] std::string_view claimKey(TokenType type);

/// Look up a token type by name
/// @throws InvalidTokenType if the name is not part of the taxonomy
[[nodiscard]] TokenType parseTokenType(std::string_view name);

/// Comma separated list of valid names: "housekeeping, realm-management, ..."
[[nodiscard]] std::string validTokenTypeNames();

} // namespace realmauth
