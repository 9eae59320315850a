#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <span>
#include <cstdint>

namespace realmauth::internal {

/// Encode bytes to unpadded Base64 URL (RFC 4648 section 5)
std::string base64url_encode(std::span<const std::uint8_t> data);

/// Encode the bytes of a string to unpadded Base64 URL
std::string base64url_encode(std::string_view text);

/// Decode unpadded Base64 URL. Trailing '=' padding is tolerated.
/// @throws std::invalid_argument on characters outside the URL alphabet
///         or an impossible length
std::vector<std::uint8_t> base64url_decode(std::string_view input);

} // namespace realmauth::internal
