#pragma once

#include <string>
#include <cstdint>

namespace realmauth {
class Keypair;
}

namespace realmauth::internal {

/// Get current Unix timestamp in seconds (UTC)
/// @return Unix timestamp (seconds since epoch)
std::int64_t getCurrentTimestamp();

/// Create JWT header as JSON string
/// @return JSON string: {"alg":"RS256","typ":"JWT"}
std::string createHeader();

/// Assemble and sign a compact JWS
/// @param payload_json Serialized claim set
/// @param key Signing key
/// @return "header.payload.signature", each part Base64 URL encoded
std::string signToken(const std::string& payload_json, const Keypair& key);

}
