#pragma once
#include <cstddef>
#include <cstdint>

namespace realmauth {

// JWT header algorithm
inline constexpr const char* JWT_ALGORITHM = "RS256";

// JWT type
inline constexpr const char* JWT_TYPE = "JWT";

// Modulus size of generated realm keys
inline constexpr int RSA_KEY_BITS = 4096;

// Expiry offset used when none is given (seconds, 0 = never expires)
inline constexpr std::int64_t DEFAULT_EXPIRY_SECONDS = 300;

// Fixed lifetime of the pairing authentication token
inline constexpr std::int64_t PAIRING_TOKEN_EXPIRY_SECONDS = 300;

// Unrestricted access to every resource of an API family
inline constexpr const char* WILDCARD_ACCESS_PATTERN = ".*::.*";

// Any resource in any realm, used by the pairing authentication token
inline constexpr const char* PAIRING_ACCESS_PATTERN = "^.*$::^.*$";

// Registered claim names
inline constexpr const char* CLAIM_ISSUED_AT = "iat";
inline constexpr const char* CLAIM_EXPIRES = "exp";

// Raw size of a device identifier (UUID)
inline constexpr std::size_t DEVICE_ID_BYTES = 16;

// Output file suffixes: <realm>_private.pem, <realm>_public.pem
inline constexpr const char* PRIVATE_KEY_SUFFIX = "_private.pem";
inline constexpr const char* PUBLIC_KEY_SUFFIX = "_public.pem";

} // namespace realmauth
