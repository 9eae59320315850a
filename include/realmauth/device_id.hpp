#pragma once
#include "realmauth/constants.hpp"
#include <array>
#include <cstdint>
#include <string>

namespace realmauth {

/// 16 random bytes laid out as a version 4 UUID
/// @throws CryptoError if the random source fails
[[nodiscard]] std::array<std::uint8_t, DEVICE_ID_BYTES> generateUuidV4();

/// Device identifier: unpadded base64url of a random UUIDv4 (22 chars)
[[nodiscard]] std::string generateDeviceId();

} // namespace realmauth
