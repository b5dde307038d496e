#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace reservation::util {

/*
  UUID helpers

  Reservation ids are the canonical 36-character form of a random
  RFC4122 version 4 UUID.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// Shorthand for ToString(GenerateUUID()).
std::string NewId();

} // namespace reservation::util
