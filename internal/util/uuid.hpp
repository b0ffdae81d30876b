#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace flowstore::util {

/*
  UUID helpers

  Raw 16 byte RFC4122 version 4 UUID, used to name temp files.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

} // namespace flowstore::util
