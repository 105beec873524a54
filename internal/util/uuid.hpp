#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace geocache::util {

/*
  UUID helpers

  Pipeline run ids are random RFC4122 version 4 UUIDs in string form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

inline std::string GenerateRunId() {
  return ToString(GenerateUUID());
}

} // namespace geocache::util
