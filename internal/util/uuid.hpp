#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace snapshot::util {

/*
  UUID helpers

  Used to name staging folders and temporary export areas.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

} // namespace snapshot::util
