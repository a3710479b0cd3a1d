#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace stagesync::util {

/*
  UUID helpers

  Queue entries, recovery operations and conflict notices are keyed by a
  random RFC4122 v4 UUID rendered as text.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// "<prefix>-<uuid>"
std::string NewId(const std::string& prefix);

} // namespace stagesync::util
