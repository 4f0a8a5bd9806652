#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace arena::util {

/*
  Run ids are random RFC4122 v4 UUIDs rendered as lowercase strings.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// Fresh id for a replay run.
std::string NewRunId();

} // namespace arena::util
