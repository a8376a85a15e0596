#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace graphflow::util {

/*
  Random (RFC4122 v4) identifiers for executions, checkpoints, trace
  events, breakpoints and debug sessions.

  Ids never contain '.' or '_' so they can be embedded in state ids
  ("<execution>.<branch>_v<version>") without ambiguity.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// Prefixed id, e.g. "cp-1b4e28ba-2fa1-41d2-883f-0016d3cca427".
std::string NewId(const std::string& prefix = {});

} // namespace graphflow::util
