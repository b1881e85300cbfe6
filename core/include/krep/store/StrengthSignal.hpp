#pragma once

#include "krep/domain/Types.hpp"

#include <optional>
#include <string>

namespace krep {

// Reads the JSON file another program drops after a strength workout:
//   {"last_session_at": "<RFC 3339>", "session_type": "lower"}
// Missing, unreadable or malformed -> nullopt. Never throws.
std::optional<ExternalStrengthSignal> loadExternalStrength(const std::string& path);

} // namespace krep
