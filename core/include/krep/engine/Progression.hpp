#pragma once

#include "krep/config/Config.hpp"
#include "krep/domain/Catalog.hpp"
#include "krep/domain/Types.hpp"

namespace krep {

// Burpee ladder: four_count -> six_count -> six_count_two_pump -> seal, with
// the reps each style restarts at.
constexpr int32_t SIX_COUNT_START_REPS = 6;
constexpr int32_t TWO_PUMP_START_REPS  = 5;
constexpr int32_t SEAL_START_REPS      = 4;
constexpr int32_t FOUR_COUNT_START_REPS = 3;

// Each rule returns true when it changed the state. A change always bumps
// level by one and stamps last_upgraded = now; a false return leaves level
// and last_upgraded alone.

// Reps + 1 below ceiling; at ceiling, next style with its start reps. Seal at
// the ceiling is the top of the ladder: reps are clamped to the ceiling.
bool upgradeBurpee(ProgressionState& state, int32_t rep_ceiling, Timestamp now);

// reps = min(base + level + 1, max_reps).
bool upgradeKbSwing(ProgressionState& state, int32_t base_reps, int32_t max_reps,
                    Timestamp now);

// Reps + 1 up to max_reps. The band is only ever changed by hand.
bool upgradePullup(ProgressionState& state, int32_t max_reps, Timestamp now);

// Starting point for a definition that has no progression entry yet: the
// first block's default reps and style.
ProgressionState initialProgression(const MicrodoseDefinition& def);

// "Harder next time" for one definition. The rule is picked from the movement
// kind of the definition's first block. Unknown definitions and mobility
// drills are left alone (false, nothing inserted).
bool increaseIntensity(const Catalog& catalog,
                       const std::string& definition_id,
                       UserMicrodoseState& user_state,
                       const ProgressionConfig& cfg,
                       Timestamp now);

} // namespace krep
