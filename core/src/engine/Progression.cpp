#include "krep/engine/Progression.hpp"
#include "krep/infra/Log.hpp"

#include <algorithm>

namespace krep {

static void bump(ProgressionState& state, Timestamp now) {
    state.level += 1;
    state.last_upgraded = now;
}

bool upgradeBurpee(ProgressionState& state, int32_t rep_ceiling, Timestamp now) {
    if (state.reps < rep_ceiling) {
        state.reps += 1;
        bump(state, now);
        KREP_LOG_DEBUG("PROGRESS", "burpee reps -> " << state.reps);
        return true;
    }

    if (state.style.kind != MovementStyle::Kind::BURPEE) {
        state.style = MovementStyle::ofBurpee(BurpeeStyle::FOUR_COUNT);
        state.reps = FOUR_COUNT_START_REPS;
        bump(state, now);
        KREP_LOG_WARN("PROGRESS", "burpee progression had a non-burpee style, reset to four_count");
        return true;
    }

    switch (state.style.burpee) {
        case BurpeeStyle::FOUR_COUNT:
            state.style = MovementStyle::ofBurpee(BurpeeStyle::SIX_COUNT);
            state.reps = SIX_COUNT_START_REPS;
            break;
        case BurpeeStyle::SIX_COUNT:
            state.style = MovementStyle::ofBurpee(BurpeeStyle::SIX_COUNT_TWO_PUMP);
            state.reps = TWO_PUMP_START_REPS;
            break;
        case BurpeeStyle::SIX_COUNT_TWO_PUMP:
            state.style = MovementStyle::ofBurpee(BurpeeStyle::SEAL);
            state.reps = SEAL_START_REPS;
            break;
        case BurpeeStyle::SEAL:
            state.reps = rep_ceiling;
            KREP_LOG_DEBUG("PROGRESS", "burpee already at seal @ " << rep_ceiling);
            return false;
    }

    bump(state, now);
    KREP_LOG_DEBUG("PROGRESS", "burpee style -> " << toString(state.style.burpee)
                   << ", reps -> " << state.reps);
    return true;
}

bool upgradeKbSwing(ProgressionState& state, int32_t base_reps, int32_t max_reps,
                    Timestamp now) {
    if (state.reps >= max_reps) {
        KREP_LOG_DEBUG("PROGRESS", "kb swing already at max " << max_reps);
        return false;
    }
    state.reps = std::min<int32_t>(base_reps + static_cast<int32_t>(state.level) + 1, max_reps);
    bump(state, now);
    KREP_LOG_DEBUG("PROGRESS", "kb swing reps -> " << state.reps);
    return true;
}

bool upgradePullup(ProgressionState& state, int32_t max_reps, Timestamp now) {
    if (state.reps >= max_reps) {
        KREP_LOG_DEBUG("PROGRESS", "pullup already at max " << max_reps);
        return false;
    }
    state.reps += 1;
    bump(state, now);
    KREP_LOG_DEBUG("PROGRESS", "pullup reps -> " << state.reps);
    return true;
}

static const MetricSpec* firstRepsMetric(const MicrodoseBlock& block) {
    for (const auto& m : block.metrics) {
        if (m.type == MetricSpec::Type::REPS) return &m;
    }
    return nullptr;
}

ProgressionState initialProgression(const MicrodoseDefinition& def) {
    ProgressionState p;
    if (def.blocks.empty()) return p;

    const auto& block = def.blocks.front();
    if (const auto* reps = firstRepsMetric(block)) {
        p.reps = reps->default_reps;
    }
    p.style = block.movement_style;
    return p;
}

bool increaseIntensity(const Catalog& catalog,
                       const std::string& definition_id,
                       UserMicrodoseState& user_state,
                       const ProgressionConfig& cfg,
                       Timestamp now) {
    const auto* def = catalog.findDefinition(definition_id);
    if (!def || def->blocks.empty()) {
        KREP_LOG_WARN("PROGRESS", "unknown definition for progression: " << definition_id);
        return false;
    }

    const auto& block = def->blocks.front();
    const auto* movement = catalog.findMovement(block.movement_id);
    if (!movement) {
        KREP_LOG_WARN("PROGRESS", definition_id << " uses unknown movement " << block.movement_id);
        return false;
    }
    if (movement->kind == MovementKind::MOBILITY_DRILL) {
        KREP_LOG_INFO("PROGRESS", definition_id << " is a mobility drill, nothing to progress");
        return false;
    }

    auto it = user_state.progressions.find(definition_id);
    if (it == user_state.progressions.end()) {
        it = user_state.progressions.emplace(definition_id, initialProgression(*def)).first;
    }
    ProgressionState& state = it->second;

    bool changed = false;
    switch (movement->kind) {
        case MovementKind::BURPEE:
            changed = upgradeBurpee(state, cfg.burpee_rep_ceiling, now);
            break;
        case MovementKind::KETTLEBELL_SWING: {
            const auto* reps = firstRepsMetric(block);
            changed = upgradeKbSwing(state, reps ? reps->default_reps : state.reps,
                                     cfg.kb_swing_max_reps, now);
            break;
        }
        case MovementKind::PULLUP:
            changed = upgradePullup(state, cfg.pullup_max_reps, now);
            break;
        case MovementKind::MOBILITY_DRILL:
            break;
    }

    KREP_LOG_INFO("PROGRESS", definition_id << ": level " << state.level
                  << ", " << state.reps << " reps" << (changed ? "" : " (at maximum)"));
    return changed;
}

} // namespace krep
