#include "krep/engine/Prescriber.hpp"
#include "krep/store/History.hpp"
#include "krep/core/Error.hpp"
#include "krep/infra/Log.hpp"

namespace krep {

const char* toString(CategoryReason r) noexcept {
    switch (r) {
        case CategoryReason::TARGET:            return "target";
        case CategoryReason::STRENGTH_OVERRIDE: return "strength_override";
        case CategoryReason::VO2_RECENCY:       return "vo2_recency";
        case CategoryReason::ROTATION:          return "rotation";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// Category rules
// ---------------------------------------------------------------------------
using CategoryGuard = std::optional<MicrodoseCategory> (*)(const Catalog&, const UserContext&);

struct CategoryRule {
    CategoryReason reason;
    CategoryGuard guard;
};

static std::optional<MicrodoseCategory> strengthOverride(const Catalog&, const UserContext& ctx) {
    if (!ctx.external_strength) return std::nullopt;

    const auto& sig = *ctx.external_strength;
    const auto age = ctx.now - sig.last_session_at;
    if (sig.session_type.kind == StrengthSessionType::Kind::LOWER &&
        age < STRENGTH_OVERRIDE_WINDOW) {
        KREP_LOG_INFO("ENGINE", "lower-body strength "
                      << std::chrono::duration_cast<std::chrono::hours>(age).count()
                      << "h ago, prescribing gtg");
        return MicrodoseCategory::GTG;
    }
    return std::nullopt;
}

static std::optional<MicrodoseCategory> vo2Recency(const Catalog& catalog, const UserContext& ctx) {
    const SessionKind* last = findLastByCategory(catalog, ctx.recent_sessions,
                                                 MicrodoseCategory::VO2);
    if (!last) {
        KREP_LOG_INFO("ENGINE", "no recent vo2 session, prescribing vo2");
        return MicrodoseCategory::VO2;
    }

    const auto age = ctx.now - timestampOf(*last);
    if (age > VO2_RECENCY_LIMIT) {
        KREP_LOG_INFO("ENGINE", "last vo2 "
                      << std::chrono::duration_cast<std::chrono::hours>(age).count()
                      << "h ago, prescribing vo2");
        return MicrodoseCategory::VO2;
    }
    return std::nullopt;
}

static std::optional<MicrodoseCategory> rotation(const Catalog& catalog, const UserContext& ctx) {
    std::optional<MicrodoseCategory> last;
    if (!ctx.recent_sessions.empty()) {
        last = inferCategory(catalog, definitionIdOf(ctx.recent_sessions.front()));
    }

    MicrodoseCategory next = MicrodoseCategory::VO2;
    if (last) {
        switch (*last) {
            case MicrodoseCategory::VO2:      next = MicrodoseCategory::GTG; break;
            case MicrodoseCategory::GTG:      next = MicrodoseCategory::MOBILITY; break;
            case MicrodoseCategory::MOBILITY: next = MicrodoseCategory::VO2; break;
        }
    }
    KREP_LOG_INFO("ENGINE", "rotation -> " << toString(next));
    return next;
}

static const CategoryRule CATEGORY_RULES[] = {
    {CategoryReason::STRENGTH_OVERRIDE, strengthOverride},
    {CategoryReason::VO2_RECENCY,       vo2Recency},
    {CategoryReason::ROTATION,          rotation},
};

CategoryDecision determineCategory(const Catalog& catalog, const UserContext& ctx) {
    for (const auto& rule : CATEGORY_RULES) {
        if (auto c = rule.guard(catalog, ctx)) {
            return {*c, rule.reason};
        }
    }
    return {MicrodoseCategory::VO2, CategoryReason::ROTATION};
}

// ---------------------------------------------------------------------------
// Definition selection
// ---------------------------------------------------------------------------
const MicrodoseDefinition& selectDefinition(const Catalog& catalog,
                                            const UserContext& ctx,
                                            MicrodoseCategory category) {
    const auto candidates = catalog.definitionsIn(category);
    if (candidates.empty()) {
        throw PrescriptionError(std::string("no microdoses in category ") + toString(category));
    }

    switch (category) {
        case MicrodoseCategory::VO2: {
            const SessionKind* last = findLastByCategory(catalog, ctx.recent_sessions,
                                                         MicrodoseCategory::VO2);
            if (!last) return *candidates.front();
            const std::string& last_id = definitionIdOf(*last);
            for (const auto* d : candidates) {
                if (d->id != last_id) return *d;
            }
            return *candidates.front();
        }

        case MicrodoseCategory::GTG:
            return *candidates.front();

        case MicrodoseCategory::MOBILITY: {
            const auto& cursor = ctx.user_state.last_mobility_def_id;
            if (!cursor) return *candidates.front();
            for (size_t i = 0; i < candidates.size(); ++i) {
                if (candidates[i]->id == *cursor) {
                    return *candidates[(i + 1) % candidates.size()];
                }
            }
            return *candidates.front();
        }
    }
    return *candidates.front();
}

Intensity computeIntensity(const MicrodoseDefinition& def, const UserContext& ctx) {
    auto it = ctx.user_state.progressions.find(def.id);
    if (it != ctx.user_state.progressions.end()) {
        return {it->second.reps, it->second.style};
    }

    Intensity out;
    if (def.blocks.empty()) return out;

    const auto& block = def.blocks.front();
    for (const auto& m : block.metrics) {
        if (m.type == MetricSpec::Type::REPS) {
            out.reps = m.default_reps;
            break;
        }
    }
    out.style = block.movement_style;
    return out;
}

PrescribedMicrodose prescribeNext(const Catalog& catalog,
                                  const UserContext& ctx,
                                  std::optional<MicrodoseCategory> target) {
    CategoryDecision decision = target
        ? CategoryDecision{*target, CategoryReason::TARGET}
        : determineCategory(catalog, ctx);

    const MicrodoseDefinition& def = selectDefinition(catalog, ctx, decision.category);
    Intensity intensity = computeIntensity(def, ctx);

    KREP_LOG_DEBUG("ENGINE", "prescribed " << def.id << " (" << toString(decision.category)
                   << ", " << toString(decision.reason) << ")");
    return {def, intensity.reps, intensity.style};
}

} // namespace krep
