#pragma once

#include "krep/domain/Catalog.hpp"
#include "krep/domain/Types.hpp"

#include <chrono>
#include <optional>

namespace krep {

constexpr std::chrono::hours STRENGTH_OVERRIDE_WINDOW{24};
constexpr std::chrono::hours VO2_RECENCY_LIMIT{4};

struct PrescribedMicrodose {
    MicrodoseDefinition definition;
    std::optional<int32_t> reps;
    std::optional<MovementStyle> style;
};

// Why a category was chosen. One value per rule, in evaluation order.
enum class CategoryReason : uint8_t {
    TARGET            = 0,  // caller asked for it
    STRENGTH_OVERRIDE = 1,  // lower-body strength session in the last 24h
    VO2_RECENCY       = 2,  // no VO2 entry, or the newest one is older than 4h
    ROTATION          = 3   // vo2 -> gtg -> mobility -> vo2 from the newest entry
};

struct CategoryDecision {
    MicrodoseCategory category;
    CategoryReason reason;
};

const char* toString(CategoryReason r) noexcept;

// First matching rule wins; ROTATION always matches.
CategoryDecision determineCategory(const Catalog& catalog, const UserContext& ctx);

// Throws PrescriptionError when the category has no definitions.
const MicrodoseDefinition& selectDefinition(const Catalog& catalog,
                                            const UserContext& ctx,
                                            MicrodoseCategory category);

struct Intensity {
    std::optional<int32_t> reps;
    std::optional<MovementStyle> style;
};

// Stored progression if any, else the first block's defaults.
Intensity computeIntensity(const MicrodoseDefinition& def, const UserContext& ctx);

// Pure: reads catalog and ctx, touches nothing else.
PrescribedMicrodose prescribeNext(const Catalog& catalog,
                                  const UserContext& ctx,
                                  std::optional<MicrodoseCategory> target = std::nullopt);

} // namespace krep
