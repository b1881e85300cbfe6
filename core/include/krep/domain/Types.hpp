#pragma once

#include "krep/infra/WallClock.hpp"

#include <boost/uuid/uuid.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace krep {

using infra::Timestamp;

// ---------------------------------------------------------------------------
// Movements
// ---------------------------------------------------------------------------
enum class MovementKind : uint8_t {
    KETTLEBELL_SWING = 0,
    BURPEE           = 1,
    PULLUP           = 2,
    MOBILITY_DRILL   = 3
};

enum class BurpeeStyle : uint8_t {
    FOUR_COUNT          = 0,
    SIX_COUNT           = 1,
    SIX_COUNT_TWO_PUMP  = 2,
    SEAL                = 3
};

struct MovementStyle {
    enum class Kind : uint8_t {
        NONE   = 0,
        BURPEE = 1,
        BAND   = 2
    };

    Kind kind = Kind::NONE;
    BurpeeStyle burpee = BurpeeStyle::FOUR_COUNT;  // valid when kind == BURPEE
    std::optional<std::string> band_colour;        // kind == BAND; nullopt = no band

    static MovementStyle none() { return {}; }

    static MovementStyle ofBurpee(BurpeeStyle s) {
        MovementStyle m;
        m.kind = Kind::BURPEE;
        m.burpee = s;
        return m;
    }

    static MovementStyle ofBand(std::optional<std::string> colour) {
        MovementStyle m;
        m.kind = Kind::BAND;
        m.band_colour = std::move(colour);
        return m;
    }

    bool operator==(const MovementStyle& o) const {
        if (kind != o.kind) return false;
        if (kind == Kind::BURPEE) return burpee == o.burpee;
        if (kind == Kind::BAND) return band_colour == o.band_colour;
        return true;
    }
    bool operator!=(const MovementStyle& o) const { return !(*this == o); }
};

struct Movement {
    std::string id;
    std::string name;
    MovementKind kind = MovementKind::MOBILITY_DRILL;
    MovementStyle default_style;
    std::vector<std::string> tags;
    std::optional<std::string> reference_url;
};

// ---------------------------------------------------------------------------
// Metrics: a repetition range or a band selection.
// ---------------------------------------------------------------------------
struct MetricSpec {
    enum class Type : uint8_t {
        REPS = 0,
        BAND = 1
    };

    Type type = Type::REPS;
    std::string key;
    bool progressable = false;

    // REPS
    int32_t default_reps = 0;
    int32_t min = 0;
    int32_t max = 0;
    int32_t step = 1;

    // BAND
    std::string default_band;

    static MetricSpec reps(std::string key, int32_t def, int32_t min, int32_t max,
                           int32_t step, bool progressable) {
        MetricSpec m;
        m.type = Type::REPS;
        m.key = std::move(key);
        m.default_reps = def;
        m.min = min;
        m.max = max;
        m.step = step;
        m.progressable = progressable;
        return m;
    }

    static MetricSpec band(std::string key, std::string def, bool progressable) {
        MetricSpec m;
        m.type = Type::BAND;
        m.key = std::move(key);
        m.default_band = std::move(def);
        m.progressable = progressable;
        return m;
    }

    bool operator==(const MetricSpec& o) const {
        if (type != o.type || key != o.key || progressable != o.progressable) return false;
        if (type == Type::REPS) {
            return default_reps == o.default_reps && min == o.min &&
                   max == o.max && step == o.step;
        }
        return default_band == o.default_band;
    }
    bool operator!=(const MetricSpec& o) const { return !(*this == o); }
};

// ---------------------------------------------------------------------------
// Microdose definitions
// ---------------------------------------------------------------------------
enum class MicrodoseCategory : uint8_t {
    VO2      = 0,
    GTG      = 1,
    MOBILITY = 2
};

struct MicrodoseBlock {
    std::string movement_id;
    MovementStyle movement_style;
    uint32_t duration_hint_seconds = 0;
    std::vector<MetricSpec> metrics;
};

struct MicrodoseDefinition {
    std::string id;
    std::string name;
    MicrodoseCategory category = MicrodoseCategory::VO2;
    uint32_t suggested_duration_seconds = 0;
    bool gtg_friendly = false;
    std::vector<MicrodoseBlock> blocks;
    std::optional<std::string> reference_url;
};

// ---------------------------------------------------------------------------
// Sessions
// ---------------------------------------------------------------------------
struct Session {
    boost::uuids::uuid id{};
    std::string definition_id;
    Timestamp performed_at{};
    std::optional<Timestamp> started_at;
    std::optional<Timestamp> completed_at;
    std::optional<uint32_t> actual_duration_seconds;
    std::vector<MetricSpec> metrics_realized;
    std::optional<uint8_t> perceived_rpe;
    std::optional<uint8_t> avg_hr;
    std::optional<uint8_t> max_hr;

    bool operator==(const Session& o) const;
    bool operator!=(const Session& o) const { return !(*this == o); }
};

// A prescription the user declined. Lives only in memory; no store accepts it.
struct ShownButSkipped {
    std::string definition_id;
    Timestamp shown_at{};
};

using SessionKind = std::variant<Session, ShownButSkipped>;

const std::string& definitionIdOf(const SessionKind& s);
Timestamp timestampOf(const SessionKind& s);
const Session* asReal(const SessionKind& s);

// New random (v4) session id.
boost::uuids::uuid newSessionId();
std::string toString(const boost::uuids::uuid& id);
std::optional<boost::uuids::uuid> parseUuid(const std::string& text);

// ---------------------------------------------------------------------------
// Progression
// ---------------------------------------------------------------------------
struct ProgressionState {
    int32_t reps = 0;
    MovementStyle style;
    uint32_t level = 0;
    std::optional<Timestamp> last_upgraded;

    bool operator==(const ProgressionState& o) const {
        return reps == o.reps && style == o.style && level == o.level &&
               last_upgraded == o.last_upgraded;
    }
};

struct UserMicrodoseState {
    std::unordered_map<std::string, ProgressionState> progressions;
    std::optional<std::string> last_mobility_def_id;

    bool operator==(const UserMicrodoseState& o) const {
        return progressions == o.progressions &&
               last_mobility_def_id == o.last_mobility_def_id;
    }
};

// ---------------------------------------------------------------------------
// External strength signal (written by another program, read-only here)
// ---------------------------------------------------------------------------
struct StrengthSessionType {
    enum class Kind : uint8_t {
        LOWER = 0,
        UPPER = 1,
        FULL  = 2,
        OTHER = 3
    };

    Kind kind = Kind::OTHER;
    std::string other;  // only for OTHER

    static StrengthSessionType lower() { return {Kind::LOWER, {}}; }
    static StrengthSessionType upper() { return {Kind::UPPER, {}}; }
    static StrengthSessionType full()  { return {Kind::FULL, {}}; }
    static StrengthSessionType otherOf(std::string s) { return {Kind::OTHER, std::move(s)}; }

    bool operator==(const StrengthSessionType& o) const {
        return kind == o.kind && (kind != Kind::OTHER || other == o.other);
    }
};

struct ExternalStrengthSignal {
    Timestamp last_session_at{};
    StrengthSessionType session_type;
};

// Everything the prescription engine looks at for one decision.
struct UserContext {
    Timestamp now{};
    UserMicrodoseState user_state;
    std::vector<SessionKind> recent_sessions;  // newest first
    std::optional<ExternalStrengthSignal> external_strength;
    std::vector<std::string> equipment_available;
};

// ---------------------------------------------------------------------------
// Text forms used by the stores and the CLI.
// ---------------------------------------------------------------------------
const char* toString(MovementKind k) noexcept;
const char* toString(BurpeeStyle s) noexcept;
const char* toString(MicrodoseCategory c) noexcept;

std::optional<MovementKind> parseMovementKind(const std::string& s);
std::optional<BurpeeStyle> parseBurpeeStyle(const std::string& s);
// Case-insensitive: vo2, gtg, mobility.
std::optional<MicrodoseCategory> parseCategory(const std::string& s);
// lower / upper / full|full_body|fullbody / anything else -> OTHER(lowercased).
StrengthSessionType parseStrengthSessionType(const std::string& s);

std::string describe(const MovementStyle& s);

} // namespace krep
