#include "krep/domain/Types.hpp"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace krep {

bool Session::operator==(const Session& o) const {
    return id == o.id &&
           definition_id == o.definition_id &&
           performed_at == o.performed_at &&
           started_at == o.started_at &&
           completed_at == o.completed_at &&
           actual_duration_seconds == o.actual_duration_seconds &&
           metrics_realized == o.metrics_realized &&
           perceived_rpe == o.perceived_rpe &&
           avg_hr == o.avg_hr &&
           max_hr == o.max_hr;
}

const std::string& definitionIdOf(const SessionKind& s) {
    if (const auto* real = std::get_if<Session>(&s)) {
        return real->definition_id;
    }
    return std::get<ShownButSkipped>(s).definition_id;
}

Timestamp timestampOf(const SessionKind& s) {
    if (const auto* real = std::get_if<Session>(&s)) {
        return real->performed_at;
    }
    return std::get<ShownButSkipped>(s).shown_at;
}

const Session* asReal(const SessionKind& s) {
    return std::get_if<Session>(&s);
}

boost::uuids::uuid newSessionId() {
    thread_local boost::uuids::random_generator gen;
    return gen();
}

std::string toString(const boost::uuids::uuid& id) {
    return boost::uuids::to_string(id);
}

std::optional<boost::uuids::uuid> parseUuid(const std::string& text) {
    if (text.size() != 36) return std::nullopt;
    try {
        return boost::uuids::string_generator()(text);
    } catch (const std::runtime_error&) {
        return std::nullopt;
    }
}

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

const char* toString(MovementKind k) noexcept {
    switch (k) {
        case MovementKind::KETTLEBELL_SWING: return "kettlebell_swing";
        case MovementKind::BURPEE:           return "burpee";
        case MovementKind::PULLUP:           return "pullup";
        case MovementKind::MOBILITY_DRILL:   return "mobility_drill";
    }
    return "unknown";
}

const char* toString(BurpeeStyle s) noexcept {
    switch (s) {
        case BurpeeStyle::FOUR_COUNT:         return "four_count";
        case BurpeeStyle::SIX_COUNT:          return "six_count";
        case BurpeeStyle::SIX_COUNT_TWO_PUMP: return "six_count_two_pump";
        case BurpeeStyle::SEAL:               return "seal";
    }
    return "unknown";
}

const char* toString(MicrodoseCategory c) noexcept {
    switch (c) {
        case MicrodoseCategory::VO2:      return "vo2";
        case MicrodoseCategory::GTG:      return "gtg";
        case MicrodoseCategory::MOBILITY: return "mobility";
    }
    return "unknown";
}

std::optional<MovementKind> parseMovementKind(const std::string& s) {
    if (s == "kettlebell_swing") return MovementKind::KETTLEBELL_SWING;
    if (s == "burpee")           return MovementKind::BURPEE;
    if (s == "pullup")           return MovementKind::PULLUP;
    if (s == "mobility_drill")   return MovementKind::MOBILITY_DRILL;
    return std::nullopt;
}

std::optional<BurpeeStyle> parseBurpeeStyle(const std::string& s) {
    if (s == "four_count")         return BurpeeStyle::FOUR_COUNT;
    if (s == "six_count")          return BurpeeStyle::SIX_COUNT;
    if (s == "six_count_two_pump") return BurpeeStyle::SIX_COUNT_TWO_PUMP;
    if (s == "seal")               return BurpeeStyle::SEAL;
    return std::nullopt;
}

std::optional<MicrodoseCategory> parseCategory(const std::string& s) {
    const std::string l = lower(s);
    if (l == "vo2")      return MicrodoseCategory::VO2;
    if (l == "gtg")      return MicrodoseCategory::GTG;
    if (l == "mobility") return MicrodoseCategory::MOBILITY;
    return std::nullopt;
}

StrengthSessionType parseStrengthSessionType(const std::string& s) {
    const std::string l = lower(s);
    if (l == "lower") return StrengthSessionType::lower();
    if (l == "upper") return StrengthSessionType::upper();
    if (l == "full" || l == "full_body" || l == "fullbody") {
        return StrengthSessionType::full();
    }
    return StrengthSessionType::otherOf(l);
}

std::string describe(const MovementStyle& s) {
    switch (s.kind) {
        case MovementStyle::Kind::BURPEE:
            return std::string("burpee ") + toString(s.burpee);
        case MovementStyle::Kind::BAND:
            return s.band_colour ? "band " + *s.band_colour : std::string("no band");
        case MovementStyle::Kind::NONE:
            break;
    }
    return "none";
}

} // namespace krep
