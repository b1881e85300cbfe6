#include "krep/store/JsonCodec.hpp"
#include "krep/core/Error.hpp"

#include <boost/json.hpp>

#include <limits>

namespace json = boost::json;

namespace krep::codec {

// ---------------------------------------------------------------------------
// Field access helpers. Every failure becomes a SerializationError naming the
// field so the WAL reader can log which part of a line was bad.
// ---------------------------------------------------------------------------
static const json::object& asObject(const json::value& v, const char* what) {
    if (!v.is_object()) {
        throw SerializationError(std::string(what) + ": expected object");
    }
    return v.get_object();
}

static const json::value& field(const json::object& o, const char* key) {
    auto it = o.find(key);
    if (it == o.end()) {
        throw SerializationError(std::string("missing field '") + key + "'");
    }
    return it->value();
}

static bool isNullOrMissing(const json::object& o, const char* key) {
    auto it = o.find(key);
    return it == o.end() || it->value().is_null();
}

static std::string getString(const json::value& v, const char* key) {
    if (!v.is_string()) {
        throw SerializationError(std::string("field '") + key + "' must be a string");
    }
    const auto& s = v.get_string();
    return std::string(s.data(), s.size());
}

static std::string getString(const json::object& o, const char* key) {
    return getString(field(o, key), key);
}

static int64_t getInt(const json::value& v, const char* key, int64_t lo, int64_t hi) {
    int64_t n;
    if (v.is_int64()) {
        n = v.get_int64();
    } else if (v.is_uint64() &&
               v.get_uint64() <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        n = static_cast<int64_t>(v.get_uint64());
    } else {
        throw SerializationError(std::string("field '") + key + "' must be an integer");
    }
    if (n < lo || n > hi) {
        throw SerializationError(std::string("field '") + key + "' out of range");
    }
    return n;
}

static int64_t getInt(const json::object& o, const char* key, int64_t lo, int64_t hi) {
    return getInt(field(o, key), key, lo, hi);
}

static bool getBool(const json::object& o, const char* key) {
    const auto& v = field(o, key);
    if (!v.is_bool()) {
        throw SerializationError(std::string("field '") + key + "' must be a boolean");
    }
    return v.get_bool();
}

static Timestamp getTimestamp(const json::value& v, const char* key) {
    auto t = infra::parseRfc3339(getString(v, key));
    if (!t) {
        throw SerializationError(std::string("field '") + key + "' is not an RFC 3339 timestamp");
    }
    return *t;
}

static std::optional<Timestamp> getOptTimestamp(const json::object& o, const char* key) {
    if (isNullOrMissing(o, key)) return std::nullopt;
    return getTimestamp(field(o, key), key);
}

static std::optional<uint8_t> getOptU8(const json::object& o, const char* key) {
    if (isNullOrMissing(o, key)) return std::nullopt;
    return static_cast<uint8_t>(getInt(o, key, 0, 255));
}

static json::value optTimestamp(const std::optional<Timestamp>& t) {
    if (!t) return nullptr;
    return json::value(infra::formatRfc3339(*t));
}

static json::value optU8(const std::optional<uint8_t>& v) {
    if (!v) return nullptr;
    return json::value(static_cast<int64_t>(*v));
}

// ---------------------------------------------------------------------------
// Style / metric
// ---------------------------------------------------------------------------
json::value toJson(const MovementStyle& s) {
    json::object o;
    switch (s.kind) {
        case MovementStyle::Kind::NONE:
            o["kind"] = "none";
            break;
        case MovementStyle::Kind::BURPEE:
            o["kind"] = "burpee";
            o["burpee"] = toString(s.burpee);
            break;
        case MovementStyle::Kind::BAND:
            o["kind"] = "band";
            if (s.band_colour) {
                o["colour"] = *s.band_colour;
            } else {
                o["colour"] = nullptr;
            }
            break;
    }
    return o;
}

MovementStyle styleFromJson(const json::value& v) {
    const auto& o = asObject(v, "style");
    const std::string kind = getString(o, "kind");

    if (kind == "none") {
        return MovementStyle::none();
    }
    if (kind == "burpee") {
        auto b = parseBurpeeStyle(getString(o, "burpee"));
        if (!b) throw SerializationError("unknown burpee style");
        return MovementStyle::ofBurpee(*b);
    }
    if (kind == "band") {
        if (isNullOrMissing(o, "colour")) return MovementStyle::ofBand(std::nullopt);
        return MovementStyle::ofBand(getString(o, "colour"));
    }
    throw SerializationError("unknown style kind '" + kind + "'");
}

json::value toJson(const MetricSpec& m) {
    json::object o;
    o["key"] = m.key;
    o["progressable"] = m.progressable;
    if (m.type == MetricSpec::Type::REPS) {
        o["type"] = "reps";
        o["default"] = m.default_reps;
        o["min"] = m.min;
        o["max"] = m.max;
        o["step"] = m.step;
    } else {
        o["type"] = "band";
        o["default"] = m.default_band;
    }
    return o;
}

MetricSpec metricFromJson(const json::value& v) {
    const auto& o = asObject(v, "metric");
    const std::string type = getString(o, "type");
    constexpr int64_t I32_MIN = std::numeric_limits<int32_t>::min();
    constexpr int64_t I32_MAX = std::numeric_limits<int32_t>::max();

    if (type == "reps") {
        return MetricSpec::reps(getString(o, "key"),
                                static_cast<int32_t>(getInt(o, "default", I32_MIN, I32_MAX)),
                                static_cast<int32_t>(getInt(o, "min", I32_MIN, I32_MAX)),
                                static_cast<int32_t>(getInt(o, "max", I32_MIN, I32_MAX)),
                                static_cast<int32_t>(getInt(o, "step", I32_MIN, I32_MAX)),
                                getBool(o, "progressable"));
    }
    if (type == "band") {
        return MetricSpec::band(getString(o, "key"), getString(o, "default"),
                                getBool(o, "progressable"));
    }
    throw SerializationError("unknown metric type '" + type + "'");
}

// ---------------------------------------------------------------------------
// Session
// ---------------------------------------------------------------------------
json::value toJson(const Session& s) {
    json::object o;
    o["id"] = toString(s.id);
    o["definition_id"] = s.definition_id;
    o["performed_at"] = infra::formatRfc3339(s.performed_at);
    o["started_at"] = optTimestamp(s.started_at);
    o["completed_at"] = optTimestamp(s.completed_at);
    if (s.actual_duration_seconds) {
        o["actual_duration_seconds"] = static_cast<uint64_t>(*s.actual_duration_seconds);
    } else {
        o["actual_duration_seconds"] = nullptr;
    }

    json::array metrics;
    for (const auto& m : s.metrics_realized) {
        metrics.push_back(toJson(m));
    }
    o["metrics_realized"] = std::move(metrics);

    o["perceived_rpe"] = optU8(s.perceived_rpe);
    o["avg_hr"] = optU8(s.avg_hr);
    o["max_hr"] = optU8(s.max_hr);
    return o;
}

Session sessionFromJson(const json::value& v) {
    const auto& o = asObject(v, "session");
    Session s;

    auto id = parseUuid(getString(o, "id"));
    if (!id) throw SerializationError("field 'id' is not a UUID");
    s.id = *id;

    s.definition_id = getString(o, "definition_id");
    s.performed_at = getTimestamp(field(o, "performed_at"), "performed_at");
    s.started_at = getOptTimestamp(o, "started_at");
    s.completed_at = getOptTimestamp(o, "completed_at");

    if (!isNullOrMissing(o, "actual_duration_seconds")) {
        s.actual_duration_seconds = static_cast<uint32_t>(
            getInt(o, "actual_duration_seconds", 0, std::numeric_limits<uint32_t>::max()));
    }

    if (!isNullOrMissing(o, "metrics_realized")) {
        const auto& arr = field(o, "metrics_realized");
        if (!arr.is_array()) {
            throw SerializationError("field 'metrics_realized' must be an array");
        }
        for (const auto& m : arr.get_array()) {
            s.metrics_realized.push_back(metricFromJson(m));
        }
    }

    s.perceived_rpe = getOptU8(o, "perceived_rpe");
    s.avg_hr = getOptU8(o, "avg_hr");
    s.max_hr = getOptU8(o, "max_hr");
    return s;
}

std::string encodeSessionLine(const Session& s) {
    return json::serialize(toJson(s));
}

Session decodeSessionLine(const std::string& line) {
    boost::system::error_code ec;
    json::value v = json::parse(line, ec);
    if (ec) {
        throw SerializationError("invalid JSON: " + ec.message());
    }
    return sessionFromJson(v);
}

// ---------------------------------------------------------------------------
// User state
// ---------------------------------------------------------------------------
json::value toJson(const UserMicrodoseState& st) {
    json::object progressions;
    for (const auto& [def_id, p] : st.progressions) {
        json::object o;
        o["reps"] = p.reps;
        o["style"] = toJson(p.style);
        o["level"] = static_cast<uint64_t>(p.level);
        o["last_upgraded"] = optTimestamp(p.last_upgraded);
        progressions[def_id] = std::move(o);
    }

    json::object root;
    root["progressions"] = std::move(progressions);
    if (st.last_mobility_def_id) {
        root["last_mobility_def_id"] = *st.last_mobility_def_id;
    } else {
        root["last_mobility_def_id"] = nullptr;
    }
    return root;
}

UserMicrodoseState stateFromJson(const json::value& v) {
    const auto& root = asObject(v, "state");
    UserMicrodoseState st;

    if (!isNullOrMissing(root, "progressions")) {
        const auto& progs = asObject(field(root, "progressions"), "progressions");
        for (const auto& kv : progs) {
            const auto& o = asObject(kv.value(), "progression");
            ProgressionState p;
            p.reps = static_cast<int32_t>(getInt(o, "reps",
                                                 std::numeric_limits<int32_t>::min(),
                                                 std::numeric_limits<int32_t>::max()));
            p.style = styleFromJson(field(o, "style"));
            p.level = static_cast<uint32_t>(getInt(o, "level", 0,
                                                   std::numeric_limits<uint32_t>::max()));
            p.last_upgraded = getOptTimestamp(o, "last_upgraded");
            st.progressions.emplace(std::string(kv.key()), std::move(p));
        }
    }

    if (!isNullOrMissing(root, "last_mobility_def_id")) {
        st.last_mobility_def_id = getString(root, "last_mobility_def_id");
    }
    return st;
}

} // namespace krep::codec
