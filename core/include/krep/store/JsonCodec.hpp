#pragma once

#include "krep/domain/Types.hpp"

#include <boost/json/value.hpp>

#include <string>

namespace krep::codec {

// Shapes:
//   style  {"kind":"none"} | {"kind":"burpee","burpee":"six_count"}
//          | {"kind":"band","colour":"red"|null}
//   metric {"type":"reps","key":..,"default":n,"min":n,"max":n,"step":n,"progressable":b}
//          | {"type":"band","key":..,"default":"red","progressable":b}
//   timestamps are RFC 3339 strings, absent optionals are null.

boost::json::value toJson(const MovementStyle& s);
boost::json::value toJson(const MetricSpec& m);
boost::json::value toJson(const Session& s);
boost::json::value toJson(const UserMicrodoseState& st);

// Throw SerializationError on any missing or mistyped field.
MovementStyle styleFromJson(const boost::json::value& v);
MetricSpec metricFromJson(const boost::json::value& v);
Session sessionFromJson(const boost::json::value& v);
UserMicrodoseState stateFromJson(const boost::json::value& v);

// One WAL record, without the trailing newline.
std::string encodeSessionLine(const Session& s);
Session decodeSessionLine(const std::string& line);

} // namespace krep::codec
