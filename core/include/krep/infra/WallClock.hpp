#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace krep::infra {

// Sessions and signals are stamped with civil UTC time, so this is the
// system clock rather than a monotonic one.
using WallClock = std::chrono::system_clock;
using Timestamp = WallClock::time_point;

inline Timestamp now() noexcept {
    return WallClock::now();
}

inline int64_t to_ns(Timestamp t) noexcept {
    return static_cast<int64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(
            t.time_since_epoch()
        ).count()
    );
}

inline Timestamp from_ns(int64_t ns) noexcept {
    return Timestamp(
        std::chrono::duration_cast<WallClock::duration>(std::chrono::nanoseconds(ns))
    );
}

inline std::chrono::hours hours(int64_t h) noexcept {
    return std::chrono::hours(h);
}

inline std::chrono::hours days(int64_t d) noexcept {
    return std::chrono::hours(24 * d);
}

// RFC 3339 in UTC, e.g. 2024-01-15T10:30:00.123456789Z. The fraction is
// emitted with full nanosecond precision and omitted when zero.
std::string formatRfc3339(Timestamp t);

// Accepts 'Z' or a +HH:MM / -HH:MM offset and 0-9 fraction digits.
std::optional<Timestamp> parseRfc3339(const std::string& text);

} // namespace krep::infra
