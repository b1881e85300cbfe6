#pragma once

#include <sstream>
#include <string>

namespace krep::log {

enum class Level : int {
    DEBUG = 0,
    INFO  = 1,
    WARN  = 2,
    ERROR = 3,
    OFF   = 4
};

// Threshold starts from KREP_LOG (debug|info|warn|error|off), default info.
Level level() noexcept;
void setLevel(Level l) noexcept;
bool parseLevel(const std::string& text, Level& out) noexcept;

inline bool enabled(Level l) noexcept {
    return static_cast<int>(l) >= static_cast<int>(level());
}

// One record per call, written to stderr in a single write:
//   [TAG] message
//   [TAG] WARNING: message
void write(Level l, const char* tag, const std::string& msg);

} // namespace krep::log

#define KREP_LOG_AT(lvl, tag, expr)                                   \
    do {                                                              \
        if (::krep::log::enabled(lvl)) {                              \
            std::ostringstream krep_log_os_;                          \
            krep_log_os_ << expr;                                     \
            ::krep::log::write(lvl, tag, krep_log_os_.str());         \
        }                                                             \
    } while (0)

#define KREP_LOG_DEBUG(tag, expr) KREP_LOG_AT(::krep::log::Level::DEBUG, tag, expr)
#define KREP_LOG_INFO(tag, expr)  KREP_LOG_AT(::krep::log::Level::INFO, tag, expr)
#define KREP_LOG_WARN(tag, expr)  KREP_LOG_AT(::krep::log::Level::WARN, tag, expr)
#define KREP_LOG_ERROR(tag, expr) KREP_LOG_AT(::krep::log::Level::ERROR, tag, expr)
