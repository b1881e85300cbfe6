#include "krep/infra/Log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <unistd.h>

namespace krep::log {

static Level initialLevel() {
    Level l = Level::INFO;
    if (const char* env = std::getenv("KREP_LOG")) {
        parseLevel(env, l);
    }
    return l;
}

static std::atomic<int>& threshold() {
    static std::atomic<int> value{static_cast<int>(initialLevel())};
    return value;
}

Level level() noexcept {
    return static_cast<Level>(threshold().load(std::memory_order_relaxed));
}

void setLevel(Level l) noexcept {
    threshold().store(static_cast<int>(l), std::memory_order_relaxed);
}

bool parseLevel(const std::string& text, Level& out) noexcept {
    std::string t = text;
    std::transform(t.begin(), t.end(), t.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (t == "debug" || t == "trace") { out = Level::DEBUG; return true; }
    if (t == "info")                  { out = Level::INFO;  return true; }
    if (t == "warn" || t == "warning"){ out = Level::WARN;  return true; }
    if (t == "error")                 { out = Level::ERROR; return true; }
    if (t == "off" || t == "none")    { out = Level::OFF;   return true; }
    return false;
}

static const char* prefix(Level l) {
    switch (l) {
        case Level::DEBUG: return "DEBUG: ";
        case Level::WARN:  return "WARNING: ";
        case Level::ERROR: return "ERROR: ";
        default:           return "";
    }
}

void write(Level l, const char* tag, const std::string& msg) {
    std::string line;
    line.reserve(msg.size() + 32);
    line += '[';
    line += tag;
    line += "] ";
    line += prefix(l);
    line += msg;
    line += '\n';

    // Single write(2) so records from concurrent processes do not interleave.
    const char* p = line.data();
    size_t left = line.size();
    while (left > 0) {
        ssize_t n = ::write(STDERR_FILENO, p, left);
        if (n <= 0) return;
        p += n;
        left -= static_cast<size_t>(n);
    }
}

} // namespace krep::log
