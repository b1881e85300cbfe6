#include "krep/infra/WallClock.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>

namespace krep::infra {

std::string formatRfc3339(Timestamp t) {
    int64_t ns = to_ns(t);
    int64_t secs = ns / 1000000000LL;
    int64_t frac = ns % 1000000000LL;
    if (frac < 0) {
        frac += 1000000000LL;
        secs -= 1;
    }

    time_t tt = static_cast<time_t>(secs);
    struct tm tm{};
    gmtime_r(&tt, &tm);

    char buf[64];
    int n = std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d",
                          tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                          tm.tm_hour, tm.tm_min, tm.tm_sec);
    std::string out(buf, static_cast<size_t>(n));

    if (frac != 0) {
        std::snprintf(buf, sizeof(buf), ".%09lld", static_cast<long long>(frac));
        out += buf;
    }
    out += 'Z';
    return out;
}

static bool readDigits(const std::string& s, size_t& pos, size_t count, int& out) {
    if (pos + count > s.size()) return false;
    int v = 0;
    for (size_t i = 0; i < count; ++i) {
        char c = s[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        v = v * 10 + (c - '0');
    }
    pos += count;
    out = v;
    return true;
}

static bool expect(const std::string& s, size_t& pos, char c) {
    if (pos >= s.size()) return false;
    char got = s[pos];
    if (c == 'T' ? (got != 'T' && got != 't' && got != ' ') : got != c) return false;
    ++pos;
    return true;
}

std::optional<Timestamp> parseRfc3339(const std::string& text) {
    size_t pos = 0;
    int year, mon, day, hour, min, sec;

    if (!readDigits(text, pos, 4, year) || !expect(text, pos, '-') ||
        !readDigits(text, pos, 2, mon)  || !expect(text, pos, '-') ||
        !readDigits(text, pos, 2, day)  || !expect(text, pos, 'T') ||
        !readDigits(text, pos, 2, hour) || !expect(text, pos, ':') ||
        !readDigits(text, pos, 2, min)  || !expect(text, pos, ':') ||
        !readDigits(text, pos, 2, sec)) {
        return std::nullopt;
    }

    if (mon < 1 || mon > 12 || day < 1 || day > 31 ||
        hour > 23 || min > 59 || sec > 60) {
        return std::nullopt;
    }

    int64_t frac_ns = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        size_t digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 9) {
                frac_ns = frac_ns * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) return std::nullopt;
        for (size_t i = digits; i < 9; ++i) frac_ns *= 10;
    }

    int offset_secs = 0;
    if (pos >= text.size()) return std::nullopt;
    char z = text[pos];
    if (z == 'Z' || z == 'z') {
        ++pos;
    } else if (z == '+' || z == '-') {
        ++pos;
        int oh, om;
        if (!readDigits(text, pos, 2, oh) || !expect(text, pos, ':') ||
            !readDigits(text, pos, 2, om)) {
            return std::nullopt;
        }
        offset_secs = (oh * 3600 + om * 60) * (z == '+' ? 1 : -1);
    } else {
        return std::nullopt;
    }
    if (pos != text.size()) return std::nullopt;

    struct tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon  = mon - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min  = min;
    tm.tm_sec  = sec;
    int64_t secs = static_cast<int64_t>(timegm(&tm)) - offset_secs;

    return from_ns(secs * 1000000000LL + frac_ns);
}

} // namespace krep::infra
