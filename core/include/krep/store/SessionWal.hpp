#pragma once

#include "krep/domain/Types.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace krep {

// Anything that durably accepts completed sessions. Takes Session, never
// SessionKind: a skipped prescription has no way in.
class SessionSink {
public:
    virtual ~SessionSink() = default;
    virtual void append(const Session& session) = 0;
};

// ---------------------------------------------------------------------------
// SessionWal - append-only JSON-lines log of completed sessions.
//
// append: exclusive flock, one record + '\n' in a single write, fsync, unlock.
// readAll: shared flock; bad lines are logged and skipped.
// ---------------------------------------------------------------------------
class SessionWal : public SessionSink {
public:
    explicit SessionWal(
        std::string path,
        std::chrono::milliseconds lock_timeout = std::chrono::milliseconds(5000)
    );

    void append(const Session& session) override;

    std::vector<Session> readAll() const;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::chrono::milliseconds lock_timeout_;
};

// Parses a WAL image. Used by readAll and by rollup, which already holds the
// lock. lines_skipped, when given, receives the number of dropped lines.
std::vector<Session> parseWal(const std::string& bytes,
                              const std::string& what,
                              size_t* lines_skipped = nullptr);

} // namespace krep
