#pragma once

#include "krep/domain/Types.hpp"

#include <chrono>
#include <functional>
#include <string>

namespace krep {

// ---------------------------------------------------------------------------
// StateStore - the mutable progression file (JSON).
//
// Writers replace the file atomically (temp + fsync + rename) and serialise on
// the sidecar "<path>.lock", so the state file itself is never locked and a
// rename never invalidates anyone's lock.
//
// load() never fails: a missing or damaged file yields the default state and a
// warning. save() and update() throw on any write problem and leave the
// previous file in place.
// ---------------------------------------------------------------------------
class StateStore {
public:
    using Mutator = std::function<void(UserMicrodoseState&)>;

    explicit StateStore(
        std::string path,
        std::chrono::milliseconds lock_timeout = std::chrono::milliseconds(5000)
    );

    UserMicrodoseState load() const;

    void save(const UserMicrodoseState& state) const;

    // load -> mutate -> save under one exclusive lock. Returns what was saved.
    UserMicrodoseState update(const Mutator& mutate) const;

    const std::string& path() const { return path_; }
    std::string lockPath() const { return path_ + ".lock"; }

private:
    UserMicrodoseState loadUnlocked() const;
    void saveUnlocked(const UserMicrodoseState& state) const;

    std::string path_;
    std::chrono::milliseconds lock_timeout_;
};

} // namespace krep
