#pragma once

#include <chrono>
#include <string>

namespace krep::infra {

// ---------------------------------------------------------------------------
// FileLock - advisory flock(2) held on an already open descriptor.
//
// Acquisition polls with LOCK_NB until the deadline, then throws LockError.
// The lock is released in the destructor, so every exit path (including a
// thrown write error) unlocks. The descriptor itself is not owned.
// ---------------------------------------------------------------------------
class FileLock {
public:
    enum class Mode {
        SHARED,
        EXCLUSIVE
    };

    static constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{5000};

    FileLock(int fd,
             Mode mode,
             const std::string& what,
             std::chrono::milliseconds timeout = DEFAULT_TIMEOUT);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    void release() noexcept;

private:
    int fd_;
    bool held_;
};

// Owning file descriptor. Closes on destruction.
class UniqueFd {
public:
    UniqueFd() noexcept : fd_(-1) {}
    explicit UniqueFd(int fd) noexcept : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(UniqueFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    int get() const noexcept { return fd_; }
    bool valid() const noexcept { return fd_ >= 0; }
    void reset(int fd = -1) noexcept;

private:
    int fd_;
};

// open(2) wrapper; throws IoError with the path in the message.
UniqueFd openOrThrow(const std::string& path, int flags, int mode = 0644);

} // namespace krep::infra
