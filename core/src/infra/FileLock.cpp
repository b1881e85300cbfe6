#include "krep/infra/FileLock.hpp"
#include "krep/core/Error.hpp"
#include "krep/infra/Log.hpp"

#include <cerrno>
#include <fcntl.h>
#include <sys/file.h>
#include <thread>
#include <unistd.h>

namespace krep::infra {

static constexpr std::chrono::milliseconds POLL_INTERVAL{10};

FileLock::FileLock(int fd,
                   Mode mode,
                   const std::string& what,
                   std::chrono::milliseconds timeout)
    : fd_(fd), held_(false) {
    const int op = (mode == Mode::EXCLUSIVE ? LOCK_EX : LOCK_SH) | LOCK_NB;
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    for (;;) {
        if (::flock(fd_, op) == 0) {
            held_ = true;
            return;
        }
        int err = errno;
        if (err == EINTR) continue;
        if (err != EWOULDBLOCK) {
            throw IoError("flock " + what, err);
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            throw LockError("timed out after " + std::to_string(timeout.count()) +
                            "ms waiting for " +
                            (mode == Mode::EXCLUSIVE ? "exclusive" : "shared") +
                            " lock on " + what);
        }
        std::this_thread::sleep_for(POLL_INTERVAL);
    }
}

FileLock::~FileLock() {
    release();
}

void FileLock::release() noexcept {
    if (!held_) return;
    if (::flock(fd_, LOCK_UN) != 0) {
        KREP_LOG_WARN("LOCK", "unlock failed errno=" << errno);
    }
    held_ = false;
}

void UniqueFd::reset(int fd) noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
    }
    fd_ = fd;
}

UniqueFd openOrThrow(const std::string& path, int flags, int mode) {
    int fd;
    do {
        fd = ::open(path.c_str(), flags | O_CLOEXEC, mode);
    } while (fd < 0 && errno == EINTR);

    if (fd < 0) {
        throw IoError("open " + path, errno);
    }
    return UniqueFd(fd);
}

} // namespace krep::infra
