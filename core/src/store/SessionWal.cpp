#include "krep/store/SessionWal.hpp"
#include "krep/store/JsonCodec.hpp"
#include "krep/core/Error.hpp"
#include "krep/infra/AtomicFile.hpp"
#include "krep/infra/FileLock.hpp"
#include "krep/infra/Log.hpp"

#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace krep {

// Rollup may rename the file between our open() and flock(). Each retry
// reopens the path; more than a handful means something else is wrong.
static constexpr int MAX_REOPEN = 8;

SessionWal::SessionWal(std::string path, std::chrono::milliseconds lock_timeout)
    : path_(std::move(path)), lock_timeout_(lock_timeout) {}

// True when the file is non-empty and its last byte is not '\n'.
static bool endsWithPartialRecord(int fd, const std::string& path) {
    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        throw IoError("fstat " + path, errno);
    }
    if (st.st_size == 0) return false;

    char last = '\n';
    ssize_t n;
    do {
        n = ::pread(fd, &last, 1, st.st_size - 1);
    } while (n < 0 && errno == EINTR);
    if (n < 0) {
        throw IoError("read tail of " + path, errno);
    }
    return n == 1 && last != '\n';
}

void SessionWal::append(const Session& session) {
    std::string record = codec::encodeSessionLine(session);
    record.push_back('\n');

    infra::ensureDirectory(infra::parentDirectory(path_));

    for (int attempt = 0; attempt < MAX_REOPEN; ++attempt) {
        infra::UniqueFd fd = infra::openOrThrow(path_, O_RDWR | O_CREAT | O_APPEND);
        infra::FileLock lock(fd.get(), infra::FileLock::Mode::EXCLUSIVE, path_, lock_timeout_);

        if (!infra::sameFile(fd.get(), path_)) {
            KREP_LOG_DEBUG("WAL", path_ << " was rotated while waiting for the lock, reopening");
            continue;
        }

        if (endsWithPartialRecord(fd.get(), path_)) {
            KREP_LOG_WARN("WAL", path_ << " ends in a partial record, terminating it");
            record.insert(record.begin(), '\n');
        }

        infra::writeAll(fd.get(), record, path_);
        infra::syncFd(fd.get(), path_);

        KREP_LOG_DEBUG("WAL", "appended session " << toString(session.id)
                       << " (" << session.definition_id << ")");
        return;
    }

    throw IoError("append to " + path_ + ": file kept being replaced", EAGAIN);
}

std::vector<Session> SessionWal::readAll() const {
    infra::UniqueFd fd;
    try {
        fd = infra::openOrThrow(path_, O_RDONLY);
    } catch (const IoError& e) {
        if (e.code() == ENOENT) {
            KREP_LOG_DEBUG("WAL", path_ << " does not exist yet");
            return {};
        }
        throw;
    }

    std::string bytes;
    {
        infra::FileLock lock(fd.get(), infra::FileLock::Mode::SHARED, path_, lock_timeout_);
        infra::readFile(fd.get(), bytes, path_);
    }

    auto sessions = parseWal(bytes, path_);
    KREP_LOG_DEBUG("WAL", "read " << sessions.size() << " sessions from " << path_);
    return sessions;
}

std::vector<Session> parseWal(const std::string& bytes,
                              const std::string& what,
                              size_t* lines_skipped) {
    std::vector<Session> out;
    size_t skipped = 0;
    size_t line_no = 0;
    size_t pos = 0;

    while (pos < bytes.size()) {
        size_t nl = bytes.find('\n', pos);
        const bool terminated = nl != std::string::npos;
        const size_t end = terminated ? nl : bytes.size();
        std::string line = bytes.substr(pos, end - pos);
        pos = terminated ? nl + 1 : bytes.size();
        ++line_no;

        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.find_first_not_of(" \t") == std::string::npos) continue;

        try {
            out.push_back(codec::decodeSessionLine(line));
        } catch (const SerializationError& e) {
            ++skipped;
            if (!terminated) {
                KREP_LOG_WARN("WAL", what << ": dropping truncated final record at line "
                              << line_no);
            } else {
                KREP_LOG_WARN("WAL", what << ": skipping malformed line " << line_no
                              << ": " << e.what());
            }
        }
    }

    if (lines_skipped) *lines_skipped = skipped;
    return out;
}

} // namespace krep
