#include "krep/infra/AtomicFile.hpp"
#include "krep/infra/FileLock.hpp"
#include "krep/core/Error.hpp"
#include "krep/infra/Log.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <fcntl.h>
#include <filesystem>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace krep::infra {

void writeAll(int fd, const std::string& bytes, const std::string& what) {
    const char* p = bytes.data();
    size_t left = bytes.size();
    while (left > 0) {
        ssize_t n = ::write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw IoError("write " + what, errno);
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
}

void syncFd(int fd, const std::string& what) {
    if (::fsync(fd) != 0) {
        throw IoError("fsync " + what, errno);
    }
}

void fsyncDirectory(const std::string& dir) {
    UniqueFd fd = openOrThrow(dir.empty() ? "." : dir, O_RDONLY | O_DIRECTORY);
    syncFd(fd.get(), dir);
}

void ensureDirectory(const std::string& dir) {
    if (dir.empty()) return;
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw IoError("create directory " + dir, ec.value());
    }
}

std::string parentDirectory(const std::string& path) {
    fs::path parent = fs::path(path).parent_path();
    return parent.empty() ? std::string(".") : parent.string();
}

bool sameFile(int fd, const std::string& path) {
    struct stat by_fd{};
    struct stat by_path{};
    if (::fstat(fd, &by_fd) != 0) {
        throw IoError("fstat " + path, errno);
    }
    if (::stat(path.c_str(), &by_path) != 0) {
        if (errno == ENOENT) return false;
        throw IoError("stat " + path, errno);
    }
    return by_fd.st_dev == by_path.st_dev && by_fd.st_ino == by_path.st_ino;
}

void writeFileAtomic(const std::string& path, const std::string& bytes) {
    const std::string dir = parentDirectory(path);
    ensureDirectory(dir);

    std::string tmpl = path + ".tmp.XXXXXX";
    std::vector<char> name(tmpl.begin(), tmpl.end());
    name.push_back('\0');

    int raw = ::mkostemp(name.data(), O_CLOEXEC);
    if (raw < 0) {
        throw IoError("create temp file for " + path, errno);
    }
    UniqueFd fd(raw);
    const std::string tmp_path(name.data());

    try {
        if (::fchmod(fd.get(), 0644) != 0) {
            throw IoError("chmod " + tmp_path, errno);
        }
        writeAll(fd.get(), bytes, tmp_path);
        syncFd(fd.get(), tmp_path);
        fd.reset();

        if (::rename(tmp_path.c_str(), path.c_str()) != 0) {
            throw IoError("rename " + tmp_path + " -> " + path, errno);
        }
    } catch (const Error&) {
        fd.reset();
        if (::unlink(tmp_path.c_str()) != 0 && errno != ENOENT) {
            KREP_LOG_WARN("FILE", "could not remove temp file " << tmp_path);
        }
        throw;
    }

    fsyncDirectory(dir);
    KREP_LOG_DEBUG("FILE", "replaced " << path << " (" << bytes.size() << "B)");
}

void readFile(int fd, std::string& out, const std::string& what) {
    out.clear();
    char buf[8192];
    for (;;) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw IoError("read " + what, errno);
        }
        if (n == 0) break;
        out.append(buf, static_cast<size_t>(n));
    }
}

} // namespace krep::infra
