#pragma once

#include <string>

namespace krep::infra {

// write(2) until every byte is out; retries EINTR and short writes.
void writeAll(int fd, const std::string& bytes, const std::string& what);

// fsync(2) that throws IoError.
void syncFd(int fd, const std::string& what);

// Makes a completed rename durable.
void fsyncDirectory(const std::string& dir);

// Creates dir and any missing parents.
void ensureDirectory(const std::string& dir);

// Crash-safe replace: temp file in the same directory, write, fsync,
// rename over path, fsync directory. On failure the temp file is removed and
// path still holds its previous content.
void writeFileAtomic(const std::string& path, const std::string& bytes);

// Reads from the current offset of fd to EOF.
void readFile(int fd, std::string& out, const std::string& what);

std::string parentDirectory(const std::string& path);

// True when fd is still the file that path names (same device and inode).
// False if path is gone or now names another file.
bool sameFile(int fd, const std::string& path);

} // namespace krep::infra
