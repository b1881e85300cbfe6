#include "krep/store/CsvArchive.hpp"
#include "krep/store/SessionWal.hpp"
#include "krep/core/Error.hpp"
#include "krep/infra/AtomicFile.hpp"
#include "krep/infra/FileLock.hpp"
#include "krep/infra/Log.hpp"

#include <cerrno>
#include <cstdio>
#include <fcntl.h>
#include <filesystem>
#include <limits>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace krep {

const char* const ARCHIVE_HEADER =
    "id,definition_id,performed_at,started_at,completed_at,duration,perceived_rpe,avg_hr,max_hr";

static constexpr size_t ARCHIVE_COLUMNS = 9;

// ---------------------------------------------------------------------------
// Rows
// ---------------------------------------------------------------------------
static std::string quoteField(const std::string& f) {
    if (f.find_first_of(",\"\r\n") == std::string::npos) return f;
    std::string q = "\"";
    for (char c : f) {
        if (c == '"') q.push_back('"');
        q.push_back(c);
    }
    q.push_back('"');
    return q;
}

template <typename T>
static std::string optField(const std::optional<T>& v) {
    return v ? std::to_string(static_cast<unsigned long>(*v)) : std::string();
}

static std::string optField(const std::optional<Timestamp>& t) {
    return t ? infra::formatRfc3339(*t) : std::string();
}

std::string encodeArchiveRow(const Session& s) {
    std::string row;
    row += toString(s.id);
    row += ',';
    row += quoteField(s.definition_id);
    row += ',';
    row += infra::formatRfc3339(s.performed_at);
    row += ',';
    row += optField(s.started_at);
    row += ',';
    row += optField(s.completed_at);
    row += ',';
    row += optField(s.actual_duration_seconds);
    row += ',';
    row += optField(s.perceived_rpe);
    row += ',';
    row += optField(s.avg_hr);
    row += ',';
    row += optField(s.max_hr);
    return row;
}

template <typename T>
static std::optional<T> parseUnsigned(const std::string& f, const char* column) {
    if (f.empty()) return std::nullopt;
    if (f.find_first_not_of("0123456789") != std::string::npos || f.size() > 10) {
        throw SerializationError(std::string("column ") + column + ": not a number: " + f);
    }
    unsigned long long n = std::stoull(f);
    if (n > std::numeric_limits<T>::max()) {
        throw SerializationError(std::string("column ") + column + ": out of range: " + f);
    }
    return static_cast<T>(n);
}

Session decodeArchiveRow(const std::vector<std::string>& fields) {
    if (fields.size() != ARCHIVE_COLUMNS) {
        throw SerializationError("expected " + std::to_string(ARCHIVE_COLUMNS) +
                                 " columns, got " + std::to_string(fields.size()));
    }

    Session s;
    auto id = parseUuid(fields[0]);
    if (!id) throw SerializationError("invalid id: " + fields[0]);
    s.id = *id;

    s.definition_id = fields[1];
    if (s.definition_id.empty()) throw SerializationError("empty definition_id");

    auto performed = infra::parseRfc3339(fields[2]);
    if (!performed) throw SerializationError("invalid performed_at: " + fields[2]);
    s.performed_at = *performed;

    if (!fields[3].empty()) s.started_at = infra::parseRfc3339(fields[3]);
    if (!fields[4].empty()) s.completed_at = infra::parseRfc3339(fields[4]);

    s.actual_duration_seconds = parseUnsigned<uint32_t>(fields[5], "duration");
    s.perceived_rpe = parseUnsigned<uint8_t>(fields[6], "perceived_rpe");
    s.avg_hr = parseUnsigned<uint8_t>(fields[7], "avg_hr");
    s.max_hr = parseUnsigned<uint8_t>(fields[8], "max_hr");
    return s;
}

std::vector<std::vector<std::string>> splitCsv(const std::string& text) {
    std::vector<std::vector<std::string>> records;
    std::vector<std::string> record;
    std::string field;
    bool in_quotes = false;
    bool any = false;

    auto endRecord = [&]() {
        if (any || !field.empty() || !record.empty()) {
            record.push_back(std::move(field));
            records.push_back(std::move(record));
        }
        record.clear();
        field.clear();
        any = false;
    };

    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field.push_back(c);
            }
            continue;
        }

        switch (c) {
            case '"':
                in_quotes = true;
                any = true;
                break;
            case ',':
                record.push_back(std::move(field));
                field.clear();
                any = true;
                break;
            case '\r':
                break;
            case '\n':
                endRecord();
                break;
            default:
                field.push_back(c);
                break;
        }
    }
    endRecord();
    return records;
}

// ---------------------------------------------------------------------------
// Reading
// ---------------------------------------------------------------------------
static bool isHeader(const std::vector<std::string>& rec) {
    return !rec.empty() && rec[0] == "id" && rec.size() > 1 && rec[1] == "definition_id";
}

std::vector<Session> readArchive(const std::string& path,
                                 std::chrono::milliseconds lock_timeout) {
    infra::UniqueFd fd;
    try {
        fd = infra::openOrThrow(path, O_RDONLY);
    } catch (const IoError& e) {
        if (e.code() == ENOENT) {
            KREP_LOG_DEBUG("ARCHIVE", path << " does not exist yet");
            return {};
        }
        throw;
    }

    std::string bytes;
    {
        infra::FileLock lock(fd.get(), infra::FileLock::Mode::SHARED, path, lock_timeout);
        infra::readFile(fd.get(), bytes, path);
    }

    std::vector<Session> out;
    auto records = splitCsv(bytes);
    for (size_t i = 0; i < records.size(); ++i) {
        if (i == 0 && isHeader(records[i])) continue;
        try {
            out.push_back(decodeArchiveRow(records[i]));
        } catch (const SerializationError& e) {
            KREP_LOG_WARN("ARCHIVE", path << ": skipping row " << i << ": " << e.what());
        }
    }
    KREP_LOG_DEBUG("ARCHIVE", "read " << out.size() << " sessions from " << path);
    return out;
}

// ---------------------------------------------------------------------------
// Rollup
// ---------------------------------------------------------------------------
static bool exists(const std::string& path) {
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0;
}

std::string processedPathFor(const std::string& wal_path) {
    std::string candidate = wal_path + ".processed";
    if (!exists(candidate)) return candidate;

    fs::path p(wal_path);
    const std::string stem = (p.parent_path() / p.stem()).string();
    const std::string ext = p.extension().string();
    for (unsigned n = 1;; ++n) {
        candidate = stem + "." + std::to_string(n) + ext + ".processed";
        if (!exists(candidate)) return candidate;
    }
}

static void appendToArchive(const std::string& archive_path,
                            const std::vector<Session>& sessions,
                            std::chrono::milliseconds lock_timeout) {
    const std::string dir = infra::parentDirectory(archive_path);
    infra::ensureDirectory(dir);

    infra::UniqueFd fd = infra::openOrThrow(archive_path, O_RDWR | O_CREAT | O_APPEND);
    infra::FileLock lock(fd.get(), infra::FileLock::Mode::EXCLUSIVE, archive_path, lock_timeout);

    struct stat st{};
    if (::fstat(fd.get(), &st) != 0) {
        throw IoError("fstat " + archive_path, errno);
    }

    std::string buf;
    if (st.st_size == 0) {
        buf += ARCHIVE_HEADER;
        buf += '\n';
    } else {
        char last = '\n';
        ssize_t n = ::pread(fd.get(), &last, 1, st.st_size - 1);
        if (n < 0) {
            throw IoError("read tail of " + archive_path, errno);
        }
        if (n == 1 && last != '\n') {
            KREP_LOG_WARN("ARCHIVE", archive_path << " ends in a partial row, terminating it");
            buf += '\n';
        }
    }
    for (const auto& s : sessions) {
        buf += encodeArchiveRow(s);
        buf += '\n';
    }

    infra::writeAll(fd.get(), buf, archive_path);
    infra::syncFd(fd.get(), archive_path);
    if (st.st_size == 0) {
        infra::fsyncDirectory(dir);
    }
}

size_t rollup(const std::string& wal_path,
              const std::string& archive_path,
              std::chrono::milliseconds lock_timeout) {
    for (;;) {
        infra::UniqueFd fd;
        try {
            fd = infra::openOrThrow(wal_path, O_RDONLY);
        } catch (const IoError& e) {
            if (e.code() == ENOENT) {
                KREP_LOG_INFO("ROLLUP", "no WAL at " << wal_path << ", nothing to roll up");
                return 0;
            }
            throw;
        }

        infra::FileLock lock(fd.get(), infra::FileLock::Mode::EXCLUSIVE, wal_path, lock_timeout);
        if (!infra::sameFile(fd.get(), wal_path)) {
            // Another rollup moved it while we waited.
            continue;
        }

        std::string bytes;
        infra::readFile(fd.get(), bytes, wal_path);

        size_t skipped = 0;
        std::vector<Session> sessions = parseWal(bytes, wal_path, &skipped);
        if (sessions.empty()) {
            KREP_LOG_INFO("ROLLUP", "no sessions in " << wal_path << ", nothing to roll up");
            return 0;
        }

        appendToArchive(archive_path, sessions, lock_timeout);
        KREP_LOG_INFO("ROLLUP", "archived " << sessions.size() << " sessions to " << archive_path);

        const std::string processed = processedPathFor(wal_path);
        if (::rename(wal_path.c_str(), processed.c_str()) != 0) {
            throw IoError("rename " + wal_path + " -> " + processed, errno);
        }
        infra::fsyncDirectory(infra::parentDirectory(wal_path));

        if (skipped > 0) {
            KREP_LOG_WARN("ROLLUP", skipped << " unreadable WAL lines left in " << processed);
        }
        KREP_LOG_INFO("ROLLUP", "moved WAL to " << processed);
        return sessions.size();
    }
}

size_t cleanupProcessed(const std::string& dir) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return 0;
    }

    size_t removed = 0;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        throw IoError("list " + dir, ec.value());
    }
    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec)) continue;
        if (entry.path().extension() != ".processed") continue;

        if (!fs::remove(entry.path(), ec) && ec) {
            throw IoError("remove " + entry.path().string(), ec.value());
        }
        KREP_LOG_DEBUG("ROLLUP", "removed " << entry.path().string());
        ++removed;
    }

    if (removed > 0) {
        KREP_LOG_INFO("ROLLUP", "cleaned up " << removed << " processed WAL files");
    }
    return removed;
}

} // namespace krep
