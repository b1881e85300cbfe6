#pragma once

#include "krep/domain/Types.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace krep {

// Archive columns, in order. Metrics are not archived.
extern const char* const ARCHIVE_HEADER;

// One CSV row without the line terminator. Absent optionals are empty fields.
std::string encodeArchiveRow(const Session& s);

// Throws SerializationError on a wrong column count, a bad id or a bad
// performed_at. An unparsable started_at/completed_at is read as absent.
Session decodeArchiveRow(const std::vector<std::string>& fields);

// Splits CSV text into records of fields. Handles quoted fields with embedded
// commas, quotes and newlines. A record whose closing quote is missing is
// returned as-is and fails decoding later.
std::vector<std::vector<std::string>> splitCsv(const std::string& text);

// Every row of the archive, oldest first. Missing file -> empty. Bad rows are
// logged and skipped.
std::vector<Session> readArchive(
    const std::string& path,
    std::chrono::milliseconds lock_timeout = std::chrono::milliseconds(5000)
);

// Moves every WAL record into the archive.
//
// The WAL is locked exclusively for the whole call. Rows are appended to the
// archive and fsynced; only then is the WAL renamed (never deleted) to its
// processed name. A crash at any point leaves every record in the WAL, the
// archive, or both. Returns the number of sessions archived; an absent or
// empty WAL returns 0 and touches nothing.
size_t rollup(
    const std::string& wal_path,
    const std::string& archive_path,
    std::chrono::milliseconds lock_timeout = std::chrono::milliseconds(5000)
);

// "<wal>.processed", or "<stem>.<n>.wal.processed" for the first free n when
// that already exists.
std::string processedPathFor(const std::string& wal_path);

// Removes regular files ending in ".processed" from dir. Missing dir -> 0.
size_t cleanupProcessed(const std::string& dir);

} // namespace krep
