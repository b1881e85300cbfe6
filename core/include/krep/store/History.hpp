#pragma once

#include "krep/domain/Catalog.hpp"
#include "krep/domain/Types.hpp"

#include <string>
#include <vector>

namespace krep {

constexpr int DEFAULT_HISTORY_DAYS = 7;

// Sessions performed at or after now - window_days, newest first.
//
// The WAL is read before the archive so a rollup running in between can only
// make a session appear twice, never vanish; duplicates keep the WAL copy.
// A source that is missing or cannot be read contributes nothing.
std::vector<Session> loadRecentSessions(const std::string& wal_path,
                                        const std::string& archive_path,
                                        int window_days,
                                        Timestamp now);

std::vector<SessionKind> toHistory(std::vector<Session> sessions);

// Newest entry (real or skipped) whose definition falls in category.
// history must be newest first.
const SessionKind* findLastByCategory(const Catalog& catalog,
                                      const std::vector<SessionKind>& history,
                                      MicrodoseCategory category);

} // namespace krep
