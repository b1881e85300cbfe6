#include "krep/store/History.hpp"
#include "krep/store/CsvArchive.hpp"
#include "krep/store/SessionWal.hpp"
#include "krep/core/Error.hpp"
#include "krep/infra/Log.hpp"

#include <algorithm>
#include <unordered_set>

#include <boost/container_hash/hash.hpp>

namespace krep {

std::vector<Session> loadRecentSessions(const std::string& wal_path,
                                        const std::string& archive_path,
                                        int window_days,
                                        Timestamp now) {
    const Timestamp cutoff = now - infra::days(window_days);
    std::vector<Session> out;
    std::unordered_set<boost::uuids::uuid, boost::hash<boost::uuids::uuid>> seen;

    std::vector<Session> wal;
    try {
        wal = SessionWal(wal_path).readAll();
    } catch (const Error& e) {
        KREP_LOG_WARN("HISTORY", "WAL unavailable: " << e.what());
    }
    for (auto& s : wal) {
        if (s.performed_at < cutoff) continue;
        if (!seen.insert(s.id).second) continue;
        out.push_back(std::move(s));
    }
    const size_t from_wal = out.size();

    std::vector<Session> archived;
    try {
        archived = readArchive(archive_path);
    } catch (const Error& e) {
        KREP_LOG_WARN("HISTORY", "archive unavailable: " << e.what());
    }
    for (auto& s : archived) {
        if (s.performed_at < cutoff) continue;
        if (!seen.insert(s.id).second) continue;
        out.push_back(std::move(s));
    }

    std::stable_sort(out.begin(), out.end(), [](const Session& a, const Session& b) {
        return a.performed_at > b.performed_at;
    });

    KREP_LOG_DEBUG("HISTORY", "loaded " << out.size() << " sessions from the last "
                   << window_days << " days (" << from_wal << " from WAL)");
    return out;
}

std::vector<SessionKind> toHistory(std::vector<Session> sessions) {
    std::vector<SessionKind> out;
    out.reserve(sessions.size());
    for (auto& s : sessions) {
        out.emplace_back(std::move(s));
    }
    return out;
}

const SessionKind* findLastByCategory(const Catalog& catalog,
                                      const std::vector<SessionKind>& history,
                                      MicrodoseCategory category) {
    for (const auto& entry : history) {
        if (inferCategory(catalog, definitionIdOf(entry)) == category) {
            return &entry;
        }
    }
    return nullptr;
}

} // namespace krep
