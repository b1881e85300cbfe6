#pragma once

#include "krep/config/Config.hpp"
#include "krep/domain/Catalog.hpp"
#include "krep/engine/Prescriber.hpp"
#include "krep/store/SessionWal.hpp"
#include "krep/store/StateStore.hpp"

#include <optional>
#include <string>

namespace krep {

// Where everything lives under the data directory.
struct DataLayout {
    std::string data_dir;

    std::string walDir() const        { return data_dir + "/wal"; }
    std::string walPath() const       { return walDir() + "/microdose_sessions.wal"; }
    std::string statePath() const     { return walDir() + "/state.json"; }
    std::string archivePath() const   { return data_dir + "/sessions.csv"; }
    std::string strengthPath() const  { return data_dir + "/strength/signal.json"; }

    void ensure() const;
};

struct HarderResult {
    bool changed = false;
    std::optional<ProgressionState> state;  // nullopt: definition does not progress
};

struct RollupReport {
    size_t archived = 0;
    size_t cleaned = 0;
};

// ---------------------------------------------------------------------------
// MicrodoseService - one prescribe / complete / skip / harder cycle against a
// data directory. The engine runs outside every lock; only the store calls
// touch the filesystem.
// ---------------------------------------------------------------------------
class MicrodoseService {
public:
    // Throws CatalogValidationError if catalog is inconsistent.
    MicrodoseService(Config cfg, Catalog catalog);

    const Config& config() const { return cfg_; }
    const Catalog& catalog() const { return catalog_; }
    const DataLayout& layout() const { return layout_; }

    UserContext loadContext(Timestamp now) const;

    PrescribedMicrodose prescribe(const UserContext& ctx,
                                  std::optional<MicrodoseCategory> target = std::nullopt) const;

    // Records the skip in ctx only and prescribes again. Nothing is written.
    PrescribedMicrodose skip(UserContext& ctx,
                             const PrescribedMicrodose& shown,
                             Timestamp now,
                             std::optional<MicrodoseCategory> target = std::nullopt) const;

    // Appends the session to the WAL, then records the mobility cursor and
    // seeds the definition's progression entry.
    Session complete(const PrescribedMicrodose& done, Timestamp now);

    HarderResult harder(const PrescribedMicrodose& shown, Timestamp now);

    RollupReport rollup(bool cleanup);

private:
    Config cfg_;
    Catalog catalog_;
    DataLayout layout_;
    SessionWal wal_;
    StateStore state_;
};

} // namespace krep
