#include "krep/app/MicrodoseService.hpp"
#include "krep/engine/Progression.hpp"
#include "krep/store/CsvArchive.hpp"
#include "krep/store/History.hpp"
#include "krep/store/StrengthSignal.hpp"
#include "krep/infra/AtomicFile.hpp"
#include "krep/infra/Log.hpp"

namespace krep {

void DataLayout::ensure() const {
    infra::ensureDirectory(walDir());
}

MicrodoseService::MicrodoseService(Config cfg, Catalog catalog)
    : cfg_(std::move(cfg)),
      catalog_(std::move(catalog)),
      layout_{cfg_.data_dir},
      wal_(layout_.walPath()),
      state_(layout_.statePath()) {
    requireValid(catalog_);
    KREP_LOG_DEBUG("SERVICE", "data dir " << layout_.data_dir << ", "
                   << catalog_.microdoses.size() << " microdoses");
}

UserContext MicrodoseService::loadContext(Timestamp now) const {
    UserContext ctx;
    ctx.now = now;
    ctx.user_state = state_.load();
    ctx.external_strength = loadExternalStrength(layout_.strengthPath());
    ctx.recent_sessions = toHistory(loadRecentSessions(layout_.walPath(),
                                                       layout_.archivePath(),
                                                       DEFAULT_HISTORY_DAYS,
                                                       now));
    ctx.equipment_available = cfg_.equipment;
    return ctx;
}

PrescribedMicrodose MicrodoseService::prescribe(const UserContext& ctx,
                                                std::optional<MicrodoseCategory> target) const {
    return prescribeNext(catalog_, ctx, target);
}

PrescribedMicrodose MicrodoseService::skip(UserContext& ctx,
                                           const PrescribedMicrodose& shown,
                                           Timestamp now,
                                           std::optional<MicrodoseCategory> target) const {
    ctx.recent_sessions.insert(ctx.recent_sessions.begin(),
                               ShownButSkipped{shown.definition.id, now});
    KREP_LOG_INFO("SERVICE", "skipped " << shown.definition.id);
    return prescribeNext(catalog_, ctx, target);
}

Session MicrodoseService::complete(const PrescribedMicrodose& done, Timestamp now) {
    Session s;
    s.id = newSessionId();
    s.definition_id = done.definition.id;
    s.performed_at = now;
    s.started_at = now;
    s.completed_at = now;
    s.actual_duration_seconds = done.definition.suggested_duration_seconds;

    layout_.ensure();
    wal_.append(s);

    state_.update([&](UserMicrodoseState& st) {
        if (done.definition.category == MicrodoseCategory::MOBILITY) {
            st.last_mobility_def_id = done.definition.id;
        }
        if (st.progressions.find(done.definition.id) == st.progressions.end()) {
            ProgressionState p;
            p.reps = done.reps.value_or(0);
            p.style = done.style.value_or(MovementStyle::none());
            st.progressions.emplace(done.definition.id, std::move(p));
        }
    });

    KREP_LOG_INFO("SERVICE", "logged " << done.definition.id << " as " << toString(s.id));
    return s;
}

HarderResult MicrodoseService::harder(const PrescribedMicrodose& shown, Timestamp now) {
    HarderResult result;
    layout_.ensure();

    UserMicrodoseState saved = state_.update([&](UserMicrodoseState& st) {
        result.changed = increaseIntensity(catalog_, shown.definition.id, st,
                                           cfg_.progression, now);
    });

    auto it = saved.progressions.find(shown.definition.id);
    if (it != saved.progressions.end()) {
        result.state = it->second;
    }
    return result;
}

RollupReport MicrodoseService::rollup(bool cleanup) {
    RollupReport report;
    report.archived = krep::rollup(layout_.walPath(), layout_.archivePath());
    if (cleanup) {
        report.cleaned = cleanupProcessed(layout_.walDir());
    }
    return report;
}

} // namespace krep
