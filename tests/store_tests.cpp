#include "TestSupport.hpp"

#include "krep/core/Error.hpp"
#include "krep/infra/FileLock.hpp"
#include "krep/store/CsvArchive.hpp"
#include "krep/store/History.hpp"
#include "krep/store/JsonCodec.hpp"
#include "krep/store/SessionWal.hpp"
#include "krep/store/StateStore.hpp"
#include "krep/store/StrengthSignal.hpp"

#include <boost/uuid/random_generator.hpp>

#include <algorithm>
#include <fcntl.h>
#include <filesystem>
#include <set>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

using namespace krep;
using namespace krep::test;

namespace {

// Forked children must not share the parent's generator state.
Session childSession(const std::string& def_id) {
    boost::uuids::random_generator gen;
    Session s = makeSession(def_id, infra::now());
    s.id = gen();
    return s;
}

// Runs body in n children; returns true when all exit 0.
template <typename Body>
bool runChildren(int n, Body body) {
    std::vector<pid_t> pids;
    for (int i = 0; i < n; ++i) {
        pid_t pid = ::fork();
        if (pid == 0) {
            int code = 0;
            try {
                body(i);
            } catch (const std::exception&) {
                code = 1;
            }
            ::_exit(code);
        }
        if (pid < 0) return false;
        pids.push_back(pid);
    }

    bool ok = true;
    for (pid_t pid : pids) {
        int status = 0;
        if (::waitpid(pid, &status, 0) != pid || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
            ok = false;
        }
    }
    return ok;
}

} // namespace

// -----------------------------------------------------------------------------
// JSON codec
// -----------------------------------------------------------------------------
TEST(JsonCodec, SessionLineRoundTrip) {
    Session s = makeSession("gtg_pullup_band", fixedNow() + std::chrono::nanoseconds(17));
    s.metrics_realized.push_back(MetricSpec::band("band", "green", false));
    s.avg_hr = 120;
    s.max_hr = 171;

    const std::string line = codec::encodeSessionLine(s);
    EXPECT_EQ(line.find('\n'), std::string::npos);
    EXPECT_EQ(codec::decodeSessionLine(line), s);
}

TEST(JsonCodec, AbsentOptionalsAreNull) {
    Session s;
    s.id = newSessionId();
    s.definition_id = "mobility_hip_cars";
    s.performed_at = fixedNow();

    const std::string line = codec::encodeSessionLine(s);
    EXPECT_NE(line.find("\"started_at\":null"), std::string::npos);
    EXPECT_EQ(codec::decodeSessionLine(line), s);
}

TEST(JsonCodec, RejectsBadRecords) {
    EXPECT_THROW(codec::decodeSessionLine("{"), SerializationError);
    EXPECT_THROW(codec::decodeSessionLine("[]"), SerializationError);
    EXPECT_THROW(codec::decodeSessionLine(R"({"id":"nope","definition_id":"x","performed_at":"2024-06-01T12:00:00Z"})"),
                 SerializationError);

    Session s = makeSession("emom_burpee_5m", fixedNow());
    std::string line = codec::encodeSessionLine(s);
    line.replace(line.find("\"perceived_rpe\":7"), 17, "\"perceived_rpe\":700");
    EXPECT_THROW(codec::decodeSessionLine(line), SerializationError);
}

TEST(JsonCodec, StateRoundTrip) {
    UserMicrodoseState st;
    st.progressions["emom_burpee_5m"] = {8, MovementStyle::ofBurpee(BurpeeStyle::SIX_COUNT), 7, fixedNow()};
    st.progressions["gtg_pullup_band"] = {4, MovementStyle::ofBand(std::string("red")), 1, std::nullopt};
    st.progressions["emom_kb_swing_5m"] = {9, MovementStyle::none(), 4, std::nullopt};
    st.last_mobility_def_id = "mobility_hip_cars";

    EXPECT_EQ(codec::stateFromJson(codec::toJson(st)), st);
    EXPECT_EQ(codec::stateFromJson(codec::toJson(UserMicrodoseState{})), UserMicrodoseState{});
}

// -----------------------------------------------------------------------------
// WAL
// -----------------------------------------------------------------------------
class SessionWalTest : public TempDirTest {
protected:
    std::string walPath() const { return path("wal/microdose_sessions.wal"); }
};

TEST_F(SessionWalTest, ReadAllReturnsAppendsInOrder) {
    SessionWal wal(walPath());
    std::vector<Session> written;
    for (int i = 0; i < 20; ++i) {
        written.push_back(makeSession(i % 2 ? "emom_burpee_5m" : "gtg_pullup_band",
                                      fixedNow() + std::chrono::minutes(i)));
        wal.append(written.back());
    }
    EXPECT_EQ(wal.readAll(), written);
}

TEST_F(SessionWalTest, MissingFileReadsEmpty) {
    EXPECT_TRUE(SessionWal(walPath()).readAll().empty());
    EXPECT_FALSE(exists(walPath()));
}

TEST_F(SessionWalTest, SkipsMalformedAndBlankLines) {
    Session a = makeSession("emom_burpee_5m", fixedNow());
    Session b = makeSession("gtg_pullup_band", fixedNow());
    writeBytes(walPath(), codec::encodeSessionLine(a) + "\n\n{\"broken\": true}\nnot json\n" +
                          codec::encodeSessionLine(b) + "\n");

    auto got = SessionWal(walPath()).readAll();
    ASSERT_EQ(got.size(), 2u);
    EXPECT_EQ(got[0], a);
    EXPECT_EQ(got[1], b);
}

TEST_F(SessionWalTest, DropsTruncatedFinalRecord) {
    Session a = makeSession("emom_burpee_5m", fixedNow());
    const std::string full = codec::encodeSessionLine(makeSession("x", fixedNow()));
    writeBytes(walPath(), codec::encodeSessionLine(a) + "\n" + full.substr(0, full.size() / 2));

    auto got = SessionWal(walPath()).readAll();
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0], a);
}

TEST_F(SessionWalTest, AppendAfterPartialRecordStartsNewLine) {
    Session a = makeSession("emom_burpee_5m", fixedNow());
    writeBytes(walPath(), codec::encodeSessionLine(a) + "\n{\"id\":\"trunc");

    SessionWal wal(walPath());
    Session b = makeSession("gtg_pullup_band", fixedNow());
    wal.append(b);

    auto got = wal.readAll();
    ASSERT_EQ(got.size(), 2u);
    EXPECT_EQ(got[0], a);
    EXPECT_EQ(got[1], b);
}

TEST_F(SessionWalTest, AppendTimesOutWhileLockedElsewhere) {
    SessionWal wal(walPath(), std::chrono::milliseconds(50));
    wal.append(makeSession("emom_burpee_5m", fixedNow()));
    const std::string before = readBytes(walPath());

    auto fd = infra::openOrThrow(walPath(), O_RDONLY);
    infra::FileLock held(fd.get(), infra::FileLock::Mode::EXCLUSIVE, walPath());

    EXPECT_THROW(wal.append(makeSession("gtg_pullup_band", fixedNow())), LockError);
    EXPECT_EQ(readBytes(walPath()), before);
}

TEST_F(SessionWalTest, ConcurrentAppendersLoseNothing) {
    constexpr int PROCS = 4;
    constexpr int EACH = 25;

    bool ok = runChildren(PROCS, [&](int) {
        SessionWal wal(walPath());
        for (int i = 0; i < EACH; ++i) {
            wal.append(childSession("emom_kb_swing_5m"));
        }
    });
    ASSERT_TRUE(ok);

    auto got = SessionWal(walPath()).readAll();
    ASSERT_EQ(got.size(), static_cast<size_t>(PROCS * EACH));

    std::set<std::string> ids;
    for (const auto& s : got) ids.insert(toString(s.id));
    EXPECT_EQ(ids.size(), got.size());

    // Every line is a complete record.
    const std::string bytes = readBytes(walPath());
    EXPECT_EQ(static_cast<size_t>(std::count(bytes.begin(), bytes.end(), '\n')), got.size());
}

// -----------------------------------------------------------------------------
// State store
// -----------------------------------------------------------------------------
class StateStoreTest : public TempDirTest {
protected:
    std::string statePath() const { return path("wal/state.json"); }

    static UserMicrodoseState sample() {
        UserMicrodoseState st;
        st.progressions["emom_burpee_5m"] = {10, MovementStyle::ofBurpee(BurpeeStyle::FOUR_COUNT), 7, fixedNow()};
        st.last_mobility_def_id = "mobility_shoulder_cars";
        return st;
    }
};

TEST_F(StateStoreTest, MissingFileLoadsDefault) {
    EXPECT_EQ(StateStore(statePath()).load(), UserMicrodoseState{});
}

TEST_F(StateStoreTest, LoadReturnsWhatWasSaved) {
    StateStore store(statePath());
    store.save(sample());
    EXPECT_EQ(store.load(), sample());
}

TEST_F(StateStoreTest, CorruptFileDegradesToDefault) {
    writeBytes(statePath(), "{\"progressions\": {\"emom_burpee_5m\": {\"reps\": ");
    EXPECT_EQ(StateStore(statePath()).load(), UserMicrodoseState{});

    writeBytes(statePath(), "");
    EXPECT_EQ(StateStore(statePath()).load(), UserMicrodoseState{});
}

TEST_F(StateStoreTest, InterruptedSaveLeavesPreviousStateVisible) {
    StateStore store(statePath());
    store.save(sample());

    // What a crash between write and rename leaves behind.
    writeBytes(statePath() + ".tmp.Ab12Cd", "{\"progressions\": {\"half");
    EXPECT_EQ(store.load(), sample());

    UserMicrodoseState next = sample();
    next.last_mobility_def_id = "mobility_hip_cars";
    store.save(next);
    EXPECT_EQ(store.load(), next);
}

TEST_F(StateStoreTest, UpdateAppliesMutatorAndPersists) {
    StateStore store(statePath());
    store.save(sample());

    auto saved = store.update([](UserMicrodoseState& st) {
        st.progressions["emom_burpee_5m"].reps = 4;
        st.last_mobility_def_id.reset();
    });

    EXPECT_EQ(saved.progressions.at("emom_burpee_5m").reps, 4);
    EXPECT_FALSE(saved.last_mobility_def_id.has_value());
    EXPECT_EQ(store.load(), saved);
}

TEST_F(StateStoreTest, UpdateOnCorruptFileStartsFromDefault) {
    writeBytes(statePath(), "garbage");
    StateStore store(statePath());
    auto saved = store.update([](UserMicrodoseState& st) {
        st.last_mobility_def_id = "mobility_hip_cars";
    });
    EXPECT_TRUE(saved.progressions.empty());
    EXPECT_EQ(store.load(), saved);
}

TEST_F(StateStoreTest, LockedStoreFailsWritesAndDegradesReads) {
    StateStore store(statePath(), std::chrono::milliseconds(50));
    store.save(sample());

    auto fd = infra::openOrThrow(store.lockPath(), O_RDWR | O_CREAT);
    infra::FileLock held(fd.get(), infra::FileLock::Mode::EXCLUSIVE, store.lockPath());

    EXPECT_THROW(store.save(UserMicrodoseState{}), LockError);
    EXPECT_THROW(store.update([](UserMicrodoseState&) {}), LockError);
    EXPECT_EQ(store.load(), UserMicrodoseState{});

    held.release();
    EXPECT_EQ(store.load(), sample());
}

// -----------------------------------------------------------------------------
// Archive and rollup
// -----------------------------------------------------------------------------
class RollupTest : public TempDirTest {
protected:
    std::string walPath() const { return path("wal/microdose_sessions.wal"); }
    std::string archivePath() const { return path("sessions.csv"); }
};

TEST_F(RollupTest, MovesEverySessionAndRenamesWal) {
    SessionWal wal(walPath());
    std::vector<Session> written;
    for (int i = 0; i < 3; ++i) {
        written.push_back(makeSession("emom_burpee_5m", fixedNow() + std::chrono::hours(i)));
        wal.append(written.back());
    }
    const std::string bytes = readBytes(walPath());

    EXPECT_EQ(rollup(walPath(), archivePath()), 3u);
    EXPECT_FALSE(exists(walPath()));
    ASSERT_TRUE(exists(walPath() + ".processed"));
    EXPECT_EQ(readBytes(walPath() + ".processed"), bytes);

    auto archived = readArchive(archivePath());
    ASSERT_EQ(archived.size(), 3u);
    for (size_t i = 0; i < 3; ++i) {
        EXPECT_EQ(archived[i].id, written[i].id);
        EXPECT_EQ(archived[i].definition_id, written[i].definition_id);
        EXPECT_EQ(archived[i].performed_at, written[i].performed_at);
        EXPECT_EQ(archived[i].completed_at, written[i].completed_at);
        EXPECT_EQ(archived[i].actual_duration_seconds, written[i].actual_duration_seconds);
        EXPECT_EQ(archived[i].perceived_rpe, written[i].perceived_rpe);
        EXPECT_TRUE(archived[i].metrics_realized.empty());
    }
}

TEST_F(RollupTest, HeaderWrittenOnceAndProcessedNamesDoNotCollide) {
    SessionWal wal(walPath());
    wal.append(makeSession("emom_burpee_5m", fixedNow()));
    EXPECT_EQ(rollup(walPath(), archivePath()), 1u);

    wal.append(makeSession("gtg_pullup_band", fixedNow()));
    wal.append(makeSession("mobility_hip_cars", fixedNow()));
    EXPECT_EQ(rollup(walPath(), archivePath()), 2u);

    EXPECT_TRUE(exists(walPath() + ".processed"));
    EXPECT_TRUE(exists(path("wal/microdose_sessions.1.wal.processed")));

    const std::string csv = readBytes(archivePath());
    EXPECT_EQ(csv.find(ARCHIVE_HEADER), 0u);
    EXPECT_EQ(csv.find(ARCHIVE_HEADER, 1), std::string::npos);
    EXPECT_EQ(readArchive(archivePath()).size(), 3u);
}

TEST_F(RollupTest, EmptyOrMissingWalIsNoOp) {
    EXPECT_EQ(rollup(walPath(), archivePath()), 0u);

    writeBytes(walPath(), "");
    EXPECT_EQ(rollup(walPath(), archivePath()), 0u);
    EXPECT_TRUE(exists(walPath()));
    EXPECT_FALSE(exists(archivePath()));
    EXPECT_FALSE(exists(walPath() + ".processed"));
}

TEST_F(RollupTest, CleanupIsIdempotent) {
    writeBytes(path("wal/a.wal.processed"), "a\n");
    writeBytes(path("wal/b.1.wal.processed"), "b\n");
    writeBytes(path("wal/microdose_sessions.wal"), "live\n");
    writeBytes(path("wal/state.json"), "{}");

    EXPECT_EQ(cleanupProcessed(path("wal")), 2u);
    EXPECT_EQ(cleanupProcessed(path("wal")), 0u);
    EXPECT_TRUE(exists(path("wal/microdose_sessions.wal")));
    EXPECT_TRUE(exists(path("wal/state.json")));
    EXPECT_EQ(cleanupProcessed(path("nowhere")), 0u);
}

TEST_F(RollupTest, ArchiveRowsQuoteAndLeaveOptionalsEmpty) {
    Session s;
    s.id = newSessionId();
    s.definition_id = "odd,\"name\"";
    s.performed_at = fixedNow();

    const std::string row = encodeArchiveRow(s);
    EXPECT_NE(row.find("\"odd,\"\"name\"\"\""), std::string::npos);
    EXPECT_EQ(row.substr(row.size() - 6), ",,,,,,");

    auto records = splitCsv(std::string(ARCHIVE_HEADER) + "\n" + row + "\n");
    ASSERT_EQ(records.size(), 2u);
    Session back = decodeArchiveRow(records[1]);
    EXPECT_EQ(back.definition_id, s.definition_id);
    EXPECT_FALSE(back.started_at.has_value());
    EXPECT_FALSE(back.actual_duration_seconds.has_value());
    EXPECT_FALSE(back.max_hr.has_value());
}

TEST_F(RollupTest, ReadArchiveSkipsBadRows) {
    Session good = makeSession("emom_burpee_5m", fixedNow());
    writeBytes(archivePath(), std::string(ARCHIVE_HEADER) + "\n" +
                              "garbage,row\n" +
                              "not-a-uuid,emom_burpee_5m,2024-06-01T12:00:00Z,,,,,,\n" +
                              encodeArchiveRow(good) + "\n" +
                              toString(newSessionId()) + ",x,yesterday,,,,,,\n" +
                              toString(newSessionId()) + ",x,2024-06-01T12:00:00Z,,,300,7,999,\n");

    auto got = readArchive(archivePath());
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0].id, good.id);
}

TEST_F(RollupTest, ConcurrentAppendsSurviveRollup) {
    constexpr int PROCS = 3;
    constexpr int EACH = 30;

    pid_t roller = ::fork();
    if (roller == 0) {
        int code = 0;
        try {
            for (int i = 0; i < 40; ++i) {
                rollup(walPath(), archivePath());
                ::usleep(2000);
            }
        } catch (const std::exception&) {
            code = 1;
        }
        ::_exit(code);
    }
    ASSERT_GT(roller, 0);

    bool ok = runChildren(PROCS, [&](int) {
        SessionWal wal(walPath());
        for (int i = 0; i < EACH; ++i) {
            wal.append(childSession("emom_kb_swing_5m"));
        }
    });

    int status = 0;
    ASSERT_EQ(::waitpid(roller, &status, 0), roller);
    ASSERT_TRUE(WIFEXITED(status) && WEXITSTATUS(status) == 0);
    ASSERT_TRUE(ok);

    std::set<std::string> ids;
    size_t total = 0;
    for (const auto& s : readArchive(archivePath())) {
        ids.insert(toString(s.id));
        ++total;
    }
    for (const auto& s : SessionWal(walPath()).readAll()) {
        ids.insert(toString(s.id));
        ++total;
    }
    EXPECT_EQ(total, static_cast<size_t>(PROCS * EACH));
    EXPECT_EQ(ids.size(), static_cast<size_t>(PROCS * EACH));
}

// -----------------------------------------------------------------------------
// History
// -----------------------------------------------------------------------------
class HistoryTest : public RollupTest {};

TEST_F(HistoryTest, BothSourcesMissingGivesEmpty) {
    EXPECT_TRUE(loadRecentSessions(walPath(), archivePath(), 7, fixedNow()).empty());
}

TEST_F(HistoryTest, WindowAndOrdering) {
    SessionWal wal(walPath());
    Session old = makeSession("emom_burpee_5m", fixedNow() - infra::days(8));
    Session mid = makeSession("gtg_pullup_band", fixedNow() - infra::days(6));
    wal.append(old);
    wal.append(mid);
    ASSERT_EQ(rollup(walPath(), archivePath()), 2u);

    Session recent = makeSession("mobility_hip_cars", fixedNow() - infra::hours(1));
    Session middle = makeSession("emom_kb_swing_5m", fixedNow() - infra::days(2));
    wal.append(recent);
    wal.append(middle);

    auto got = loadRecentSessions(walPath(), archivePath(), 7, fixedNow());
    ASSERT_EQ(got.size(), 3u);
    EXPECT_EQ(got[0].id, recent.id);
    EXPECT_EQ(got[1].id, middle.id);
    EXPECT_EQ(got[2].id, mid.id);
}

TEST_F(HistoryTest, DuplicateKeepsWalCopy) {
    SessionWal wal(walPath());
    Session s = makeSession("emom_burpee_5m", fixedNow() - infra::hours(3));
    wal.append(s);
    ASSERT_EQ(rollup(walPath(), archivePath()), 1u);

    s.perceived_rpe = 9;
    wal.append(s);

    auto got = loadRecentSessions(walPath(), archivePath(), 7, fixedNow());
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0].perceived_rpe, std::optional<uint8_t>(9));
    EXPECT_EQ(got[0].metrics_realized.size(), 1u);
}

TEST_F(HistoryTest, FindLastByCategorySeesSkips) {
    std::vector<SessionKind> history;
    history.emplace_back(ShownButSkipped{"emom_kb_swing_5m", fixedNow()});
    history.emplace_back(makeSession("gtg_pullup_band", fixedNow() - infra::hours(1)));
    history.emplace_back(makeSession("emom_burpee_5m", fixedNow() - infra::hours(2)));

    const Catalog& c = defaultCatalog();
    const SessionKind* vo2 = findLastByCategory(c, history, MicrodoseCategory::VO2);
    ASSERT_NE(vo2, nullptr);
    EXPECT_EQ(definitionIdOf(*vo2), "emom_kb_swing_5m");
    EXPECT_EQ(asReal(*vo2), nullptr);

    const SessionKind* gtg = findLastByCategory(c, history, MicrodoseCategory::GTG);
    ASSERT_NE(gtg, nullptr);
    EXPECT_EQ(definitionIdOf(*gtg), "gtg_pullup_band");
    EXPECT_EQ(findLastByCategory(c, history, MicrodoseCategory::MOBILITY), nullptr);
}

// -----------------------------------------------------------------------------
// Strength signal
// -----------------------------------------------------------------------------
class StrengthSignalTest : public TempDirTest {
protected:
    std::string signalPath() const { return path("strength/signal.json"); }
};

TEST_F(StrengthSignalTest, ReadsSignal) {
    writeBytes(signalPath(), R"({"last_session_at": "2024-06-01T10:00:00Z", "session_type": "Lower"})");
    auto sig = loadExternalStrength(signalPath());
    ASSERT_TRUE(sig.has_value());
    EXPECT_EQ(sig->last_session_at, fixedNow() - infra::hours(2));
    EXPECT_EQ(sig->session_type, StrengthSessionType::lower());

    writeBytes(signalPath(), R"({"last_session_at": "2024-06-01T10:00:00+00:00", "session_type": "full_body"})");
    sig = loadExternalStrength(signalPath());
    ASSERT_TRUE(sig.has_value());
    EXPECT_EQ(sig->session_type, StrengthSessionType::full());
}

TEST_F(StrengthSignalTest, BadInputIsIgnored) {
    EXPECT_FALSE(loadExternalStrength(signalPath()).has_value());

    writeBytes(signalPath(), "{ nope");
    EXPECT_FALSE(loadExternalStrength(signalPath()).has_value());

    writeBytes(signalPath(), R"({"session_type": "lower"})");
    EXPECT_FALSE(loadExternalStrength(signalPath()).has_value());

    writeBytes(signalPath(), R"({"last_session_at": "last tuesday", "session_type": "lower"})");
    EXPECT_FALSE(loadExternalStrength(signalPath()).has_value());
}
