#include "krep/store/StateStore.hpp"
#include "krep/store/JsonCodec.hpp"
#include "krep/core/Error.hpp"
#include "krep/infra/AtomicFile.hpp"
#include "krep/infra/FileLock.hpp"
#include "krep/infra/Log.hpp"

#include <boost/json.hpp>

#include <cerrno>
#include <fcntl.h>

namespace json = boost::json;

namespace krep {

StateStore::StateStore(std::string path, std::chrono::milliseconds lock_timeout)
    : path_(std::move(path)), lock_timeout_(lock_timeout) {}

UserMicrodoseState StateStore::load() const {
    try {
        infra::UniqueFd lock_fd;
        try {
            lock_fd = infra::openOrThrow(lockPath(), O_RDWR | O_CREAT);
        } catch (const IoError& e) {
            // No directory yet: nothing was ever saved.
            if (e.code() != ENOENT) throw;
            KREP_LOG_DEBUG("STATE", infra::parentDirectory(path_) << " does not exist, default state");
            return {};
        }
        infra::FileLock lock(lock_fd.get(), infra::FileLock::Mode::SHARED,
                             lockPath(), lock_timeout_);
        return loadUnlocked();
    } catch (const Error& e) {
        KREP_LOG_WARN("STATE", "cannot read " << path_ << " (" << e.what()
                      << "), using default state");
        return {};
    }
}

void StateStore::save(const UserMicrodoseState& state) const {
    infra::ensureDirectory(infra::parentDirectory(path_));
    infra::UniqueFd lock_fd = infra::openOrThrow(lockPath(), O_RDWR | O_CREAT);
    infra::FileLock lock(lock_fd.get(), infra::FileLock::Mode::EXCLUSIVE,
                         lockPath(), lock_timeout_);
    saveUnlocked(state);
}

UserMicrodoseState StateStore::update(const Mutator& mutate) const {
    infra::ensureDirectory(infra::parentDirectory(path_));
    infra::UniqueFd lock_fd = infra::openOrThrow(lockPath(), O_RDWR | O_CREAT);
    infra::FileLock lock(lock_fd.get(), infra::FileLock::Mode::EXCLUSIVE,
                         lockPath(), lock_timeout_);

    UserMicrodoseState state;
    try {
        state = loadUnlocked();
    } catch (const Error& e) {
        KREP_LOG_WARN("STATE", "cannot read " << path_ << " (" << e.what()
                      << "), starting from default state");
    }

    mutate(state);
    saveUnlocked(state);
    return state;
}

// Missing file -> default. Damaged content -> SerializationError.
UserMicrodoseState StateStore::loadUnlocked() const {
    infra::UniqueFd fd;
    try {
        fd = infra::openOrThrow(path_, O_RDONLY);
    } catch (const IoError& e) {
        if (e.code() == ENOENT) {
            KREP_LOG_DEBUG("STATE", path_ << " does not exist, default state");
            return {};
        }
        throw;
    }

    std::string bytes;
    infra::readFile(fd.get(), bytes, path_);

    boost::system::error_code ec;
    json::value root = json::parse(bytes, ec);
    if (ec) {
        throw SerializationError(path_ + ": " + ec.message());
    }
    UserMicrodoseState state = codec::stateFromJson(root);
    KREP_LOG_DEBUG("STATE", "loaded " << state.progressions.size()
                   << " progressions from " << path_);
    return state;
}

void StateStore::saveUnlocked(const UserMicrodoseState& state) const {
    infra::writeFileAtomic(path_, json::serialize(codec::toJson(state)) + "\n");
    KREP_LOG_DEBUG("STATE", "saved " << state.progressions.size()
                   << " progressions to " << path_);
}

} // namespace krep
