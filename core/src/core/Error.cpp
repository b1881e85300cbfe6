#include "krep/core/Error.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

namespace krep {

IoError::IoError(const std::string& what, int err)
    : Error(what + ": " + std::strerror(err)),
      errno_(err) {}

bool IoError::retryable() const noexcept {
    return errno_ == EAGAIN || errno_ == EINTR || errno_ == EBUSY;
}

static std::string joinProblems(const std::vector<std::string>& problems) {
    std::string msg = "catalog validation failed";
    for (const auto& p : problems) {
        msg += "\n  - ";
        msg += p;
    }
    return msg;
}

CatalogValidationError::CatalogValidationError(std::vector<std::string> problems)
    : Error(joinProblems(problems)),
      problems_(std::move(problems)) {}

} // namespace krep
