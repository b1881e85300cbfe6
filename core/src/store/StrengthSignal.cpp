#include "krep/store/StrengthSignal.hpp"
#include "krep/infra/Log.hpp"

#include <boost/json.hpp>

#include <fstream>
#include <iterator>
#include <sys/stat.h>

namespace json = boost::json;

namespace krep {

std::optional<ExternalStrengthSignal> loadExternalStrength(const std::string& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        KREP_LOG_DEBUG("STRENGTH", "no strength signal at " << path);
        return std::nullopt;
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        KREP_LOG_WARN("STRENGTH", "cannot open " << path << ", ignoring signal");
        return std::nullopt;
    }
    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    boost::system::error_code ec;
    json::value root = json::parse(data, ec);
    if (ec || !root.is_object()) {
        KREP_LOG_WARN("STRENGTH", "cannot parse " << path << ", ignoring signal");
        return std::nullopt;
    }

    const auto& obj = root.get_object();
    const auto* at = obj.if_contains("last_session_at");
    const auto* type = obj.if_contains("session_type");
    if (!at || !at->is_string() || !type || !type->is_string()) {
        KREP_LOG_WARN("STRENGTH", path << " lacks last_session_at/session_type, ignoring signal");
        return std::nullopt;
    }

    auto when = infra::parseRfc3339(std::string(at->get_string().c_str()));
    if (!when) {
        KREP_LOG_WARN("STRENGTH", path << ": bad last_session_at, ignoring signal");
        return std::nullopt;
    }

    ExternalStrengthSignal sig;
    sig.last_session_at = *when;
    sig.session_type = parseStrengthSessionType(std::string(type->get_string().c_str()));
    KREP_LOG_INFO("STRENGTH", "last strength session " << infra::formatRfc3339(*when)
                  << " (" << type->get_string().c_str() << ")");
    return sig;
}

} // namespace krep
