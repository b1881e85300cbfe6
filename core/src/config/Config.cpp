#include "krep/config/Config.hpp"
#include "krep/core/Error.hpp"
#include "krep/infra/AtomicFile.hpp"
#include "krep/infra/Log.hpp"

#include <boost/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace json = boost::json;
namespace fs = std::filesystem;

namespace krep {

static std::string homeDir() {
    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') {
        throw ConfigError("HOME environment variable not set");
    }
    return home;
}

static std::string xdgDir(const char* var, const char* fallback) {
    const char* v = std::getenv(var);
    if (v != nullptr && *v != '\0') {
        return v;
    }
    return homeDir() + "/" + fallback;
}

Config defaultConfig() {
    Config cfg;
    cfg.data_dir = xdgDir("XDG_DATA_HOME", ".local/share") + "/krep";
    cfg.equipment = {"kettlebell", "pullup_bar", "bands"};
    return cfg;
}

std::string defaultConfigPath() {
    return xdgDir("XDG_CONFIG_HOME", ".config") + "/krep/config.json";
}

void validate(const Config& cfg) {
    if (cfg.progression.burpee_rep_ceiling < 1) {
        throw ConfigError("progression.burpee_rep_ceiling must be >= 1");
    }
    if (cfg.progression.kb_swing_max_reps < 1) {
        throw ConfigError("progression.kb_swing_max_reps must be >= 1");
    }
    if (cfg.progression.pullup_max_reps < 1) {
        throw ConfigError("progression.pullup_max_reps must be >= 1");
    }
    for (const auto& drill : cfg.custom_mobility) {
        if (drill.id.empty()) {
            throw ConfigError("mobility.custom entry has an empty id");
        }
    }
}

static int32_t readInt(const json::object& obj, const char* key, int32_t fallback) {
    auto it = obj.find(key);
    if (it == obj.end()) return fallback;
    if (!it->value().is_int64()) {
        throw ConfigError(std::string("'") + key + "' must be an integer");
    }
    return static_cast<int32_t>(it->value().as_int64());
}

static std::string readString(const json::object& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->value().is_string()) {
        throw ConfigError(std::string("'") + key + "' must be a string");
    }
    return std::string(it->value().as_string().c_str());
}

static Config fromJson(const json::object& root) {
    Config cfg = defaultConfig();

    if (auto* data = root.if_contains("data")) {
        const auto& obj = data->as_object();
        if (obj.contains("data_dir")) {
            cfg.data_dir = readString(obj, "data_dir");
        }
    }

    if (auto* equip = root.if_contains("equipment")) {
        const auto& obj = equip->as_object();
        if (auto* avail = obj.if_contains("available")) {
            cfg.equipment.clear();
            for (const auto& v : avail->as_array()) {
                cfg.equipment.emplace_back(v.as_string().c_str());
            }
        }
    }

    if (auto* prog = root.if_contains("progression")) {
        const auto& obj = prog->as_object();
        cfg.progression.burpee_rep_ceiling =
            readInt(obj, "burpee_rep_ceiling", cfg.progression.burpee_rep_ceiling);
        cfg.progression.kb_swing_max_reps =
            readInt(obj, "kb_swing_max_reps", cfg.progression.kb_swing_max_reps);
        cfg.progression.pullup_max_reps =
            readInt(obj, "pullup_max_reps", cfg.progression.pullup_max_reps);
    }

    if (auto* mob = root.if_contains("mobility")) {
        const auto& obj = mob->as_object();
        if (auto* custom = obj.if_contains("custom")) {
            for (const auto& v : custom->as_array()) {
                const auto& d = v.as_object();
                CustomMobilityDrill drill;
                drill.id = readString(d, "id");
                drill.name = readString(d, "name");
                if (auto* url = d.if_contains("url"); url && url->is_string()) {
                    drill.url = std::string(url->as_string().c_str());
                }
                cfg.custom_mobility.push_back(std::move(drill));
            }
        }
    }

    return cfg;
}

Config loadConfig(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ConfigError("cannot open config file " + path);
    }
    std::string data((std::istreambuf_iterator<char>(in)),
                     std::istreambuf_iterator<char>());

    Config cfg;
    try {
        json::value root = json::parse(data);
        cfg = fromJson(root.as_object());
    } catch (const std::exception& e) {
        throw ConfigError(path + ": " + e.what());
    }

    validate(cfg);
    KREP_LOG_INFO("CONFIG", "loaded " << path);
    return cfg;
}

Config loadConfig() {
    const std::string path = defaultConfigPath();
    Config cfg;
    if (fs::exists(path)) {
        cfg = loadConfig(path);
    } else {
        KREP_LOG_DEBUG("CONFIG", "no config at " << path << ", using defaults");
        cfg = defaultConfig();
    }

    if (const char* dir = std::getenv("KREP_DATA_DIR"); dir != nullptr && *dir != '\0') {
        cfg.data_dir = dir;
    }
    return cfg;
}

void saveConfig(const std::string& path, const Config& cfg) {
    validate(cfg);

    json::object root;

    json::object data;
    data["data_dir"] = cfg.data_dir;
    root["data"] = data;

    json::array avail;
    for (const auto& e : cfg.equipment) avail.emplace_back(e);
    json::object equip;
    equip["available"] = avail;
    root["equipment"] = equip;

    json::object prog;
    prog["burpee_rep_ceiling"] = cfg.progression.burpee_rep_ceiling;
    prog["kb_swing_max_reps"] = cfg.progression.kb_swing_max_reps;
    prog["pullup_max_reps"] = cfg.progression.pullup_max_reps;
    root["progression"] = prog;

    json::array custom;
    for (const auto& d : cfg.custom_mobility) {
        json::object o;
        o["id"] = d.id;
        o["name"] = d.name;
        if (d.url) o["url"] = *d.url;
        custom.push_back(o);
    }
    json::object mob;
    mob["custom"] = custom;
    root["mobility"] = mob;

    infra::writeFileAtomic(path, json::serialize(root) + "\n");
    KREP_LOG_INFO("CONFIG", "saved " << path);
}

} // namespace krep
