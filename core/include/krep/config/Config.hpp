#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace krep {

struct ProgressionConfig {
    int32_t burpee_rep_ceiling = 10;
    int32_t kb_swing_max_reps  = 15;
    int32_t pullup_max_reps    = 8;
};

struct CustomMobilityDrill {
    std::string id;
    std::string name;
    std::optional<std::string> url;
};

struct Config {
    std::string data_dir;
    std::vector<std::string> equipment;
    ProgressionConfig progression;
    std::vector<CustomMobilityDrill> custom_mobility;
};

// Defaults: data dir from XDG_DATA_HOME (or ~/.local/share) + "/krep",
// equipment kettlebell, pullup_bar, bands.
Config defaultConfig();

// $XDG_CONFIG_HOME/krep/config.json, falling back to ~/.config/krep/config.json.
std::string defaultConfigPath();

// Reads the JSON document at path. Every section is optional. A file that
// exists but cannot be parsed or fails validation throws ConfigError.
Config loadConfig(const std::string& path);

// loadConfig(defaultConfigPath()) if that file exists, else defaults. In both
// cases KREP_DATA_DIR, when set, overrides data_dir.
Config loadConfig();

void saveConfig(const std::string& path, const Config& cfg);

// Throws ConfigError on ceilings < 1 or custom drills without an id.
void validate(const Config& cfg);

} // namespace krep
