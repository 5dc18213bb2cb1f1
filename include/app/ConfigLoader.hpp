#pragma once
#include <stdexcept>
#include <string>
#include "model/Config.hpp"

namespace snapwatch::util { class TomlReader; }

namespace snapwatch::app {

// Upper bound for [webcam_health] hysteresis (samples kept in the window).
inline constexpr int kMaxHysteresis = 1000;

struct ConfigError : public std::runtime_error { using std::runtime_error::runtime_error; };

// Environment variable helpers; SNAPWATCH_X and snapwatch_X are equivalent.
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);

// --config absent: $SNAPWATCH_CONFIG, then XDG/HOME locations. Empty if none.
std::string config_file_path();

// Read, apply environment overrides and validate. Throws ConfigError.
snapwatch::model::MonitorConfig load_config(const std::string& path);

// Same as load_config for an already parsed file.
snapwatch::model::MonitorConfig parse_config(const snapwatch::util::TomlReader& toml);

// Throws ConfigError naming the first violated constraint.
void validate_config(const snapwatch::model::MonitorConfig& cfg);

} // namespace snapwatch::app
