#include "app/ConfigLoader.hpp"
#include "util/AsciiLower.hpp"
#include "util/TomlReader.hpp"

#include <cmath>
#include <cstdlib>
#include <string>

namespace snapwatch::app {

using snapwatch::model::MonitorConfig;
using snapwatch::model::NotifyTemplate;
using snapwatch::model::ProbeMode;
using snapwatch::util::TomlReader;

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("SNAPWATCH_", 0) == 0) {
    alt = std::string("snapwatch_") + n.substr(10);
  } else if (n.rfind("snapwatch_", 0) == 0) {
    alt = std::string("SNAPWATCH_") + n.substr(10);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  try { return std::stoi(v); } catch (const std::exception&) { return defv; }
}

std::string config_file_path() {
  if (const char* env = getenv_compat("SNAPWATCH_CONFIG")) return env;
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/snapwatch/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/snapwatch/config.toml";
  return {};
}

static std::string require_string(const TomlReader& toml, const char* section, const char* key) {
  auto v = toml.get_string(section, key);
  if (v.empty()) {
    std::string where = (section && *section) ? std::string("[") + section + "] " : std::string();
    throw ConfigError("missing required key: " + where + key);
  }
  return v;
}

static NotifyTemplate parse_template(const TomlReader& toml, const std::string& section) {
  NotifyTemplate t;
  if (toml.has(section, "title")) t.title = toml.get_string(section, "title");
  if (toml.has(section, "message")) t.message = toml.get_string(section, "message");
  if (toml.has(section, "priority")) t.priority = toml.get_int(section, "priority", 3);
  if (toml.has(section, "tags")) t.tags = toml.get_list(section, "tags");
  return t;
}

static std::chrono::milliseconds seconds_to_ms(double s) {
  return std::chrono::milliseconds(static_cast<long long>(std::llround(s * 1000.0)));
}

MonitorConfig parse_config(const TomlReader& toml) {
  MonitorConfig c;
  c.watch_dir = require_string(toml, "", "watch_dir");
  for (auto ext : toml.get_list("", "valid_extensions")) {
    ext = snapwatch::util::ascii_lower(ext);
    if (ext.front() != '.') ext.insert(ext.begin(), '.');
    c.extensions.push_back(ext);
  }
  if (c.extensions.empty()) throw ConfigError("missing required key: valid_extensions");
  c.poll_interval = seconds_to_ms(toml.get_double("", "check_interval_seconds", 5.0));
  c.alarm_cooldown = std::chrono::seconds(
      static_cast<long long>(std::llround(toml.get_double("", "min_alarm_interval_minutes", 10.0) * 60.0)));
  c.web_url = toml.get_string("", "web_url");
  c.status_file = toml.get_string("", "status_file");

  // [webcam_health]
  auto mode = snapwatch::util::ascii_lower(toml.get_string("webcam_health", "mode", "http"));
  if (mode == "http") {
    c.probe.mode = ProbeMode::Http;
    c.probe.url = require_string(toml, "webcam_health", "url");
  } else if (mode == "ping") {
    c.probe.mode = ProbeMode::Ping;
    c.probe.host = require_string(toml, "webcam_health", "host");
  } else {
    throw ConfigError("[webcam_health] mode must be \"http\" or \"ping\", got \"" + mode + "\"");
  }
  c.probe.timeout = seconds_to_ms(toml.get_double("webcam_health", "timeout", 3.0));
  c.hysteresis = toml.get_int("webcam_health", "hysteresis", 1);

  // [api]
  c.api.listen_host = toml.get_string("api", "listen_host", "0.0.0.0");
  int port = toml.get_int("api", "listen_port", 8080);
  if (port < 1 || port > 65535) throw ConfigError("[api] listen_port out of range: " + std::to_string(port));
  c.api.listen_port = static_cast<uint16_t>(port);
  c.api.autostart = toml.get_bool("api", "autostart", true);

  // [ntfy]
  c.notify.server = require_string(toml, "ntfy", "server");
  c.notify.topic = require_string(toml, "ntfy", "topic");
  c.notify.timeout = seconds_to_ms(toml.get_double("ntfy", "timeout", 8.0));
  c.notify.defaults = parse_template(toml, "ntfy.defaults");
  for (const auto& name : toml.child_sections("ntfy.templates"))
    c.notify.templates[name] = parse_template(toml, "ntfy.templates." + name);

  c.vars = toml.entries("vars");

  // Environment overrides
  if (const char* dir = getenv_compat("SNAPWATCH_WATCH_DIR")) c.watch_dir = dir;
  if (int p = getenv_int("SNAPWATCH_API_PORT", 0); p > 0 && p <= 65535)
    c.api.listen_port = static_cast<uint16_t>(p);

  validate_config(c);
  return c;
}

void validate_config(const MonitorConfig& c) {
  if (c.watch_dir.empty()) throw ConfigError("watch_dir must not be empty");
  if (c.extensions.empty()) throw ConfigError("valid_extensions must not be empty");
  if (c.poll_interval.count() <= 0) throw ConfigError("check_interval_seconds must be > 0");
  if (c.alarm_cooldown.count() < 0) throw ConfigError("min_alarm_interval_minutes must be >= 0");
  if (c.hysteresis < 1) throw ConfigError("[webcam_health] hysteresis must be >= 1");
  if (c.hysteresis > kMaxHysteresis)
    throw ConfigError("[webcam_health] hysteresis must be <= " + std::to_string(kMaxHysteresis));
  if (c.probe.timeout.count() <= 0) throw ConfigError("[webcam_health] timeout must be > 0");
}

MonitorConfig load_config(const std::string& path) {
  if (path.empty()) throw ConfigError("no configuration file (use --config or SNAPWATCH_CONFIG)");
  TomlReader toml;
  if (!toml.load(path)) throw ConfigError("cannot read configuration file: " + path);
  try {
    return parse_config(toml);
  } catch (const ConfigError& e) {
    throw ConfigError(path + ": " + e.what());
  }
}

} // namespace snapwatch::app
