#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace snapwatch::model {

enum class ProbeMode { Http, Ping };

struct ProbeConfig {
  ProbeMode mode{ProbeMode::Http};
  std::string url;   // http mode
  std::string host;  // ping mode
  std::chrono::milliseconds timeout{3000};
};

// One ntfy message template. Unset fields fall back to [ntfy.defaults].
struct NotifyTemplate {
  std::optional<std::string> title;
  std::optional<std::string> message;
  std::optional<int> priority;
  std::optional<std::vector<std::string>> tags;
};

struct NotifyConfig {
  std::string server;
  std::string topic;
  std::chrono::milliseconds timeout{8000};
  NotifyTemplate defaults;
  std::map<std::string, NotifyTemplate> templates; // event name -> template
};

struct ApiConfig {
  std::string listen_host{"0.0.0.0"};
  uint16_t listen_port{8080};
  bool autostart{true};
};

struct MonitorConfig {
  std::filesystem::path watch_dir;
  std::vector<std::string> extensions; // lower-case, leading '.'
  std::chrono::milliseconds poll_interval{5000};
  std::chrono::seconds alarm_cooldown{600};
  int hysteresis{1};
  ProbeConfig probe;
  NotifyConfig notify;
  ApiConfig api;
  std::string web_url;
  std::filesystem::path status_file; // empty: disabled
  std::vector<std::pair<std::string, std::string>> vars; // [vars] for templates
};

} // namespace snapwatch::model
