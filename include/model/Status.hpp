#pragma once
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace snapwatch::model {

using Clock = std::chrono::system_clock;

struct StatusSnapshot {
  Clock::time_point timestamp{};
  bool watcher_running{false};
  std::optional<bool> webcam_online;
  std::optional<Clock::time_point> last_alarm;
  std::optional<Clock::time_point> last_webcam_change;
  size_t known_files_count{0};
};

struct ClearResult {
  int deleted{0};
  int failed{0};
  std::string error; // set when the directory itself could not be scanned
};

} // namespace snapwatch::model
