#pragma once
#include <string>
#include <vector>

namespace snapwatch::model {

enum class EventKind { Started, Stopped, Online, Offline, Motion, Cleared, Test };

inline const char* to_string(EventKind k) {
  switch (k) {
    case EventKind::Started: return "started";
    case EventKind::Stopped: return "stopped";
    case EventKind::Online:  return "online";
    case EventKind::Offline: return "offline";
    case EventKind::Motion:  return "motion";
    case EventKind::Cleared: return "cleared";
    case EventKind::Test:    return "test";
  }
  return "unknown";
}

// Payload fields are only meaningful for the kinds noted.
struct Event {
  EventKind kind{EventKind::Test};
  std::vector<std::string> files; // motion: sorted new filenames
  int deleted{0};                 // cleared
  int failed{0};                  // cleared
  std::string error;              // cleared: scan error, if any
};

// Outcome of one delivery attempt. Failures are routine and never thrown.
struct NotifyResult {
  bool ok{false};
  std::string error;
};

} // namespace snapwatch::model
