#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "collectors/DirectoryScanner.hpp"

namespace snapwatch::app {

struct ArrivalOutcome {
  std::vector<std::string> fresh;                  // sorted names not seen last tick
  bool alert{false};                               // fresh and outside the cooldown
  std::chrono::system_clock::duration remaining{}; // cooldown left when suppressed
};

// Compares successive directory snapshots and gates motion alerts by a
// cooldown. The known set always becomes the latest snapshot, so files that
// arrive during a cooldown are absorbed and never alerted later.
class ArrivalDebouncer {
public:
  using Clock = std::chrono::system_clock;

  explicit ArrivalDebouncer(std::chrono::seconds cooldown = std::chrono::seconds(0));

  // Replace the known set without alerting (startup scan, resync after clear).
  void seed(collectors::FileSet files);

  [[nodiscard]] ArrivalOutcome observe(collectors::FileSet current, Clock::time_point now);

  [[nodiscard]] const collectors::FileSet& known() const { return known_; }
  [[nodiscard]] std::optional<Clock::time_point> last_alarm() const { return last_alarm_; }

private:
  std::chrono::seconds cooldown_;
  collectors::FileSet known_;
  std::optional<Clock::time_point> last_alarm_;
};

} // namespace snapwatch::app
