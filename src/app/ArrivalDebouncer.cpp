#include "app/ArrivalDebouncer.hpp"
#include <algorithm>
#include <iterator>

namespace snapwatch::app {

ArrivalDebouncer::ArrivalDebouncer(std::chrono::seconds cooldown)
    : cooldown_(cooldown < std::chrono::seconds(0) ? std::chrono::seconds(0) : cooldown) {}

void ArrivalDebouncer::seed(collectors::FileSet files) { known_ = std::move(files); }

ArrivalOutcome ArrivalDebouncer::observe(collectors::FileSet current, Clock::time_point now) {
  ArrivalOutcome out;
  std::set_difference(current.begin(), current.end(), known_.begin(), known_.end(),
                      std::back_inserter(out.fresh));
  if (!out.fresh.empty()) {
    if (!last_alarm_ || now - *last_alarm_ >= cooldown_) {
      out.alert = true;
      last_alarm_ = now;
    } else {
      out.remaining = cooldown_ - (now - *last_alarm_);
    }
  }
  // Deletions simply fall out; suppressed arrivals become known
  known_ = std::move(current);
  return out;
}

} // namespace snapwatch::app
