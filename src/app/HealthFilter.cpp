#include "app/HealthFilter.hpp"
#include <algorithm>

namespace snapwatch::app {

HealthFilter::HealthFilter(int window)
    : ring_(static_cast<size_t>(window < 1 ? 1 : window), 0) {}

std::optional<bool> HealthFilter::observe(bool raw) {
  if (count_ == ring_.size()) {
    if (ring_[head_]) --trues_;
  } else {
    ++count_;
  }
  ring_[head_] = raw ? 1 : 0;
  if (raw) ++trues_;
  head_ = (head_ + 1) % ring_.size();
  last_raw_ = raw;

  bool v = verdict();
  if (published_ && *published_ == v) return std::nullopt;
  published_ = v;
  return v;
}

bool HealthFilter::verdict() const {
  if (count_ < ring_.size()) return last_raw_;
  // Strict majority: even-window ties resolve to offline
  return trues_ >= ring_.size() / 2 + 1;
}

void HealthFilter::reset() {
  std::fill(ring_.begin(), ring_.end(), uint8_t{0});
  head_ = 0;
  count_ = 0;
  trues_ = 0;
  last_raw_ = false;
  published_.reset();
}

} // namespace snapwatch::app
