#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace snapwatch::app {

// Majority vote over the last n raw probe samples (fixed-size ring).
// Until n samples have been seen the verdict is the latest raw sample.
// A verdict is published only when it differs from the last published one.
class HealthFilter {
public:
  explicit HealthFilter(int window);

  // Feed one raw sample. Returns the new verdict when it flips (including the
  // first verdict after construction or reset), nullopt while stable.
  [[nodiscard]] std::optional<bool> observe(bool raw);

  // Verdict the current window would produce; does not publish.
  [[nodiscard]] bool verdict() const;

  // Last published verdict; nullopt means unknown.
  [[nodiscard]] std::optional<bool> published() const { return published_; }

  void reset();

  [[nodiscard]] size_t window() const { return ring_.size(); }
  [[nodiscard]] size_t samples() const { return count_; }

private:
  std::vector<uint8_t> ring_;
  size_t head_{0};   // next slot to overwrite
  size_t count_{0};  // min(samples seen, window)
  size_t trues_{0};
  bool last_raw_{false};
  std::optional<bool> published_;
};

} // namespace snapwatch::app
