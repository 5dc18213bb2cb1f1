#include "minitest.hpp"
#include "app/HealthFilter.hpp"
#include <cstdint>
#include <deque>
#include <optional>

using snapwatch::app::HealthFilter;

TEST(health_first_verdict_always_publishes) {
  HealthFilter f(3);
  ASSERT_TRUE(!f.published().has_value());
  auto v = f.observe(false);
  ASSERT_TRUE(v.has_value());
  ASSERT_EQ(*v, false);
  ASSERT_EQ(f.published(), std::optional<bool>(false));
}

TEST(health_follows_raw_until_window_full) {
  HealthFilter f(3);
  ASSERT_EQ(f.observe(true), std::optional<bool>(true));
  // Only two samples: no smoothing yet, raw wins
  ASSERT_EQ(f.observe(false), std::optional<bool>(false));
  // Third sample fills the window: T F T -> 2 of 3 -> online
  ASSERT_EQ(f.observe(true), std::optional<bool>(true));
  // T F T F window now F T F -> offline
  ASSERT_EQ(f.observe(false), std::optional<bool>(false));
}

TEST(health_single_outlier_is_absorbed) {
  HealthFilter f(3);
  (void)f.observe(true);
  (void)f.observe(true);
  (void)f.observe(true);
  ASSERT_TRUE(!f.observe(false).has_value());
  ASSERT_TRUE(f.verdict());
  ASSERT_TRUE(!f.observe(true).has_value());
}

TEST(health_even_window_tie_is_offline) {
  HealthFilter f(4);
  (void)f.observe(true);
  (void)f.observe(true);
  (void)f.observe(false);
  (void)f.observe(false);
  ASSERT_EQ(f.samples(), 4u);
  ASSERT_FALSE(f.verdict());
  ASSERT_EQ(f.published(), std::optional<bool>(false));
}

TEST(health_stable_input_fires_once) {
  HealthFilter f(3);
  int flips = 0;
  for (int i = 0; i < 20; ++i) if (f.observe(true)) ++flips;
  ASSERT_EQ(flips, 1);
  ASSERT_EQ(f.samples(), 3u);
}

TEST(health_matches_reference_majority) {
  for (int n = 1; n <= 6; ++n) {
    HealthFilter f(n);
    std::deque<bool> last;
    std::optional<bool> published;
    uint32_t seed = 12345u + static_cast<uint32_t>(n);
    int seen = 0, expected_flips = 0, flips = 0;
    for (int i = 0; i < 500; ++i) {
      seed = seed * 1103515245u + 12345u;
      bool raw = ((seed >> 16) % 3) != 0;
      last.push_back(raw);
      if (static_cast<int>(last.size()) > n) last.pop_front();
      ++seen;
      bool expected;
      if (seen < n) {
        expected = raw;
      } else {
        int trues = 0;
        for (bool b : last) trues += b ? 1 : 0;
        expected = trues >= n / 2 + 1;
      }
      if (!published || *published != expected) { ++expected_flips; published = expected; }
      if (f.observe(raw)) ++flips;
      ASSERT_EQ(f.verdict(), expected);
      ASSERT_EQ(f.published(), published);
    }
    ASSERT_EQ(flips, expected_flips);
  }
}

TEST(health_reset_returns_to_unknown) {
  HealthFilter f(2);
  (void)f.observe(true);
  (void)f.observe(true);
  f.reset();
  ASSERT_TRUE(!f.published().has_value());
  ASSERT_EQ(f.samples(), 0u);
  ASSERT_EQ(f.observe(false), std::optional<bool>(false));
}

TEST(health_window_below_one_clamps) {
  HealthFilter f(0);
  ASSERT_EQ(f.window(), 1u);
  ASSERT_EQ(f.observe(true), std::optional<bool>(true));
  ASSERT_EQ(f.observe(false), std::optional<bool>(false));
}
