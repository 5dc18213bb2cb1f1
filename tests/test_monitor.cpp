#include "minitest.hpp"
#include "app/Monitor.hpp"
#include "fakes.hpp"
#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using snapwatch::app::Monitor;
using snapwatch::model::EventKind;
using snapwatch::test::eventually;
using snapwatch::test::Harness;
using snapwatch::test::temp_dir;
using snapwatch::test::touch;

namespace fs = std::filesystem;

TEST(monitor_start_is_exclusive) {
  auto dir = temp_dir("mon_excl");
  Harness h(dir);
  Monitor m(h.deps());
  ASSERT_FALSE(m.stop(100ms));
  ASSERT_TRUE(m.start());
  ASSERT_FALSE(m.start());
  ASSERT_TRUE(m.is_running());
  ASSERT_TRUE(m.stop(2s));
  ASSERT_FALSE(m.is_running());
  ASSERT_FALSE(m.stop(100ms));
  fs::remove_all(dir);
}

TEST(monitor_concurrent_starts_spawn_one_loop) {
  auto dir = temp_dir("mon_race");
  Harness h(dir);
  Monitor m(h.deps());
  std::atomic<int> wins{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i)
    threads.emplace_back([&]{ if (m.start()) ++wins; });
  for (auto& t : threads) t.join();
  ASSERT_EQ(wins.load(), 1);
  ASSERT_TRUE(eventually([&]{ return h.sink->count(EventKind::Started) == 1; }));
  ASSERT_TRUE(m.stop(2s));
  ASSERT_EQ(h.sink->peak_live(), 1);
  fs::remove_all(dir);
}

TEST(monitor_stop_emits_offline_then_stopped) {
  auto dir = temp_dir("mon_stop");
  Harness h(dir);
  Monitor m(h.deps());
  ASSERT_TRUE(m.start());
  ASSERT_TRUE(eventually([&]{ return h.sink->count(EventKind::Online) == 1; }));
  ASSERT_EQ(m.status().webcam_online, std::optional<bool>(true));
  ASSERT_TRUE(m.stop(2s));
  auto names = h.sink->names();
  ASSERT_TRUE(names.size() >= 4);
  ASSERT_EQ(names.front(), "started");
  ASSERT_EQ(names[names.size() - 2], "offline");
  ASSERT_EQ(names.back(), "stopped");
  auto s = m.status();
  ASSERT_FALSE(s.watcher_running);
  ASSERT_TRUE(!s.webcam_online.has_value());
  ASSERT_TRUE(s.last_webcam_change.has_value());
  fs::remove_all(dir);
}

TEST(monitor_restart_after_stop) {
  auto dir = temp_dir("mon_restart");
  Harness h(dir);
  Monitor m(h.deps());
  ASSERT_TRUE(m.start());
  ASSERT_TRUE(m.stop(2s));
  ASSERT_TRUE(m.start());
  ASSERT_TRUE(eventually([&]{ return h.sink->count(EventKind::Started) == 2; }));
  ASSERT_TRUE(m.stop(2s));
  ASSERT_EQ(h.sink->count(EventKind::Stopped), 2u);
  ASSERT_EQ(h.sink->peak_live(), 1);
  fs::remove_all(dir);
}

TEST(monitor_existing_files_are_not_new) {
  auto dir = temp_dir("mon_existing");
  touch(dir / "old.jpg");
  Harness h(dir);
  Monitor m(h.deps());
  ASSERT_TRUE(m.start());
  ASSERT_TRUE(eventually([&]{ return h.sink->count(EventKind::Online) == 1; }));
  std::this_thread::sleep_for(100ms);
  ASSERT_EQ(h.sink->count(EventKind::Motion), 0u);
  ASSERT_EQ(m.status().known_files_count, 1u);
  ASSERT_TRUE(m.stop(2s));
  fs::remove_all(dir);
}

TEST(monitor_new_files_alert_once_per_cooldown) {
  auto dir = temp_dir("mon_motion");
  Harness h(dir);
  Monitor m(h.deps());
  ASSERT_TRUE(m.start());
  ASSERT_TRUE(eventually([&]{ return h.sink->count(EventKind::Started) == 1; }));
  touch(dir / "b.jpg");
  touch(dir / "a.png");
  touch(dir / "ignored.txt");
  ASSERT_TRUE(eventually([&]{ return h.sink->count(EventKind::Motion) >= 1; }));
  ASSERT_TRUE(m.status().last_alarm.has_value());

  touch(dir / "c.jpg");
  ASSERT_TRUE(eventually([&]{ return m.status().known_files_count == 3; }));
  std::this_thread::sleep_for(100ms);
  ASSERT_TRUE(m.stop(2s));

  // The two first files may land in one scan or two; either way only one alert fires
  ASSERT_EQ(h.sink->count(EventKind::Motion), 1u);
  for (const auto& e : h.sink->events()) {
    if (e.kind != EventKind::Motion) continue;
    ASSERT_FALSE(e.files.empty());
    for (const auto& f : e.files) ASSERT_TRUE(f == "a.png" || f == "b.jpg");
  }
  fs::remove_all(dir);
}

TEST(monitor_zero_cooldown_alerts_every_batch) {
  auto dir = temp_dir("mon_nocool");
  Harness h(dir);
  h.cfg->alarm_cooldown = std::chrono::seconds(0);
  Monitor m(h.deps());
  ASSERT_TRUE(m.start());
  ASSERT_TRUE(eventually([&]{ return h.sink->count(EventKind::Started) == 1; }));
  touch(dir / "a.jpg");
  ASSERT_TRUE(eventually([&]{ return h.sink->count(EventKind::Motion) == 1; }));
  touch(dir / "b.jpg");
  ASSERT_TRUE(eventually([&]{ return h.sink->count(EventKind::Motion) == 2; }));
  ASSERT_TRUE(m.stop(2s));
  fs::remove_all(dir);
}

TEST(monitor_probe_flip_emits_once) {
  auto dir = temp_dir("mon_flip");
  Harness h(dir);
  Monitor m(h.deps());
  ASSERT_TRUE(m.start());
  ASSERT_TRUE(eventually([&]{ return h.sink->count(EventKind::Online) == 1; }));
  h.online->store(false);
  ASSERT_TRUE(eventually([&]{ return h.sink->count(EventKind::Offline) == 1; }));
  std::this_thread::sleep_for(100ms);
  ASSERT_EQ(h.sink->count(EventKind::Offline), 1u);
  ASSERT_EQ(m.status().webcam_online, std::optional<bool>(false));
  h.online->store(true);
  ASSERT_TRUE(eventually([&]{ return h.sink->count(EventKind::Online) == 2; }));
  ASSERT_TRUE(m.stop(2s));
  fs::remove_all(dir);
}

TEST(monitor_hysteresis_absorbs_single_failure) {
  auto dir = temp_dir("mon_hyst");
  Harness h(dir);
  h.cfg->hysteresis = 3;
  h.cfg->poll_interval = std::chrono::milliseconds(100);
  Monitor m(h.deps());
  ASSERT_TRUE(m.start());
  // Fill the window with successes
  ASSERT_TRUE(eventually([&]{ return h.sink->count(EventKind::Online) == 1; }));
  std::this_thread::sleep_for(500ms);
  // Shorter than one interval: at most one failed sample
  h.online->store(false);
  std::this_thread::sleep_for(60ms);
  h.online->store(true);
  std::this_thread::sleep_for(400ms);
  ASSERT_EQ(h.sink->count(EventKind::Offline), 0u);
  ASSERT_TRUE(m.stop(2s));
  fs::remove_all(dir);
}

TEST(monitor_missing_watch_dir_exits_quietly) {
  auto dir = temp_dir("mon_missing");
  fs::remove_all(dir);
  Harness h(dir);
  Monitor m(h.deps());
  ASSERT_TRUE(m.start());
  ASSERT_TRUE(eventually([&]{ return !m.is_running(); }));
  ASSERT_EQ(h.sink->count(EventKind::Started), 0u);
  ASSERT_EQ(h.sink->count(EventKind::Stopped), 0u);
  // Can be started again once the directory exists
  fs::create_directories(dir);
  ASSERT_TRUE(m.start());
  ASSERT_TRUE(eventually([&]{ return h.sink->count(EventKind::Started) == 1; }));
  ASSERT_TRUE(m.stop(2s));
  fs::remove_all(dir);
}

TEST(monitor_survives_failing_notifier) {
  auto dir = temp_dir("mon_sinkfail");
  Harness h(dir);
  h.sink->throw_on_send = true;
  Monitor m(h.deps());
  ASSERT_TRUE(m.start());
  ASSERT_TRUE(eventually([&]{ return h.sink->count(EventKind::Started) == 1; }));
  touch(dir / "a.jpg");
  ASSERT_TRUE(eventually([&]{ return h.sink->count(EventKind::Motion) == 1; }));
  ASSERT_TRUE(m.is_running());
  h.sink->throw_on_send = false;
  h.sink->fail_sends = true;
  ASSERT_FALSE(m.test_notify().ok);
  ASSERT_TRUE(m.is_running());
  ASSERT_TRUE(m.stop(2s));
  ASSERT_EQ(h.sink->names().back(), "stopped");
  fs::remove_all(dir);
}

TEST(monitor_test_notify_reports_delivery) {
  auto dir = temp_dir("mon_test");
  Harness h(dir);
  Monitor m(h.deps());
  ASSERT_TRUE(m.test_notify().ok);
  h.sink->fail_sends = true;
  auto res = m.test_notify();
  ASSERT_FALSE(res.ok);
  ASSERT_FALSE(res.error.empty());
  ASSERT_EQ(h.sink->count(EventKind::Test), 2u);
  ASSERT_FALSE(m.is_running());
  fs::remove_all(dir);
}

TEST(monitor_clear_empty_directory) {
  auto dir = temp_dir("mon_clear_empty");
  Harness h(dir);
  Monitor m(h.deps());
  auto res = m.clear_images();
  ASSERT_EQ(res.deleted, 0);
  ASSERT_EQ(res.failed, 0);
  auto events = h.sink->events();
  ASSERT_EQ(events.size(), 1u);
  ASSERT_TRUE(events[0].kind == EventKind::Cleared);
  ASSERT_EQ(events[0].failed, 0);
  fs::remove_all(dir);
}

TEST(monitor_clear_resyncs_known_set) {
  auto dir = temp_dir("mon_clear");
  touch(dir / "a.jpg");
  touch(dir / "b.png");
  touch(dir / "notes.txt");
  Harness h(dir);
  Monitor m(h.deps());
  ASSERT_TRUE(m.start());
  ASSERT_TRUE(eventually([&]{ return h.sink->count(EventKind::Started) == 1; }));
  ASSERT_EQ(m.status().known_files_count, 2u);
  auto res = m.clear_images();
  ASSERT_EQ(res.deleted, 2);
  ASSERT_EQ(m.status().known_files_count, 0u);
  ASSERT_TRUE(fs::exists(dir / "notes.txt"));
  ASSERT_FALSE(fs::exists(dir / "a.jpg"));

  // Deleted files coming back count as new
  touch(dir / "a.jpg");
  ASSERT_TRUE(eventually([&]{ return h.sink->count(EventKind::Motion) == 1; }));
  ASSERT_TRUE(m.stop(2s));
  ASSERT_EQ(h.sink->count(EventKind::Cleared), 1u);
  fs::remove_all(dir);
}

TEST(monitor_writes_status_file) {
  auto dir = temp_dir("mon_statusfile");
  auto watch = dir / "cam";
  fs::create_directories(watch);
  Harness h(watch);
  h.cfg->status_file = dir / "status.json";
  Monitor m(h.deps());
  ASSERT_TRUE(m.start());
  ASSERT_TRUE(eventually([&]{ return fs::exists(dir / "status.json"); }));
  ASSERT_TRUE(m.stop(2s));
  std::ifstream in(dir / "status.json");
  std::stringstream buf;
  buf << in.rdbuf();
  ASSERT_TRUE(buf.str().find("\"known_files_count\":0") != std::string::npos);
  ASSERT_TRUE(buf.str().find("\"webcam_online\":true") != std::string::npos);
  fs::remove_all(dir);
}

TEST(monitor_start_fails_on_bad_config) {
  auto dir = temp_dir("mon_badcfg");
  Harness h(dir);
  auto deps = h.deps();
  auto calls = std::make_shared<int>(0);
  auto cfg = h.cfg;
  deps.load_config = [calls, cfg]{
    if ((*calls)++ > 0) throw std::runtime_error("config went bad");
    return *cfg;
  };
  Monitor m(std::move(deps));
  ASSERT_FALSE(m.start());
  ASSERT_FALSE(m.is_running());
  ASSERT_EQ(h.sink->events().size(), 0u);
  fs::remove_all(dir);
}

TEST(monitor_status_stays_responsive_during_slow_start) {
  auto dir = temp_dir("mon_slowstart");
  Harness h(dir);
  auto deps = h.deps();
  auto calls = std::make_shared<std::atomic<int>>(0);
  auto cfg = h.cfg;
  deps.load_config = [calls, cfg]{
    if ((*calls)++ > 0) std::this_thread::sleep_for(1500ms);
    return *cfg;
  };
  Monitor m(std::move(deps));
  std::atomic<bool> started{false};
  std::thread starter([&]{ started = m.start(); });
  std::this_thread::sleep_for(100ms);

  auto t0 = std::chrono::steady_clock::now();
  auto s = m.status();
  (void)m.is_running();
  (void)m.config();
  auto res = m.clear_images();
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
  ASSERT_TRUE(ms < 200);
  ASSERT_FALSE(s.watcher_running);
  ASSERT_EQ(res.deleted, 0);

  starter.join();
  ASSERT_TRUE(started.load());
  ASSERT_TRUE(m.stop(2s));
  fs::remove_all(dir);
}

TEST(monitor_status_stays_responsive_during_stop) {
  auto dir = temp_dir("mon_slowstop");
  Harness h(dir);
  Monitor m(h.deps());
  ASSERT_TRUE(m.start());
  ASSERT_TRUE(eventually([&]{ return h.sink->count(EventKind::Online) == 1; }));
  h.sink->hold(EventKind::Offline);

  std::atomic<bool> stopped{false};
  std::thread stopper([&]{ stopped = m.stop(5s); });
  ASSERT_TRUE(eventually([&]{ return h.sink->parked(); }));

  // The loop is parked in its exit notification while stop() waits
  auto t0 = std::chrono::steady_clock::now();
  auto s = m.status();
  auto res = m.clear_images();
  ASSERT_TRUE(m.test_notify().ok);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
  ASSERT_TRUE(ms < 200);
  ASSERT_TRUE(s.watcher_running);
  ASSERT_TRUE(!s.webcam_online.has_value());
  ASSERT_EQ(res.failed, 0);

  h.sink->release();
  stopper.join();
  ASSERT_TRUE(stopped.load());
  ASSERT_FALSE(m.is_running());
  ASSERT_EQ(h.sink->names().back(), "stopped");
  fs::remove_all(dir);
}

TEST(monitor_scan_failure_keeps_known_set) {
  auto base = temp_dir("mon_scanfail");
  auto dir = base / "cam";
  auto away = base / "cam.away";
  fs::create_directories(dir);
  touch(dir / "a.jpg");
  Harness h(dir);
  Monitor m(h.deps());
  ASSERT_TRUE(m.start());
  ASSERT_TRUE(eventually([&]{ return h.sink->count(EventKind::Online) == 1; }));
  ASSERT_EQ(m.status().known_files_count, 1u);

  // Several ticks with the directory gone
  fs::rename(dir, away);
  std::this_thread::sleep_for(150ms);
  ASSERT_TRUE(m.is_running());
  ASSERT_EQ(m.status().known_files_count, 1u);
  ASSERT_EQ(h.sink->count(EventKind::Motion), 0u);

  touch(away / "b.jpg");
  fs::rename(away, dir);
  ASSERT_TRUE(eventually([&]{ return h.sink->count(EventKind::Motion) == 1; }));
  std::this_thread::sleep_for(100ms);
  ASSERT_TRUE(m.stop(2s));

  ASSERT_EQ(h.sink->count(EventKind::Motion), 1u);
  for (const auto& e : h.sink->events())
    if (e.kind == EventKind::Motion) ASSERT_EQ(e.files, (std::vector<std::string>{"b.jpg"}));
  fs::remove_all(base);
}
