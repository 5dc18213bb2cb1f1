#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include "app/ArrivalDebouncer.hpp"
#include "app/EventEmitter.hpp"
#include "app/HealthFilter.hpp"
#include "collectors/IProbe.hpp"
#include "model/Config.hpp"
#include "model/Event.hpp"
#include "model/Status.hpp"

namespace snapwatch::app {

// Collaborators the monitor rebuilds from a fresh configuration on every start.
struct MonitorDeps {
  std::function<snapwatch::model::MonitorConfig()> load_config;
  std::function<std::unique_ptr<snapwatch::collectors::IProbe>(const snapwatch::model::MonitorConfig&)> make_probe;
  std::function<std::shared_ptr<INotifier>(const snapwatch::model::MonitorConfig&)> make_notifier;
};

// Owns the watcher loop and guarantees at most one live loop at a time.
// All public operations are safe to call from any thread, concurrently with
// each other and with the loop; status() never waits on the loop.
class Monitor {
public:
  // Loads the configuration once so clear/test work before the first start.
  // Throws whatever deps.load_config throws (ConfigError).
  explicit Monitor(MonitorDeps deps);
  ~Monitor();
  Monitor(const Monitor&) = delete;
  Monitor& operator=(const Monitor&) = delete;

  // False if a loop is already running or the configuration fails to load.
  bool start();

  // False if nothing was running, or the loop did not exit within timeout.
  bool stop(std::chrono::milliseconds timeout);

  [[nodiscard]] bool is_running() const;
  [[nodiscard]] snapwatch::model::StatusSnapshot status() const;

  // Delete every accepted file in the watch directory and resync the known set.
  snapwatch::model::ClearResult clear_images();

  snapwatch::model::NotifyResult test_notify();

  [[nodiscard]] snapwatch::model::MonitorConfig config() const;

private:
  void run(std::stop_token st, snapwatch::model::MonitorConfig cfg,
           std::unique_ptr<snapwatch::collectors::IProbe> probe, EventEmitter emitter);
  void tick(const snapwatch::model::MonitorConfig& cfg, snapwatch::collectors::IProbe& probe,
            HealthFilter& health, const EventEmitter& emitter);
  bool wait_for_tick(std::stop_token& st, std::chrono::milliseconds interval);
  void on_loop_exit(const EventEmitter& emitter);
  void finish_run();

  MonitorDeps deps_;
  std::mutex lifecycle_mtx_;        // serializes start/stop; guards thread_

  mutable std::mutex mtx_;          // guards everything below up to clear_mtx_
  std::condition_variable exit_cv_; // loop cleared running_
  snapwatch::model::MonitorConfig cfg_;
  EventEmitter emitter_;
  bool running_{false};
  uint64_t run_id_{0};
  ArrivalDebouncer arrivals_;
  uint64_t known_generation_{0};    // bumped whenever the known set is replaced out of band
  std::optional<bool> webcam_online_;
  std::optional<snapwatch::model::Clock::time_point> last_change_;

  std::mutex clear_mtx_;            // serializes clear_images callers
  std::mutex wake_mtx_;
  std::condition_variable_any wake_cv_;

  // Declared last: destroyed (stop requested, joined) before the state above
  std::jthread thread_{};
};

} // namespace snapwatch::app
