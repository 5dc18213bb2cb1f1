#include "app/Monitor.hpp"
#include "app/StatusFile.hpp"
#include "collectors/DirectoryScanner.hpp"

#include <cstdio>
#include <exception>
#include <string>

using namespace std::chrono;

namespace snapwatch::app {

using snapwatch::collectors::FileSet;
using snapwatch::model::ClearResult;
using snapwatch::model::Clock;
using snapwatch::model::Event;
using snapwatch::model::EventKind;
using snapwatch::model::MonitorConfig;
using snapwatch::model::NotifyResult;
using snapwatch::model::StatusSnapshot;

Monitor::Monitor(MonitorDeps deps) : deps_(std::move(deps)) {
  cfg_ = deps_.load_config();
  emitter_ = EventEmitter(deps_.make_notifier(cfg_));
}

Monitor::~Monitor() { stop(seconds(10)); }

bool Monitor::start() {
  std::lock_guard<std::mutex> life(lifecycle_mtx_);
  if (is_running()) return false;

  // Config I/O and collaborator setup happen without the state lock
  MonitorConfig cfg;
  try {
    cfg = deps_.load_config();
  } catch (const std::exception& e) {
    std::fprintf(stderr, "snapwatch: error: start: %s\n", e.what());
    return false;
  }
  auto probe = deps_.make_probe(cfg);
  EventEmitter emitter(deps_.make_notifier(cfg));

  // A previous loop has already cleared running_ and is only unwinding
  if (thread_.joinable()) thread_.join();

  {
    std::lock_guard<std::mutex> lk(mtx_);
    cfg_ = cfg;
    emitter_ = emitter;
    running_ = true;
    ++run_id_;
  }
  thread_ = std::jthread([this, cfg = std::move(cfg), probe = std::move(probe), emitter](std::stop_token st) mutable {
    run(st, std::move(cfg), std::move(probe), std::move(emitter));
  });
  return true;
}

bool Monitor::stop(milliseconds timeout) {
  std::lock_guard<std::mutex> life(lifecycle_mtx_);
  std::unique_lock<std::mutex> lk(mtx_);
  if (!running_) return false;
  const auto id = run_id_;
  thread_.request_stop();
  bool exited = exit_cv_.wait_for(lk, timeout, [&]{ return !running_ || run_id_ != id; });
  if (!exited) {
    std::fprintf(stderr, "snapwatch: warning: watcher did not stop within %lldms\n",
                 static_cast<long long>(timeout.count()));
  }
  return exited;
}

bool Monitor::is_running() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return running_;
}

StatusSnapshot Monitor::status() const {
  StatusSnapshot s;
  s.timestamp = Clock::now();
  std::lock_guard<std::mutex> lk(mtx_);
  s.watcher_running = running_;
  s.webcam_online = webcam_online_;
  s.last_alarm = arrivals_.last_alarm();
  s.last_webcam_change = last_change_;
  s.known_files_count = arrivals_.known().size();
  return s;
}

MonitorConfig Monitor::config() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return cfg_;
}

ClearResult Monitor::clear_images() {
  std::lock_guard<std::mutex> serial(clear_mtx_);
  MonitorConfig cfg;
  EventEmitter emitter;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    cfg = cfg_;
    emitter = emitter_;
  }

  auto res = snapwatch::collectors::remove_matching(cfg.watch_dir, cfg.extensions);

  // Rescan for truth; whatever survived (or was recreated) counts as known
  std::error_code ec;
  auto remaining = snapwatch::collectors::scan_directory(cfg.watch_dir, cfg.extensions, ec);
  {
    std::lock_guard<std::mutex> lk(mtx_);
    arrivals_.seed(ec ? FileSet{} : std::move(remaining));
    ++known_generation_;
  }

  std::fprintf(stderr, "snapwatch: clear: %d deleted, %d failed\n", res.deleted, res.failed);
  Event e;
  e.kind = EventKind::Cleared;
  e.deleted = res.deleted;
  e.failed = res.failed;
  e.error = res.error;
  (void)emitter.emit(e);
  return res;
}

NotifyResult Monitor::test_notify() {
  EventEmitter emitter;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    emitter = emitter_;
  }
  return emitter.emit(EventKind::Test);
}

bool Monitor::wait_for_tick(std::stop_token& st, milliseconds interval) {
  std::unique_lock<std::mutex> lk(wake_mtx_);
  // Returns early only when stop is requested
  wake_cv_.wait_for(lk, st, interval, []{ return false; });
  return !st.stop_requested();
}

void Monitor::finish_run() {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    running_ = false;
  }
  exit_cv_.notify_all();
}

void Monitor::on_loop_exit(const EventEmitter& emitter) {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    webcam_online_.reset();
    last_change_ = Clock::now();
  }
  (void)emitter.emit(EventKind::Offline);
  (void)emitter.emit(EventKind::Stopped);
  std::fprintf(stderr, "snapwatch: watcher stopped\n");
  finish_run();
}

void Monitor::run(std::stop_token st, MonitorConfig cfg,
                  std::unique_ptr<snapwatch::collectors::IProbe> probe, EventEmitter emitter) {
  std::fprintf(stderr, "snapwatch: watching %s (interval %lldms, cooldown %llds, hysteresis %d, probe %s)\n",
               cfg.watch_dir.c_str(), static_cast<long long>(cfg.poll_interval.count()),
               static_cast<long long>(cfg.alarm_cooldown.count()), cfg.hysteresis,
               probe ? probe->name() : "none");

  std::error_code ec;
  auto initial = snapwatch::collectors::scan_directory(cfg.watch_dir, cfg.extensions, ec);
  if (ec || !probe) {
    std::fprintf(stderr, "snapwatch: error: cannot watch %s: %s\n", cfg.watch_dir.c_str(),
                 ec ? ec.message().c_str() : "no probe");
    finish_run();
    return;
  }
  std::fprintf(stderr, "snapwatch: %zu existing files marked as known\n", initial.size());
  {
    std::lock_guard<std::mutex> lk(mtx_);
    arrivals_ = ArrivalDebouncer(cfg.alarm_cooldown);
    arrivals_.seed(std::move(initial));
    ++known_generation_;
    webcam_online_.reset();
    last_change_.reset();
  }
  (void)emitter.emit(EventKind::Started);

  // Runs on every way out of the loop, including exceptions
  struct ExitGuard {
    Monitor& self;
    const EventEmitter& emitter;
    ~ExitGuard() { self.on_loop_exit(emitter); }
  } guard{*this, emitter};

  try {
    HealthFilter health(cfg.hysteresis);
    while (!st.stop_requested()) {
      if (!wait_for_tick(st, cfg.poll_interval)) break;
      tick(cfg, *probe, health, emitter);
    }
  } catch (const std::exception& e) {
    std::fprintf(stderr, "snapwatch: error: watcher loop aborted: %s\n", e.what());
  }
}

void Monitor::tick(const MonitorConfig& cfg, snapwatch::collectors::IProbe& probe,
                   HealthFilter& health, const EventEmitter& emitter) {
  // Health first
  bool raw = probe.probe();
  if (auto flip = health.observe(raw)) {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      webcam_online_ = *flip;
      last_change_ = Clock::now();
    }
    std::fprintf(stderr, "snapwatch: webcam %s\n", *flip ? "online" : "offline");
    (void)emitter.emit(*flip ? EventKind::Online : EventKind::Offline);
  }

  // Then arrivals
  uint64_t gen;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    gen = known_generation_;
  }
  std::error_code ec;
  auto current = snapwatch::collectors::scan_directory(cfg.watch_dir, cfg.extensions, ec);
  if (ec) {
    std::fprintf(stderr, "snapwatch: warning: scan of %s failed: %s\n",
                 cfg.watch_dir.c_str(), ec.message().c_str());
  } else {
    ArrivalOutcome out;
    bool raced = false;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      if (gen != known_generation_) raced = true;
      else out = arrivals_.observe(std::move(current), Clock::now());
    }
    if (raced) {
      std::fprintf(stderr, "snapwatch: known files resynced during scan, skipping tick\n");
    } else if (out.alert) {
      std::string names;
      for (const auto& f : out.fresh) {
        if (!names.empty()) names += ", ";
        names += f;
      }
      std::fprintf(stderr, "snapwatch: new file(s): %s\n", names.c_str());
      Event e;
      e.kind = EventKind::Motion;
      e.files = std::move(out.fresh);
      (void)emitter.emit(e);
    } else if (!out.fresh.empty()) {
      std::fprintf(stderr, "snapwatch: %zu new file(s), cooldown active (%llds left)\n", out.fresh.size(),
                   static_cast<long long>(duration_cast<seconds>(out.remaining).count()));
    }
  }

  if (!cfg.status_file.empty()) (void)write_status_file(cfg.status_file, status());
}

} // namespace snapwatch::app
