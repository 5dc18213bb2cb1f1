#include "app/ConfigLoader.hpp"
#include "app/ControlApi.hpp"
#include "app/ControlServer.hpp"
#include "app/Monitor.hpp"
#include "app/NtfyNotifier.hpp"
#include "collectors/IProbe.hpp"

#include <curl/curl.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace std::chrono_literals;

static std::atomic<bool> g_stop{false};
static std::atomic<int> g_signal{0};
static void on_signal(int sig) { g_signal.store(sig); g_stop.store(true); }

int main(int argc, char** argv) {
  std::string config_path;
  bool autostart_flag = true;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--config" && i + 1 < argc) config_path = argv[++i];
    else if (a == "--no-autostart") autostart_flag = false;
    else if (a == "-h" || a == "--help") {
      std::cout << "Usage: snapwatch [--config PATH] [--no-autostart]\n";
      std::cout << "Notes: config defaults to $SNAPWATCH_CONFIG or ~/.config/snapwatch/config.toml\n";
      return 0;
    } else {
      std::cerr << "snapwatch: unknown argument: " << a << "\n";
      return 2;
    }
  }
  if (config_path.empty()) config_path = snapwatch::app::config_file_path();

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
    std::fprintf(stderr, "snapwatch: error: curl_global_init failed\n");
    return 1;
  }

  snapwatch::app::MonitorDeps deps;
  deps.load_config = [config_path]{ return snapwatch::app::load_config(config_path); };
  deps.make_probe = [](const snapwatch::model::MonitorConfig& cfg) {
    return snapwatch::collectors::make_probe(cfg.probe);
  };
  deps.make_notifier = [](const snapwatch::model::MonitorConfig& cfg) -> std::shared_ptr<snapwatch::app::INotifier> {
    return std::make_shared<snapwatch::app::NtfyNotifier>(cfg);
  };

  int rc = 0;
  try {
    snapwatch::app::Monitor monitor(std::move(deps));
    auto cfg = monitor.config();

    snapwatch::app::ControlApi api(monitor);
    snapwatch::app::ControlServer server(api, cfg.api.listen_host, cfg.api.listen_port);
    server.start();

    if (autostart_flag && cfg.api.autostart) (void)monitor.start();

    while (!g_stop.load()) std::this_thread::sleep_for(200ms);

    std::fprintf(stderr, "snapwatch: signal %d received, shutting down\n", g_signal.load());
    server.stop();
    if (monitor.is_running() && !monitor.stop(5s))
      std::fprintf(stderr, "snapwatch: warning: watcher still shutting down at exit\n");
  } catch (const snapwatch::app::ConfigError& e) {
    std::fprintf(stderr, "snapwatch: error: %s\n", e.what());
    rc = 1;
  }

  curl_global_cleanup();
  return rc;
}
