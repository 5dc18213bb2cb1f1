#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <stop_token>
#include <thread>
#include <vector>
#include "app/ControlApi.hpp"

namespace snapwatch::app {

// HTTP/1.1 listener for the control API: one request per connection,
// io_uring poll on the listen socket plus an eventfd for shutdown. Each
// accepted connection is served on a short-lived worker thread.
class ControlServer {
public:
  ControlServer(ControlApi& api, std::string host, uint16_t port);
  ~ControlServer();
  ControlServer(const ControlServer&) = delete;
  ControlServer& operator=(const ControlServer&) = delete;

  void start();
  void stop();

private:
  void run(std::stop_token st);
  void handle_client(int client_fd);
  void dispatch(int client_fd);
  void reap_workers();
  static void send_response(int fd, HttpResponse& resp);

  struct Worker {
    std::jthread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };
  static constexpr size_t kMaxWorkers = 16;

  ControlApi& api_;
  std::string host_;
  uint16_t port_;
  int listen_fd_{-1};
  int stop_eventfd_{-1};
  std::vector<Worker> workers_; // listener thread only
  std::jthread thread_;
};

} // namespace snapwatch::app
