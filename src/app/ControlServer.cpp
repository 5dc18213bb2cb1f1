#ifdef SNAPWATCH_HAVE_URING

#include "app/ControlServer.hpp"
#include <liburing.h>
#include <arpa/inet.h>
#include <sys/socket.h>
#include <sys/eventfd.h>
#include <sys/uio.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>

namespace snapwatch::app {

// Tags for distinguishing CQE sources
enum class UringTag : uint64_t { ListenPoll = 1, StopPoll = 2 };

ControlServer::ControlServer(ControlApi& api, std::string host, uint16_t port)
    : api_(api), host_(std::move(host)), port_(port) {}

ControlServer::~ControlServer() { stop(); }

void ControlServer::start() {
  if (thread_.joinable()) return;
  // eventfd for clean shutdown, owned by start()/stop()
  stop_eventfd_ = ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
  if (stop_eventfd_ < 0) {
    std::fprintf(stderr, "snapwatch: control server: eventfd() failed: %s\n", std::strerror(errno));
    return;
  }
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
}

void ControlServer::stop() {
  if (stop_eventfd_ >= 0) {
    uint64_t val = 1;
    (void)::write(stop_eventfd_, &val, sizeof(val));
  }
  if (thread_.joinable()) {
    thread_.request_stop();
    thread_.join();
  }
  if (stop_eventfd_ >= 0) { ::close(stop_eventfd_); stop_eventfd_ = -1; }
}

void ControlServer::run(std::stop_token st) {
  listen_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0);
  if (listen_fd_ < 0) {
    std::fprintf(stderr, "snapwatch: control server: socket() failed: %s\n", std::strerror(errno));
    return;
  }

  int optval = 1;
  (void)::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval));

  struct sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port_);
  if (host_.empty() || ::inet_pton(AF_INET, host_.c_str(), &addr.sin_addr) != 1) {
    if (!host_.empty() && host_ != "0.0.0.0")
      std::fprintf(stderr, "snapwatch: control server: bad listen_host '%s', using 0.0.0.0\n", host_.c_str());
    addr.sin_addr.s_addr = INADDR_ANY;
  }

  if (::bind(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
    std::fprintf(stderr, "snapwatch: control server: bind(%s:%d) failed: %s\n",
                 host_.c_str(), port_, std::strerror(errno));
    ::close(listen_fd_);
    listen_fd_ = -1;
    return;
  }

  if (::listen(listen_fd_, 8) < 0) {
    std::fprintf(stderr, "snapwatch: control server: listen() failed: %s\n", std::strerror(errno));
    ::close(listen_fd_);
    listen_fd_ = -1;
    return;
  }

  struct io_uring ring{};
  if (io_uring_queue_init(16, &ring, 0) < 0) {
    std::fprintf(stderr, "snapwatch: control server: io_uring_queue_init() failed: %s\n", std::strerror(errno));
    ::close(listen_fd_);
    listen_fd_ = -1;
    return;
  }

  auto submit_poll = [&](int fd, UringTag tag) {
    struct io_uring_sqe* sqe = io_uring_get_sqe(&ring);
    io_uring_prep_poll_add(sqe, fd, POLLIN);
    io_uring_sqe_set_data64(sqe, static_cast<uint64_t>(tag));
  };

  submit_poll(listen_fd_, UringTag::ListenPoll);
  submit_poll(stop_eventfd_, UringTag::StopPoll);
  io_uring_submit(&ring);

  std::fprintf(stderr, "snapwatch: control server listening on %s:%d\n", host_.c_str(), port_);

  while (!st.stop_requested()) {
    struct io_uring_cqe* cqe = nullptr;
    int ret = io_uring_wait_cqe(&ring, &cqe);
    if (ret < 0) {
      if (ret == -EINTR) continue;
      break;
    }

    auto tag = static_cast<UringTag>(io_uring_cqe_get_data64(cqe));
    int res = cqe->res;
    io_uring_cqe_seen(&ring, cqe);

    if (tag == UringTag::StopPoll || st.stop_requested()) {
      break;
    }

    if (tag == UringTag::ListenPoll && res >= 0) {
      int client_fd = ::accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
      if (client_fd >= 0) dispatch(client_fd);
      // Re-arm listen poll
      submit_poll(listen_fd_, UringTag::ListenPoll);
      io_uring_submit(&ring);
    }
  }

  io_uring_queue_exit(&ring);
  if (listen_fd_ >= 0) { ::close(listen_fd_); listen_fd_ = -1; }
  // Joins every in-flight request
  workers_.clear();
}

void ControlServer::reap_workers() {
  std::erase_if(workers_, [](const Worker& w){ return w.done->load(); });
}

void ControlServer::dispatch(int fd) {
  reap_workers();
  if (workers_.size() >= kMaxWorkers) {
    HttpResponse busy;
    busy.status = 503;
    busy.content_type = "text/plain";
    busy.body = "503 Service Unavailable\n";
    send_response(fd, busy);
    ::close(fd);
    return;
  }
  // Route handlers may block (stop waits for the loop), so each request gets its own thread
  auto done = std::make_shared<std::atomic<bool>>(false);
  workers_.push_back(Worker{std::jthread([this, fd, done]{
    handle_client(fd);
    ::close(fd);
    done->store(true);
  }), done});
}

void ControlServer::handle_client(int fd) {
  // Slow clients must not stall the control surface
  struct timeval tv{.tv_sec = 5, .tv_usec = 0};
  (void)::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  (void)::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
  int one = 1;
  (void)::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

  char reqbuf[4096];
  ssize_t nr = ::recv(fd, reqbuf, sizeof(reqbuf) - 1, 0);
  if (nr <= 0) return;
  reqbuf[nr] = '\0';

  std::string_view req(reqbuf, static_cast<size_t>(nr));
  auto line_end = req.find('\r');
  if (line_end == std::string_view::npos) line_end = req.find('\n');
  std::string_view request_line = req.substr(0, line_end);

  HttpResponse resp;
  std::string_view method, path;
  if (parse_request_line(request_line, method, path)) {
    resp = api_.handle(method, path);
  } else {
    resp.status = 400;
    resp.content_type = "text/plain";
    resp.body = "400 Bad Request\n";
  }
  send_response(fd, resp);
}

void ControlServer::send_response(int fd, HttpResponse& resp) {
  std::string headers = response_headers(resp);

  // Scatter-gather send (headers + body, no concatenation)
  struct iovec iov[2] = {
    {.iov_base = headers.data(), .iov_len = headers.size()},
    {.iov_base = resp.body.data(), .iov_len = resp.body.size()}
  };
  struct msghdr msg{};
  msg.msg_iov = iov;
  msg.msg_iovlen = 2;
  (void)::sendmsg(fd, &msg, MSG_NOSIGNAL);
}

} // namespace snapwatch::app

#endif // SNAPWATCH_HAVE_URING
