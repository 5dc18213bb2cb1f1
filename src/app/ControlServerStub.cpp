#ifndef SNAPWATCH_HAVE_URING

#include "app/ControlServer.hpp"
#include <cstdio>

namespace snapwatch::app {

ControlServer::ControlServer(ControlApi& api, std::string host, uint16_t port)
    : api_(api), host_(std::move(host)), port_(port) {}

ControlServer::~ControlServer() = default;

void ControlServer::start() {
  std::fprintf(stderr, "snapwatch: control server: built without io_uring, HTTP control API disabled\n");
}

void ControlServer::stop() {}

} // namespace snapwatch::app

#endif // SNAPWATCH_HAVE_URING
