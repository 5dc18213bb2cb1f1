#pragma once
#include <chrono>
#include <string>
#include "collectors/IProbe.hpp"

namespace snapwatch::collectors {

// Single ICMP echo via the system ping(8). Exit status 0 means reachable.
class PingProbe : public IProbe {
public:
  PingProbe(std::string host, std::chrono::milliseconds timeout);
  bool probe() override;
  const char* name() const override { return "ping"; }

private:
  std::string host_;
  std::chrono::milliseconds timeout_;
};

} // namespace snapwatch::collectors
