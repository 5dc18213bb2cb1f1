#pragma once
#include <chrono>
#include <string>
#include "collectors/IProbe.hpp"

namespace snapwatch::collectors {

// GET url; any HTTP status below 500 counts as reachable.
class HttpProbe : public IProbe {
public:
  HttpProbe(std::string url, std::chrono::milliseconds timeout);
  bool probe() override;
  const char* name() const override { return "http"; }

private:
  std::string url_;
  std::chrono::milliseconds timeout_;
};

} // namespace snapwatch::collectors
