#pragma once
#include <memory>
#include "model/Config.hpp"

namespace snapwatch::collectors {

// One reachability check of the monitored device. Implementations must bound
// their own run time and map every transport failure to false.
class IProbe {
public:
  virtual ~IProbe() = default;

  [[nodiscard]] virtual bool probe() = 0;

  // Short name for log lines
  [[nodiscard]] virtual const char* name() const = 0;
};

// Build the probe selected by cfg.mode.
[[nodiscard]] std::unique_ptr<IProbe> make_probe(const snapwatch::model::ProbeConfig& cfg);

} // namespace snapwatch::collectors
