#include "collectors/IProbe.hpp"
#include "collectors/HttpProbe.hpp"
#include "collectors/PingProbe.hpp"

namespace snapwatch::collectors {

std::unique_ptr<IProbe> make_probe(const snapwatch::model::ProbeConfig& cfg) {
  if (cfg.mode == snapwatch::model::ProbeMode::Ping)
    return std::make_unique<PingProbe>(cfg.host, cfg.timeout);
  return std::make_unique<HttpProbe>(cfg.url, cfg.timeout);
}

} // namespace snapwatch::collectors
