#pragma once
#include "app/EventEmitter.hpp"
#include "model/Config.hpp"

namespace snapwatch::app {

// Publishes rendered events to an ntfy server over HTTP(S) via libcurl.
class NtfyNotifier : public INotifier {
public:
  explicit NtfyNotifier(snapwatch::model::MonitorConfig cfg);
  snapwatch::model::NotifyResult notify(const snapwatch::model::Event& e) override;

private:
  snapwatch::model::MonitorConfig cfg_;
};

} // namespace snapwatch::app
