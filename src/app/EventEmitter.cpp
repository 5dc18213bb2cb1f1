#include "app/EventEmitter.hpp"
#include <cstdio>
#include <exception>

namespace snapwatch::app {

using snapwatch::model::Event;
using snapwatch::model::EventKind;
using snapwatch::model::NotifyResult;

EventEmitter::EventEmitter(std::shared_ptr<INotifier> sink) : sink_(std::move(sink)) {}

NotifyResult EventEmitter::emit(const Event& e) const {
  NotifyResult r;
  if (!sink_) {
    r.error = "no notifier configured";
  } else {
    try {
      r = sink_->notify(e);
    } catch (const std::exception& ex) {
      r.ok = false;
      r.error = ex.what();
    } catch (...) {
      r.ok = false;
      r.error = "unknown exception";
    }
  }
  if (!r.ok) {
    std::fprintf(stderr, "snapwatch: warning: notify(%s) failed: %s\n",
                 snapwatch::model::to_string(e.kind), r.error.c_str());
  }
  return r;
}

NotifyResult EventEmitter::emit(EventKind kind) const {
  Event e;
  e.kind = kind;
  return emit(e);
}

} // namespace snapwatch::app
