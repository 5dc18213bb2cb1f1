#pragma once
#include <memory>
#include "model/Event.hpp"

namespace snapwatch::app {

// Notification sink. Delivery failures come back as a result value.
class INotifier {
public:
  virtual ~INotifier() = default;
  [[nodiscard]] virtual snapwatch::model::NotifyResult notify(const snapwatch::model::Event& e) = 0;
};

// Hands events to the sink and keeps every failure (result or exception)
// out of the caller: it is logged and returned, never rethrown or retried.
class EventEmitter {
public:
  explicit EventEmitter(std::shared_ptr<INotifier> sink = nullptr);

  snapwatch::model::NotifyResult emit(const snapwatch::model::Event& e) const;
  snapwatch::model::NotifyResult emit(snapwatch::model::EventKind kind) const;

private:
  std::shared_ptr<INotifier> sink_;
};

} // namespace snapwatch::app
