#pragma once

#include "engram/observability/observer.hpp"

#include <mutex>

namespace engram::observability {

class LogObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  std::mutex mutex_;
};

} // namespace engram::observability
