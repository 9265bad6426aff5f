#pragma once

#include "calx/observability/observer.hpp"

namespace calx::observability {

class LogObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }
};

} // namespace calx::observability
