#pragma once

#include "conductor/observability/observer.hpp"

namespace conductor::observability {

class NoopObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &) override {}
  void record_metric(const ObserverMetric &) override {}
  [[nodiscard]] std::string_view name() const override { return "none"; }
};

} // namespace conductor::observability
