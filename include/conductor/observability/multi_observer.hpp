#pragma once

#include "conductor/observability/observer.hpp"

#include <memory>
#include <vector>

namespace conductor::observability {

/// Fans every event and metric out to each child in insertion order.
class MultiObserver final : public IObserver {
public:
  void add(std::unique_ptr<IObserver> observer);
  [[nodiscard]] std::size_t size() const { return observers_.size(); }

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "multi"; }

private:
  template <typename Fn> void each(Fn &&fn);

  std::vector<std::unique_ptr<IObserver>> observers_;
};

} // namespace conductor::observability
