#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace conductor::observability {

struct RouteDecisionEvent {
  std::string agent;
  double confidence = 0.0;
  bool cached = false;
};

struct CacheLookupEvent {
  std::string collection;
  bool hit = false;
  /// Negative when the collection returned no neighbour.
  double distance = -1.0;
};

struct RetrievalEvent {
  std::string component;
  std::size_t results = 0;
  bool by_id = false;
};

struct IndexEvent {
  std::string component;
  std::size_t documents = 0;
};

struct ClassifierCallEvent {
  std::string model;
  std::chrono::milliseconds duration{0};
  bool success = false;
};

struct PromptResolvedEvent {
  std::string agent;
  std::size_t characters = 0;
  std::size_t markers = 0;
};

struct WarningEvent {
  std::string component;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<RouteDecisionEvent, CacheLookupEvent, RetrievalEvent, IndexEvent,
                 ClassifierCallEvent, PromptResolvedEvent, WarningEvent, ErrorEvent>;

struct RequestLatencyMetric {
  std::string operation;
  std::chrono::milliseconds latency{0};
};

struct SessionCacheSizeMetric {
  std::uint64_t entries = 0;
};

struct WorkerQueueDepthMetric {
  std::uint64_t depth = 0;
};

using ObserverMetric =
    std::variant<RequestLatencyMetric, SessionCacheSizeMetric, WorkerQueueDepthMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace conductor::observability
