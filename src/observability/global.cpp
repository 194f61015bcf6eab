#include "conductor/observability/global.hpp"

#include <mutex>

namespace conductor::observability {

namespace {

std::mutex g_observer_mutex;
std::shared_ptr<IObserver> g_observer;

std::shared_ptr<IObserver> current_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer;
}

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

// Events may be recorded from worker threads while the entry point swaps the
// observer, so each call holds its own reference.
void record_event(const ObserverEvent &event) {
  if (auto observer = current_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto observer = current_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_route_decision(const std::string &agent, const double confidence, const bool cached) {
  record_event(RouteDecisionEvent{.agent = agent, .confidence = confidence, .cached = cached});
}

void record_cache_lookup(const std::string &collection, const bool hit, const double distance) {
  record_event(CacheLookupEvent{.collection = collection, .hit = hit, .distance = distance});
}

void record_retrieval(const std::string &component, const std::size_t results, const bool by_id) {
  record_event(RetrievalEvent{.component = component, .results = results, .by_id = by_id});
}

void record_index(const std::string &component, const std::size_t documents) {
  record_event(IndexEvent{.component = component, .documents = documents});
}

void record_classifier_call(const std::string &model, const std::chrono::milliseconds duration,
                            const bool success) {
  record_event(ClassifierCallEvent{.model = model, .duration = duration, .success = success});
}

void record_prompt_resolved(const std::string &agent, const std::size_t characters,
                            const std::size_t markers) {
  record_event(
      PromptResolvedEvent{.agent = agent, .characters = characters, .markers = markers});
}

void record_latency(const std::string &operation, const std::chrono::milliseconds latency) {
  record_metric(RequestLatencyMetric{.operation = operation, .latency = latency});
}

void record_warning(const std::string &component, const std::string &message) {
  record_event(WarningEvent{.component = component, .message = message});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace conductor::observability
