#pragma once

#include "conductor/observability/observer.hpp"

#include <memory>

namespace conductor::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_route_decision(const std::string &agent, double confidence, bool cached);
void record_cache_lookup(const std::string &collection, bool hit, double distance);
void record_retrieval(const std::string &component, std::size_t results, bool by_id);
void record_index(const std::string &component, std::size_t documents);
void record_classifier_call(const std::string &model, std::chrono::milliseconds duration,
                            bool success);
void record_prompt_resolved(const std::string &agent, std::size_t characters,
                            std::size_t markers);
void record_latency(const std::string &operation, std::chrono::milliseconds latency);
void record_warning(const std::string &component, const std::string &message);
void record_error(const std::string &component, const std::string &message);

} // namespace conductor::observability
