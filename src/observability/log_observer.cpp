#include "conductor/observability/log_observer.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <type_traits>

namespace conductor::observability {

namespace {

std::string fixed(double value, int precision) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(precision) << value;
  return out.str();
}

std::string flag(bool value) { return value ? "true" : "false"; }

} // namespace

LogObserver::LogObserver(const bool verbose) : LogObserver(std::cerr, verbose) {}

LogObserver::LogObserver(std::ostream &out, const bool verbose) : out_(out), verbose_(verbose) {}

void LogObserver::log_line(const std::string_view level, const std::string &message) {
  if (level == "DEBUG" && !verbose_) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, RouteDecisionEvent>) {
          log_line("INFO", "route.decision agent=" + evt.agent + " confidence=" +
                               fixed(evt.confidence, 2) + " cached=" + flag(evt.cached));
        } else if constexpr (std::is_same_v<T, CacheLookupEvent>) {
          log_line("DEBUG", "cache.lookup collection=" + evt.collection + " hit=" + flag(evt.hit) +
                                (evt.distance >= 0.0 ? " distance=" + fixed(evt.distance, 4)
                                                     : std::string()));
        } else if constexpr (std::is_same_v<T, RetrievalEvent>) {
          log_line("INFO", "retrieve component=" + evt.component +
                               " results=" + std::to_string(evt.results) +
                               " by_id=" + flag(evt.by_id));
        } else if constexpr (std::is_same_v<T, IndexEvent>) {
          log_line("INFO", "index component=" + evt.component +
                               " documents=" + std::to_string(evt.documents));
        } else if constexpr (std::is_same_v<T, ClassifierCallEvent>) {
          log_line(evt.success ? "INFO" : "WARN",
                   "classifier.call model=" + evt.model +
                       " duration_ms=" + std::to_string(evt.duration.count()) +
                       " success=" + flag(evt.success));
        } else if constexpr (std::is_same_v<T, PromptResolvedEvent>) {
          log_line("DEBUG", "prompt.resolved agent=" + evt.agent +
                                " chars=" + std::to_string(evt.characters) +
                                " markers=" + std::to_string(evt.markers));
        } else if constexpr (std::is_same_v<T, WarningEvent>) {
          log_line("WARN", evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, RequestLatencyMetric>) {
          log_line("DEBUG", "metric.latency_ms op=" + m.operation + " value=" +
                                std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, SessionCacheSizeMetric>) {
          log_line("DEBUG", "metric.session_cache_entries=" + std::to_string(m.entries));
        } else if constexpr (std::is_same_v<T, WorkerQueueDepthMetric>) {
          log_line("DEBUG", "metric.worker_queue_depth=" + std::to_string(m.depth));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_.flush();
}

} // namespace conductor::observability
