#include "test_framework.hpp"

#include "conductor/observability/factory.hpp"
#include "conductor/observability/global.hpp"
#include "conductor/observability/log_observer.hpp"
#include "conductor/observability/multi_observer.hpp"
#include "conductor/observability/noop_observer.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <memory>
#include <sstream>

namespace {

namespace obs = conductor::observability;

class RecordingObserver final : public obs::IObserver {
public:
  explicit RecordingObserver(std::shared_ptr<std::vector<obs::ObserverEvent>> events)
      : events_(std::move(events)) {}

  void record_event(const obs::ObserverEvent &event) override { events_->push_back(event); }
  void record_metric(const obs::ObserverMetric &) override {}
  [[nodiscard]] std::string_view name() const override { return "recording"; }

private:
  std::shared_ptr<std::vector<obs::ObserverEvent>> events_;
};

struct GlobalObserverGuard {
  ~GlobalObserverGuard() { obs::set_global_observer(std::make_unique<obs::NoopObserver>()); }
};

} // namespace

void register_observability_tests(std::vector<conductor::tests::TestCase> &tests) {
  using conductor::tests::require;

  tests.push_back({"log_observer_formats_levels", [] {
                     std::ostringstream out;
                     obs::LogObserver observer(out, false);
                     observer.record_event(obs::WarningEvent{.component = "router", .message = "m"});
                     observer.record_event(obs::RouteDecisionEvent{
                         .agent = "python_architect", .confidence = 0.9, .cached = true});
                     const auto text = out.str();
                     require(text.find("[WARN] router: m") != std::string::npos, "warn line");
                     require(text.find("[INFO] route.decision agent=python_architect "
                                       "confidence=0.90 cached=true") != std::string::npos,
                             "route line: " + text);
                   }});

  tests.push_back({"log_observer_hides_debug_unless_verbose", [] {
                     std::ostringstream quiet;
                     obs::LogObserver quiet_observer(quiet, false);
                     quiet_observer.record_metric(obs::SessionCacheSizeMetric{.entries = 3});
                     require(quiet.str().empty(), "debug metric should be hidden");

                     std::ostringstream loud;
                     obs::LogObserver loud_observer(loud, true);
                     loud_observer.record_metric(obs::SessionCacheSizeMetric{.entries = 3});
                     require(loud.str().find("[DEBUG] metric.session_cache_entries=3") !=
                                 std::string::npos,
                             "verbose should show metric");
                   }});

  tests.push_back({"observer_factory_selects_backend", [] {
                     auto config = conductor::testing::mock_config();
                     config.observability.backend = "none";
                     require(obs::create_observer(config)->name() == "none", "none backend");
                     config.observability.backend = "log";
                     require(obs::create_observer(config)->name() == "log", "log backend");
                     config.observability.backend = "log, verbose";
                     auto multi = obs::create_observer(config);
                     require(multi->name() == "multi", "comma list should fan out");
                   }});

  tests.push_back({"multi_observer_fans_out", [] {
                     auto events = std::make_shared<std::vector<obs::ObserverEvent>>();
                     obs::MultiObserver multi;
                     multi.add(std::make_unique<RecordingObserver>(events));
                     multi.add(std::make_unique<RecordingObserver>(events));
                     multi.record_event(obs::IndexEvent{.component = "skills", .documents = 2});
                     require(multi.size() == 2, "two children");
                     require(events->size() == 2, "each child should see the event");
                   }});

  tests.push_back({"global_helpers_reach_installed_observer", [] {
                     GlobalObserverGuard guard;
                     auto events = std::make_shared<std::vector<obs::ObserverEvent>>();
                     obs::set_global_observer(std::make_unique<RecordingObserver>(events));
                     obs::record_retrieval("implants", 3, false);
                     obs::record_error("prompt", "boom");
                     require(events->size() == 2, "both events recorded");
                     const auto *retrieval = std::get_if<obs::RetrievalEvent>(&events->at(0));
                     require(retrieval != nullptr && retrieval->results == 3, "retrieval event");
                     const auto *error = std::get_if<obs::ErrorEvent>(&events->at(1));
                     require(error != nullptr && error->message == "boom", "error event");
                   }});
}
