#include "conductor/observability/factory.hpp"

#include "conductor/common/fs.hpp"
#include "conductor/observability/log_observer.hpp"
#include "conductor/observability/multi_observer.hpp"
#include "conductor/observability/noop_observer.hpp"

#include <sstream>

namespace conductor::observability {

namespace {

std::unique_ptr<IObserver> single_backend(const std::string &name) {
  if (name.empty() || name == "none" || name == "noop") {
    return std::make_unique<NoopObserver>();
  }
  if (name == "verbose" || name == "debug") {
    return std::make_unique<LogObserver>(true);
  }
  return std::make_unique<LogObserver>(false);
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend.find(',') == std::string::npos) {
    return single_backend(backend);
  }

  auto multi = std::make_unique<MultiObserver>();
  std::stringstream stream(backend);
  std::string part;
  while (std::getline(stream, part, ',')) {
    const std::string name = common::trim(part);
    if (name.empty() || name == "none" || name == "noop") {
      continue;
    }
    multi->add(single_backend(name));
  }
  return multi;
}

} // namespace conductor::observability
