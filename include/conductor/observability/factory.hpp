#pragma once

#include "conductor/config/schema.hpp"
#include "conductor/observability/observer.hpp"

#include <memory>

namespace conductor::observability {

/// Backend names: `log`, `verbose` (log incl. debug), `none`/`noop`, or a
/// comma-separated list of those.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace conductor::observability
