#pragma once

#include "conductor/common/result.hpp"
#include "conductor/common/worker_pool.hpp"
#include "conductor/providers/traits.hpp"
#include "conductor/router/types.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace conductor::router {

/// External intent classifier: a system instruction and role-tagged messages
/// in, a routing decision out. Transport and parse failures are returned, not
/// swallowed.
class IClassifier {
public:
  virtual ~IClassifier() = default;

  [[nodiscard]] virtual common::Result<RoutingDecision>
  classify(const std::string &system_instruction,
           const std::vector<providers::ChatMessage> &messages) = 0;
};

struct ClassifierOptions {
  std::string model;
  double temperature = 0.0;
  std::chrono::milliseconds timeout{30000};
};

/// Classifier backed by a chat provider in JSON response mode. With a worker
/// pool the call runs there and is abandoned after `timeout`; the late result
/// is discarded.
class ProviderClassifier final : public IClassifier {
public:
  ProviderClassifier(std::shared_ptr<providers::Provider> provider, ClassifierOptions options,
                     std::shared_ptr<common::WorkerPool> pool = nullptr);

  [[nodiscard]] common::Result<RoutingDecision>
  classify(const std::string &system_instruction,
           const std::vector<providers::ChatMessage> &messages) override;

private:
  std::shared_ptr<providers::Provider> provider_;
  ClassifierOptions options_;
  std::shared_ptr<common::WorkerPool> pool_;
};

/// Parse `{target_agent, confidence, reasoning}` from model output. Prose or
/// code fences around the object are tolerated; a missing agent, or a
/// confidence that is not a number in [0, 1], is a Validation failure.
[[nodiscard]] common::Result<RoutingDecision> parse_routing_decision(const std::string &text);

} // namespace conductor::router
