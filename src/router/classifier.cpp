#include "conductor/router/classifier.hpp"

#include "conductor/common/fs.hpp"
#include "conductor/common/json_util.hpp"
#include "conductor/observability/global.hpp"

#include <charconv>
#include <exception>
#include <future>

namespace conductor::router {

ProviderClassifier::ProviderClassifier(std::shared_ptr<providers::Provider> provider,
                                       ClassifierOptions options,
                                       std::shared_ptr<common::WorkerPool> pool)
    : provider_(std::move(provider)), options_(std::move(options)), pool_(std::move(pool)) {}

common::Result<RoutingDecision>
ProviderClassifier::classify(const std::string &system_instruction,
                             const std::vector<providers::ChatMessage> &messages) {
  providers::ChatRequest request;
  request.model = options_.model;
  request.temperature = options_.temperature;
  request.json_response = true;
  request.timeout_ms = static_cast<std::uint64_t>(options_.timeout.count());
  request.messages.push_back({.role = "system", .content = system_instruction});
  request.messages.insert(request.messages.end(), messages.begin(), messages.end());

  const auto started = std::chrono::steady_clock::now();
  const auto elapsed = [&started] {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                 started);
  };

  common::Result<std::string> response = common::Result<std::string>::failure("not called");
  if (pool_ == nullptr) {
    response = provider_->chat(request);
  } else {
    std::future<common::Result<std::string>> pending;
    try {
      auto provider = provider_;
      pending = pool_->submit([provider, request] { return provider->chat(request); });
    } catch (const std::exception &e) {
      return common::Result<RoutingDecision>::failure(
          std::string("classifier unavailable: ") + e.what(), common::ErrorKind::Upstream);
    }
    if (pending.wait_for(options_.timeout) != std::future_status::ready) {
      observability::record_classifier_call(options_.model, elapsed(), false);
      return common::Result<RoutingDecision>::failure(
          "classifier timed out after " + std::to_string(options_.timeout.count()) + "ms",
          common::ErrorKind::Upstream);
    }
    try {
      response = pending.get();
    } catch (const std::exception &e) {
      response = common::Result<std::string>::failure(e.what(), common::ErrorKind::Upstream);
    }
  }

  if (!response.ok()) {
    observability::record_classifier_call(options_.model, elapsed(), false);
    return common::Result<RoutingDecision>::failure(response.status());
  }
  auto decision = parse_routing_decision(response.value());
  observability::record_classifier_call(options_.model, elapsed(), decision.ok());
  return decision;
}

common::Result<RoutingDecision> parse_routing_decision(const std::string &text) {
  using R = common::Result<RoutingDecision>;
  const auto object = common::json_extract_object(text);
  if (!object.has_value()) {
    return R::failure("classifier response is not a JSON object", common::ErrorKind::Validation);
  }

  RoutingDecision decision;
  decision.target_agent = common::trim(common::json_get_string(*object, "target_agent"));
  if (decision.target_agent.empty()) {
    return R::failure("classifier response lacks target_agent", common::ErrorKind::Validation);
  }

  const std::string confidence = common::json_get_number(*object, "confidence");
  if (confidence.empty()) {
    return R::failure("classifier response lacks confidence", common::ErrorKind::Validation);
  }
  const auto parsed = std::from_chars(confidence.data(), confidence.data() + confidence.size(),
                                      decision.confidence);
  if (parsed.ec != std::errc() || parsed.ptr != confidence.data() + confidence.size() ||
      decision.confidence < 0.0 || decision.confidence > 1.0) {
    return R::failure("classifier confidence is not a number in [0, 1]: " + confidence,
                      common::ErrorKind::Validation);
  }

  decision.reasoning = common::json_get_string(*object, "reasoning");
  decision.is_cached = false;
  return R::success(std::move(decision));
}

} // namespace conductor::router
