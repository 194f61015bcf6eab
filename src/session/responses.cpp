#include "conductor/session/responses.hpp"

#include "conductor/common/json_util.hpp"

#include <iomanip>
#include <sstream>

namespace conductor::session {

namespace {

class JsonObjectWriter {
public:
  JsonObjectWriter &field(const std::string &key, const std::string &value) {
    return raw(key, "\"" + common::json_escape(value) + "\"");
  }

  JsonObjectWriter &raw(const std::string &key, const std::string &json) {
    out_ << (first_ ? "{" : ",") << "\"" << common::json_escape(key) << "\":" << json;
    first_ = false;
    return *this;
  }

  [[nodiscard]] std::string str() const { return first_ ? "{}" : out_.str() + "}"; }

private:
  std::ostringstream out_;
  bool first_ = true;
};

std::string number(const double value) {
  std::ostringstream out;
  out << std::setprecision(4) << value;
  return out.str();
}

} // namespace

std::string decision_to_json(const router::RoutingDecision &decision) {
  return JsonObjectWriter()
      .field("target_agent", decision.target_agent)
      .raw("confidence", number(decision.confidence))
      .field("reasoning", decision.reasoning)
      .raw("is_cached", decision.is_cached ? "true" : "false")
      .str();
}

std::string AgentContextResponse::to_json() const {
  JsonObjectWriter writer;
  writer.field("status", status);
  if (!ok()) {
    return writer.field("message", message).str();
  }
  writer.field("agent", agent).field("request_id", request_id).field("system_prompt",
                                                                     system_prompt);
  if (!source.empty()) {
    writer.field("source", source);
  }
  return writer.str();
}

std::string RoutingInfoResponse::to_json() const {
  JsonObjectWriter writer;
  writer.field("status", status);
  if (status == "CACHE_HIT") {
    writer.field("agent", agent).field("reasoning", reasoning).field("system_prompt",
                                                                     system_prompt);
  } else if (status == "SUCCESS") {
    writer.field("agent", agent).field("request_id", request_id).field("system_prompt",
                                                                       system_prompt);
  } else if (status == "CACHE_MISS") {
    writer.raw("available_agents", common::json_string_array(available_agents))
        .field("default_fallback", default_fallback)
        .field("instruction", instruction);
  } else {
    writer.field("message", message);
  }
  return writer.str();
}

std::string ProcessResult::to_json() const {
  JsonObjectWriter writer;
  writer.field("request_id", request_id)
      .field("agent", agent)
      .raw("router_decision", decision_to_json(decision))
      .field("detected_language", detected_language)
      .raw("implants_loaded", common::json_string_array(implants_loaded))
      .field("system_prompt", system_prompt);
  if (content.has_value()) {
    writer.field("content", *content);
  }
  return writer.str();
}

} // namespace conductor::session
