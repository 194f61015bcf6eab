#include "conductor/context/context_builder.hpp"

namespace conductor::context {

ContextBuilder::ContextBuilder(std::shared_ptr<ILanguageDetector> detector)
    : detector_(std::move(detector)) {}

router::Context ContextBuilder::build(const router::Query &query) const {
  router::Context context;
  context.history = query.history;
  for (std::size_t i = 0; i < query.history.size(); ++i) {
    if (i > 0) {
      context.history_text += "\n";
    }
    context.history_text += query.history[i];
  }
  context.detected_language =
      detector_ == nullptr ? std::string(DEFAULT_LANGUAGE) : detector_->detect(query.text);
  return context;
}

} // namespace conductor::context
