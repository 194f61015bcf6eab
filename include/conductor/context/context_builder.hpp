#pragma once

#include "conductor/context/language.hpp"
#include "conductor/router/types.hpp"

#include <memory>

namespace conductor::context {

class ContextBuilder {
public:
  explicit ContextBuilder(std::shared_ptr<ILanguageDetector> detector);

  /// History joined by newlines plus the query's detected language.
  [[nodiscard]] router::Context build(const router::Query &query) const;

private:
  std::shared_ptr<ILanguageDetector> detector_;
};

} // namespace conductor::context
