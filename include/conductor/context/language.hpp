#pragma once

#include <string>
#include <string_view>

namespace conductor::context {

constexpr const char *DEFAULT_LANGUAGE = "English";

class ILanguageDetector {
public:
  virtual ~ILanguageDetector() = default;
  /// Human-readable language name, `English` when undecided.
  [[nodiscard]] virtual std::string detect(std::string_view text) const = 0;
};

/// Decides by Unicode script, then by common function words for Latin text.
/// Text shorter than three characters is not examined.
class ScriptLanguageDetector final : public ILanguageDetector {
public:
  [[nodiscard]] std::string detect(std::string_view text) const override;
};

} // namespace conductor::context
