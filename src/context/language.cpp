#include "conductor/context/language.hpp"

#include "conductor/common/fs.hpp"

#include <algorithm>
#include <cstdint>
#include <map>
#include <sstream>
#include <vector>

namespace conductor::context {

namespace {

enum class Script { Latin, Cyrillic, Greek, Hebrew, Arabic, Devanagari, Kana, Hangul, Han, Other };

struct LatinProfile {
  const char *language;
  std::vector<std::string> words;
};

const std::vector<LatinProfile> &latin_profiles() {
  static const std::vector<LatinProfile> profiles = {
      {"English", {"the", "and", "is", "are", "how", "what", "with", "for", "this", "you", "to", "of"}},
      {"German", {"der", "die", "das", "und", "ist", "nicht", "ich", "wie", "mit", "ein", "eine"}},
      {"Spanish",
       {"el", "los", "las", "que", "es", "por", "para", "un", "una", "como", "con", "del", "de",
        "en", "este", "hola"}},
      {"French",
       {"le", "les", "est", "et", "des", "un", "une", "pour", "dans", "comment", "je", "de", "en",
        "ceci", "vous", "bonjour"}},
      {"Italian", {"il", "che", "di", "non", "sono", "per", "gli", "della", "come", "questo"}},
      {"Portuguese", {"o", "os", "que", "não", "uma", "para", "com", "como", "isso", "você"}},
      {"Dutch", {"de", "het", "een", "en", "is", "niet", "ik", "hoe", "wat", "van", "voor"}},
  };
  return profiles;
}

/// Decode one UTF-8 sequence at `pos`; malformed bytes decode as U+FFFD.
std::uint32_t next_codepoint(std::string_view text, std::size_t &pos) {
  const auto byte = static_cast<unsigned char>(text[pos++]);
  if (byte < 0x80) {
    return byte;
  }
  std::size_t extra = 0;
  std::uint32_t cp = 0;
  if ((byte & 0xE0U) == 0xC0U) {
    extra = 1;
    cp = byte & 0x1FU;
  } else if ((byte & 0xF0U) == 0xE0U) {
    extra = 2;
    cp = byte & 0x0FU;
  } else if ((byte & 0xF8U) == 0xF0U) {
    extra = 3;
    cp = byte & 0x07U;
  } else {
    return 0xFFFD;
  }
  for (std::size_t i = 0; i < extra; ++i) {
    if (pos >= text.size() || (static_cast<unsigned char>(text[pos]) & 0xC0U) != 0x80U) {
      return 0xFFFD;
    }
    cp = (cp << 6U) | (static_cast<unsigned char>(text[pos++]) & 0x3FU);
  }
  return cp;
}

Script script_of(const std::uint32_t cp) {
  if ((cp >= 'A' && cp <= 'Z') || (cp >= 'a' && cp <= 'z') || (cp >= 0xC0 && cp <= 0x24F)) {
    return Script::Latin;
  }
  if (cp >= 0x400 && cp <= 0x4FF) {
    return Script::Cyrillic;
  }
  if (cp >= 0x370 && cp <= 0x3FF) {
    return Script::Greek;
  }
  if (cp >= 0x590 && cp <= 0x5FF) {
    return Script::Hebrew;
  }
  if (cp >= 0x600 && cp <= 0x6FF) {
    return Script::Arabic;
  }
  if (cp >= 0x900 && cp <= 0x97F) {
    return Script::Devanagari;
  }
  if (cp >= 0x3040 && cp <= 0x30FF) {
    return Script::Kana;
  }
  if ((cp >= 0xAC00 && cp <= 0xD7AF) || (cp >= 0x1100 && cp <= 0x11FF)) {
    return Script::Hangul;
  }
  if (cp >= 0x4E00 && cp <= 0x9FFF) {
    return Script::Han;
  }
  return Script::Other;
}

bool is_ukrainian_letter(const std::uint32_t cp) {
  // і ї є ґ and their capitals
  return cp == 0x456 || cp == 0x457 || cp == 0x454 || cp == 0x491 || cp == 0x406 ||
         cp == 0x407 || cp == 0x404 || cp == 0x490;
}

std::string detect_latin(std::string_view text) {
  std::istringstream words{common::to_lower(std::string(text))};
  std::map<std::string, int> counts;
  std::string word;
  while (words >> word) {
    word.erase(std::remove_if(word.begin(), word.end(),
                              [](char ch) { return ch == ',' || ch == '.' || ch == '?' ||
                                                   ch == '!' || ch == ';' || ch == ':' || ch == '"'; }),
               word.end());
    ++counts[word];
  }

  std::string best = DEFAULT_LANGUAGE;
  int best_score = 0;
  for (const auto &profile : latin_profiles()) {
    int score = 0;
    for (const auto &stop_word : profile.words) {
      if (const auto it = counts.find(stop_word); it != counts.end()) {
        score += it->second;
      }
    }
    if (score > best_score) {
      best_score = score;
      best = profile.language;
    }
  }
  return best;
}

} // namespace

std::string ScriptLanguageDetector::detect(std::string_view text) const {
  const std::string cleaned = common::trim(std::string(text));
  if (cleaned.size() < 3) {
    return DEFAULT_LANGUAGE;
  }

  std::map<Script, std::size_t> counts;
  bool ukrainian = false;
  for (std::size_t pos = 0; pos < cleaned.size();) {
    const std::uint32_t cp = next_codepoint(cleaned, pos);
    ukrainian = ukrainian || is_ukrainian_letter(cp);
    ++counts[script_of(cp)];
  }
  counts.erase(Script::Other);
  if (counts.empty()) {
    return DEFAULT_LANGUAGE;
  }

  // Kana decides Japanese even when Han characters outnumber it.
  if (counts.contains(Script::Kana)) {
    return "Japanese";
  }
  const auto dominant =
      std::max_element(counts.begin(), counts.end(),
                       [](const auto &lhs, const auto &rhs) { return lhs.second < rhs.second; })
          ->first;
  switch (dominant) {
  case Script::Cyrillic:
    return ukrainian ? "Ukrainian" : "Russian";
  case Script::Greek:
    return "Greek";
  case Script::Hebrew:
    return "Hebrew";
  case Script::Arabic:
    return "Arabic";
  case Script::Devanagari:
    return "Hindi";
  case Script::Hangul:
    return "Korean";
  case Script::Han:
    return "Chinese (Simplified)";
  case Script::Latin:
    return detect_latin(cleaned);
  case Script::Kana:
  case Script::Other:
    break;
  }
  return DEFAULT_LANGUAGE;
}

} // namespace conductor::context
