#include "engram/memory/similarity.hpp"

#include "engram/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <unordered_set>

namespace engram::memory {

namespace {

enum class CharClass {
  Separator,
  Word,
  Ideograph,
};

/// Decode one UTF-8 code point at pos. Invalid sequences consume one byte and yield
/// U+FFFD so they act as separators.
char32_t decode_utf8(std::string_view text, std::size_t &pos) {
  const auto lead = static_cast<unsigned char>(text[pos]);
  std::size_t length = 0;
  char32_t cp = 0;
  if (lead < 0x80) {
    ++pos;
    return lead;
  }
  if ((lead & 0xE0) == 0xC0) {
    length = 2;
    cp = lead & 0x1F;
  } else if ((lead & 0xF0) == 0xE0) {
    length = 3;
    cp = lead & 0x0F;
  } else if ((lead & 0xF8) == 0xF0) {
    length = 4;
    cp = lead & 0x07;
  } else {
    ++pos;
    return 0xFFFD;
  }

  if (pos + length > text.size()) {
    ++pos;
    return 0xFFFD;
  }
  for (std::size_t i = 1; i < length; ++i) {
    const auto cont = static_cast<unsigned char>(text[pos + i]);
    if ((cont & 0xC0) != 0x80) {
      ++pos;
      return 0xFFFD;
    }
    cp = (cp << 6) | (cont & 0x3F);
  }
  pos += length;
  return cp;
}

bool is_ideograph(const char32_t cp) {
  return (cp >= 0x4E00 && cp <= 0x9FFF) ||   // CJK unified ideographs
         (cp >= 0x3400 && cp <= 0x4DBF) ||   // extension A
         (cp >= 0x20000 && cp <= 0x2FA1F) || // extensions B+ and compatibility supplement
         (cp >= 0xF900 && cp <= 0xFAFF) ||   // compatibility ideographs
         (cp >= 0x3040 && cp <= 0x30FF) ||   // hiragana, katakana
         (cp >= 0xAC00 && cp <= 0xD7AF);     // hangul syllables
}

CharClass classify(const char32_t cp) {
  if (cp < 0x80) {
    return std::isalnum(static_cast<int>(cp)) != 0 ? CharClass::Word : CharClass::Separator;
  }
  if (is_ideograph(cp)) {
    return CharClass::Ideograph;
  }
  if (cp == 0xFFFD || (cp >= 0x80 && cp <= 0xBF) || (cp >= 0x2000 && cp <= 0x2BFF) ||
      (cp >= 0x3000 && cp <= 0x303F) || (cp >= 0xFE30 && cp <= 0xFE4F) ||
      (cp >= 0xFF00 && cp <= 0xFF0F) || (cp >= 0xFF1A && cp <= 0xFF20) ||
      (cp >= 0xFF3B && cp <= 0xFF40) || (cp >= 0xFF5B && cp <= 0xFF65) ||
      (cp >= 0x1F000 && cp <= 0x1FAFF) || cp == 0xD7 || cp == 0xF7) {
    return CharClass::Separator;
  }
  return CharClass::Word;
}

} // namespace

double cosine_similarity(const Embedding &a, const Embedding &b) {
  if (a.empty() || b.empty()) {
    return 0.0;
  }

  const std::size_t shared = std::min(a.size(), b.size());
  double dot = 0.0;
  double norm_a = 0.0;
  double norm_b = 0.0;

  for (std::size_t i = 0; i < shared; ++i) {
    dot += a[i] * b[i];
  }
  for (const double v : a) {
    norm_a += v * v;
  }
  for (const double v : b) {
    norm_b += v * v;
  }

  const double denom = std::sqrt(norm_a) * std::sqrt(norm_b);
  if (!(denom > 1e-12) || !std::isfinite(denom)) {
    return 0.0;
  }
  const double similarity = dot / denom;
  return std::isfinite(similarity) ? similarity : 0.0;
}

std::vector<std::string> tokenize(const std::string_view text) {
  std::vector<std::string> tokens;
  std::string word;
  std::size_t word_chars = 0;

  const auto flush_word = [&] {
    if (word_chars >= 2) {
      tokens.push_back(word);
    }
    word.clear();
    word_chars = 0;
  };

  std::size_t pos = 0;
  while (pos < text.size()) {
    const std::size_t start = pos;
    const char32_t cp = decode_utf8(text, pos);
    switch (classify(cp)) {
    case CharClass::Word:
      if (cp < 0x80) {
        word.push_back(static_cast<char>(std::tolower(static_cast<int>(cp))));
      } else {
        word.append(text.substr(start, pos - start));
      }
      ++word_chars;
      break;
    case CharClass::Ideograph:
      flush_word();
      tokens.emplace_back(text.substr(start, pos - start));
      break;
    case CharClass::Separator:
      flush_word();
      break;
    }
  }
  flush_word();
  return tokens;
}

double token_overlap(const std::string_view query, const std::string_view content) {
  const auto query_tokens = tokenize(query);
  if (query_tokens.empty()) {
    return 0.0;
  }
  const std::unordered_set<std::string> query_set(query_tokens.begin(), query_tokens.end());
  const auto content_tokens = tokenize(content);
  const std::unordered_set<std::string> content_set(content_tokens.begin(), content_tokens.end());

  std::size_t hits = 0;
  for (const auto &token : query_set) {
    if (content_set.contains(token)) {
      ++hits;
    }
  }
  return static_cast<double>(hits) / static_cast<double>(query_set.size());
}

std::string normalize_for_match(const std::string &text) {
  return common::to_lower(common::trim(text));
}

} // namespace engram::memory
