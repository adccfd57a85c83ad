#pragma once

#include "engram/memory/memory.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace engram::memory {

/// Cosine similarity. Vectors of different length are compared as if the shorter one
/// were zero-padded. Returns 0 for empty or zero-magnitude input.
[[nodiscard]] double cosine_similarity(const Embedding &a, const Embedding &b);

/// Lexical tokens of UTF-8 text: every CJK ideograph, kana or hangul syllable is its
/// own token; other letter/digit runs of two or more code points form a lower-cased
/// word token. Everything else separates tokens.
[[nodiscard]] std::vector<std::string> tokenize(std::string_view text);

/// |query ∩ content| / |query| over token sets; 0 when the query has no tokens.
[[nodiscard]] double token_overlap(std::string_view query, std::string_view content);

/// Trim and ASCII case-fold, used for exact duplicate detection.
[[nodiscard]] std::string normalize_for_match(const std::string &text);

} // namespace engram::memory
