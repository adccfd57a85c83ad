#pragma once

#include "engram/memory/memory.hpp"

namespace engram::memory {

constexpr double kDefaultDedupThreshold = 0.75;
constexpr std::size_t kDedupCandidateLimit = 5;

/// Semantic-only search restricted to `type`. An exact match (trimmed, case-folded)
/// among the candidates wins with score 1.0; otherwise the best candidate is returned
/// when it reaches `threshold`.
[[nodiscard]] common::Result<std::optional<MemorySearchResult>>
find_similar(IMemoryStore &store, const std::string &content, MemoryType type,
             double threshold = kDefaultDedupThreshold);

} // namespace engram::memory
