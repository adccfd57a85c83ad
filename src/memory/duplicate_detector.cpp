#include "engram/memory/duplicate_detector.hpp"

#include "engram/memory/similarity.hpp"

namespace engram::memory {

common::Result<std::optional<MemorySearchResult>>
find_similar(IMemoryStore &store, const std::string &content, const MemoryType type,
             const double threshold) {
  MemoryQuery query;
  query.text = content;
  query.type = type;
  query.limit = kDedupCandidateLimit;
  query.semantic_weight = 1.0;
  query.recency_weight = 0.0;
  query.importance_weight = 0.0;

  auto results = store.search(query);
  if (!results.ok()) {
    return results.forward_error<std::optional<MemorySearchResult>>();
  }
  auto &candidates = results.value();
  if (candidates.empty()) {
    return common::Result<std::optional<MemorySearchResult>>::success(std::nullopt);
  }

  const std::string needle = normalize_for_match(content);
  for (auto &candidate : candidates) {
    if (normalize_for_match(candidate.entry.content) == needle) {
      candidate.score = 1.0;
      candidate.semantic = 1.0;
      return common::Result<std::optional<MemorySearchResult>>::success(std::move(candidate));
    }
  }

  if (candidates.front().score >= threshold) {
    return common::Result<std::optional<MemorySearchResult>>::success(
        std::move(candidates.front()));
  }
  return common::Result<std::optional<MemorySearchResult>>::success(std::nullopt);
}

} // namespace engram::memory
