#include "engram/memory/hybrid_ranker.hpp"

#include "engram/memory/similarity.hpp"

#include <algorithm>

namespace engram::memory {

HybridRanker::HybridRanker(const RankWeights weights, const double recency_half_life_days)
    : weights_(weights), half_life_days_(recency_half_life_days) {}

MemorySearchResult HybridRanker::score(MemoryEntry entry,
                                       const std::optional<std::string> &query_text,
                                       const std::optional<Embedding> &query_embedding,
                                       const Timestamp now) const {
  MemorySearchResult result;

  if (query_embedding.has_value() && entry.embedding.has_value()) {
    result.semantic = std::max(0.0, cosine_similarity(*query_embedding, *entry.embedding));
  } else if (query_text.has_value()) {
    result.semantic = token_overlap(*query_text, entry.content);
  }
  result.recency = recency_score(entry.accessed_at, now, half_life_days_);
  result.importance = entry.importance;
  result.score = weights_.semantic * result.semantic + weights_.recency * result.recency +
                 weights_.importance * result.importance;
  result.entry = std::move(entry);
  return result;
}

std::vector<MemorySearchResult>
HybridRanker::rank(std::vector<MemoryEntry> candidates,
                   const std::optional<std::string> &query_text,
                   const std::optional<Embedding> &query_embedding, const std::size_t limit,
                   const Timestamp now) const {
  std::vector<MemorySearchResult> ranked;
  if (limit == 0) {
    return ranked;
  }
  ranked.reserve(candidates.size());

  for (auto &entry : candidates) {
    ranked.push_back(score(std::move(entry), query_text, query_embedding, now));
  }

  std::stable_sort(ranked.begin(), ranked.end(),
                   [](const auto &lhs, const auto &rhs) { return lhs.score > rhs.score; });

  if (ranked.size() > limit) {
    ranked.resize(limit);
  }
  return ranked;
}

std::size_t candidate_pool_size(const std::size_t limit, const std::size_t multiplier,
                                const std::size_t floor) {
  return std::max(limit * multiplier, floor);
}

} // namespace engram::memory
