#pragma once

#include "engram/memory/memory.hpp"

#include <optional>
#include <string>
#include <vector>

namespace engram::memory {

struct RankWeights {
  double semantic = 0.5;
  double recency = 0.2;
  double importance = 0.3;
};

class HybridRanker {
public:
  HybridRanker(RankWeights weights, double recency_half_life_days);

  /// Score every candidate and return the best `limit`, highest first. Ties keep
  /// candidate order.
  [[nodiscard]] std::vector<MemorySearchResult>
  rank(std::vector<MemoryEntry> candidates, const std::optional<std::string> &query_text,
       const std::optional<Embedding> &query_embedding, std::size_t limit, Timestamp now) const;

  [[nodiscard]] MemorySearchResult score(MemoryEntry entry,
                                         const std::optional<std::string> &query_text,
                                         const std::optional<Embedding> &query_embedding,
                                         Timestamp now) const;


private:
  RankWeights weights_;
  double half_life_days_;
};

/// Number of rows to pull from storage before ranking.
[[nodiscard]] std::size_t candidate_pool_size(std::size_t limit, std::size_t multiplier,
                                              std::size_t floor);

} // namespace engram::memory
