#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace engram::config {

struct MemoryConfig {
  std::string db_path = "~/.engram/memory.db";
  std::size_t fallback_dimensions = 512;
  std::size_t candidate_floor = 60;
  std::size_t candidate_multiplier = 3;
  std::size_t default_limit = 20;
  double recency_half_life_days = 7.0;
  double semantic_weight = 0.5;
  double recency_weight = 0.2;
  double importance_weight = 0.3;
  double dedup_threshold = 0.75;
};

struct EmbeddingsConfig {
  std::string provider = "local";
  std::string model = "text-embedding-3-small";
  std::string base_url = "https://api.openai.com/v1";
  std::optional<std::string> api_key;
  std::uint64_t timeout_ms = 30'000;
};

struct ObservabilityConfig {
  std::string backend = "none";
};

struct Config {
  MemoryConfig memory;
  EmbeddingsConfig embeddings;
  ObservabilityConfig observability;
};

} // namespace engram::config
