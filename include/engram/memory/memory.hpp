#pragma once

#include "engram/common/json_util.hpp"
#include "engram/common/result.hpp"
#include "engram/config/schema.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace engram::memory {

using Clock = std::chrono::system_clock;
using Timestamp = std::chrono::time_point<Clock, std::chrono::milliseconds>;
using Embedding = std::vector<double>;
using Metadata = common::JsonFlatMap;

enum class MemoryType {
  Fact,
  Preference,
  Entity,
  Episodic,
};

[[nodiscard]] std::string memory_type_to_string(MemoryType type);
[[nodiscard]] common::Result<MemoryType> memory_type_from_string(std::string_view value);

struct MemoryEntry {
  std::string id;
  MemoryType type = MemoryType::Fact;
  std::string content;
  /// Weak reference to a conversation turn; cleared by detach_turn().
  std::optional<std::string> source_turn_id;
  double importance = 0.5;
  std::optional<Embedding> embedding;
  Timestamp created_at{};
  Timestamp accessed_at{};
  std::uint64_t access_count = 0;
  std::optional<Metadata> metadata;
};

/// Payload for IMemoryStore::add. An absent or empty embedding is generated by the store.
struct NewMemory {
  MemoryType type = MemoryType::Fact;
  std::string content;
  std::optional<std::string> source_turn_id;
  double importance = 0.5;
  std::optional<Embedding> embedding;
  std::optional<Metadata> metadata;
};

/// Partial update. A disengaged outer optional leaves the column untouched; for the
/// nullable columns an engaged outer optional holding std::nullopt clears the value.
struct MemoryUpdate {
  std::optional<MemoryType> type;
  std::optional<std::string> content;
  std::optional<double> importance;
  std::optional<std::optional<std::string>> source_turn_id;
  std::optional<std::optional<Embedding>> embedding;
  std::optional<std::optional<Metadata>> metadata;

  [[nodiscard]] bool empty() const {
    return !type && !content && !importance && !source_turn_id && !embedding && !metadata;
  }
};

struct MemoryQuery {
  std::optional<std::string> text;
  std::optional<MemoryType> type;
  std::optional<double> min_importance;
  std::optional<std::size_t> limit;
  std::optional<double> semantic_weight;
  std::optional<double> recency_weight;
  std::optional<double> importance_weight;
};

struct MemorySearchResult {
  MemoryEntry entry;
  double score = 0.0;
  double semantic = 0.0;
  double recency = 0.0;
  double importance = 0.0;
};

struct MemoryStats {
  std::size_t total_entries = 0;
  std::size_t embedded_entries = 0;
  std::size_t embedding_fallbacks = 0;
  std::size_t searches = 0;
};

class IMemoryStore {
public:
  virtual ~IMemoryStore() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual common::Result<MemoryEntry> add(const NewMemory &entry) = 0;
  /// Fetch by id. Counts as an access: bumps accessed_at and access_count.
  [[nodiscard]] virtual common::Result<std::optional<MemoryEntry>> get(const std::string &id) = 0;
  [[nodiscard]] virtual common::Result<MemoryEntry> update(const std::string &id,
                                                          const MemoryUpdate &update) = 0;
  /// Idempotent; removing an unknown id succeeds.
  [[nodiscard]] virtual common::Status remove(const std::string &id) = 0;
  [[nodiscard]] virtual common::Result<std::vector<MemorySearchResult>>
  search(const MemoryQuery &query) = 0;
  /// Duplicate lookup within `type`. Without a threshold the configured dedup threshold applies.
  [[nodiscard]] virtual common::Result<std::optional<MemorySearchResult>>
  find_similar(const std::string &content, MemoryType type,
               std::optional<double> threshold = std::nullopt) = 0;
  [[nodiscard]] virtual common::Result<std::size_t> count(std::optional<MemoryType> type) = 0;
  [[nodiscard]] virtual common::Result<std::vector<MemoryEntry>>
  list(std::optional<MemoryType> type, std::size_t limit) = 0;
  [[nodiscard]] virtual common::Result<std::size_t> detach_turn(const std::string &turn_id) = 0;
  [[nodiscard]] virtual bool health_check() = 0;
  [[nodiscard]] virtual MemoryStats stats() = 0;
};

[[nodiscard]] std::unique_ptr<IMemoryStore> create_memory_store(const config::Config &config);

[[nodiscard]] common::Result<std::string> generate_memory_id();

[[nodiscard]] Timestamp now();
/// ISO-8601 UTC with millisecond precision, e.g. 2024-05-01T12:30:00.250Z.
[[nodiscard]] std::string format_timestamp(Timestamp ts);
/// Accepts the format above, second precision, and SQLite's "YYYY-MM-DD HH:MM:SS".
[[nodiscard]] std::optional<Timestamp> parse_timestamp(const std::string &value);
/// exp(-age / half_life); ages in the future count as zero.
[[nodiscard]] double recency_score(Timestamp accessed_at, Timestamp reference,
                                   double half_life_days);

} // namespace engram::memory
