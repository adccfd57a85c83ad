#pragma once

#include "engram/config/schema.hpp"
#include "engram/memory/embedding_provider.hpp"
#include "engram/memory/hybrid_ranker.hpp"
#include "engram/memory/memory.hpp"

#include <filesystem>
#include <mutex>
#include <sqlite3.h>

namespace engram::memory {

class SqliteMemoryStore final : public IMemoryStore {
public:
  /// `db_path` may be ":memory:" for a private in-memory database.
  SqliteMemoryStore(std::filesystem::path db_path, config::MemoryConfig config,
                    std::shared_ptr<EmbeddingProvider> embeddings = nullptr);
  ~SqliteMemoryStore() override;

  SqliteMemoryStore(const SqliteMemoryStore &) = delete;
  SqliteMemoryStore &operator=(const SqliteMemoryStore &) = delete;

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] common::Result<MemoryEntry> add(const NewMemory &entry) override;
  [[nodiscard]] common::Result<std::optional<MemoryEntry>> get(const std::string &id) override;
  [[nodiscard]] common::Result<MemoryEntry> update(const std::string &id,
                                                  const MemoryUpdate &update) override;
  [[nodiscard]] common::Status remove(const std::string &id) override;
  [[nodiscard]] common::Result<std::vector<MemorySearchResult>>
  search(const MemoryQuery &query) override;
  [[nodiscard]] common::Result<std::optional<MemorySearchResult>>
  find_similar(const std::string &content, MemoryType type,
               std::optional<double> threshold = std::nullopt) override;
  [[nodiscard]] common::Result<std::size_t> count(std::optional<MemoryType> type) override;
  [[nodiscard]] common::Result<std::vector<MemoryEntry>> list(std::optional<MemoryType> type,
                                                             std::size_t limit) override;
  [[nodiscard]] common::Result<std::size_t> detach_turn(const std::string &turn_id) override;
  [[nodiscard]] bool health_check() override;
  [[nodiscard]] MemoryStats stats() override;

  void set_embed_fn(EmbedFn fn);
  void clear_embed_fn();
  [[nodiscard]] EmbeddingProvider &embeddings() { return *embeddings_; }

private:
  [[nodiscard]] common::Status init_schema();
  [[nodiscard]] common::Result<std::optional<MemoryEntry>> load_entry(const std::string &id);
  [[nodiscard]] common::Result<std::vector<MemoryEntry>>
  load_candidates(std::optional<MemoryType> type, std::optional<double> min_importance,
                  std::size_t limit);
  [[nodiscard]] MemoryEntry row_to_entry(sqlite3_stmt *stmt) const;

  std::filesystem::path db_path_;
  sqlite3 *db_ = nullptr;
  std::mutex mutex_;
  std::shared_ptr<EmbeddingProvider> embeddings_;
  config::MemoryConfig config_;
  MemoryStats stats_;
};

} // namespace engram::memory
