#include "engram/memory/sqlite_store.hpp"

#include "engram/common/fs.hpp"
#include "engram/common/json_util.hpp"
#include "engram/memory/duplicate_detector.hpp"
#include "engram/observability/global.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <functional>

namespace engram::memory {

namespace {

constexpr const char *kSelectColumns =
    "SELECT id, type, content, source_turn_id, importance, embedding, created_at, accessed_at, "
    "access_count, metadata FROM memories";

std::vector<unsigned char> embedding_to_blob(const Embedding &values) {
  std::vector<unsigned char> blob(values.size() * sizeof(double));
  std::memcpy(blob.data(), values.data(), blob.size());
  return blob;
}

std::optional<Embedding> blob_to_embedding(const void *blob, const int bytes) {
  if (blob == nullptr || bytes <= 0 || (bytes % static_cast<int>(sizeof(double)) != 0)) {
    return std::nullopt;
  }

  const std::size_t length = static_cast<std::size_t>(bytes) / sizeof(double);
  Embedding values(length);
  std::memcpy(values.data(), blob, static_cast<std::size_t>(bytes));
  for (const double v : values) {
    if (!std::isfinite(v)) {
      return std::nullopt;
    }
  }
  return values;
}

std::optional<std::string> column_text(sqlite3_stmt *stmt, const int col) {
  const unsigned char *text = sqlite3_column_text(stmt, col);
  if (text == nullptr) {
    return std::nullopt;
  }
  return std::string(reinterpret_cast<const char *>(text));
}

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(msg);
  }
  return common::Status::success();
}

template <typename T> common::Result<T> storage_failure(const std::string &message) {
  observability::record_error("memory", message);
  return common::Result<T>::failure(message);
}

common::Status storage_error(const std::string &message) {
  observability::record_error("memory", message);
  return common::Status::error(message);
}

common::Status validate_embedding(const Embedding &values) {
  for (const double v : values) {
    if (!std::isfinite(v)) {
      return common::Status::error("embedding contains non-finite values");
    }
  }
  return common::Status::success();
}

common::Result<double> clamp_importance(const double importance) {
  if (!std::isfinite(importance)) {
    return common::Result<double>::failure("importance must be finite");
  }
  return common::Result<double>::success(std::clamp(importance, 0.0, 1.0));
}

void bind_optional_text(sqlite3_stmt *stmt, const int index,
                        const std::optional<std::string> &value) {
  if (value.has_value()) {
    sqlite3_bind_text(stmt, index, value->c_str(), -1, SQLITE_TRANSIENT);
  } else {
    sqlite3_bind_null(stmt, index);
  }
}

void bind_optional_embedding(sqlite3_stmt *stmt, const int index,
                             const std::optional<Embedding> &value) {
  if (value.has_value() && !value->empty()) {
    const auto blob = embedding_to_blob(*value);
    sqlite3_bind_blob(stmt, index, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
  } else {
    sqlite3_bind_null(stmt, index);
  }
}

std::optional<std::string> metadata_to_json(const std::optional<Metadata> &metadata) {
  if (!metadata.has_value()) {
    return std::nullopt;
  }
  return common::json_serialize_flat(*metadata);
}

} // namespace

SqliteMemoryStore::SqliteMemoryStore(std::filesystem::path db_path, config::MemoryConfig config,
                                     std::shared_ptr<EmbeddingProvider> embeddings)
    : db_path_(std::move(db_path)), embeddings_(std::move(embeddings)),
      config_(std::move(config)) {
  if (embeddings_ == nullptr) {
    embeddings_ = std::make_shared<EmbeddingProvider>(config_.fallback_dimensions);
  }

  if (db_path_ != ":memory:") {
    auto dir = common::ensure_dir(db_path_.parent_path());
    if (!dir.ok()) {
      observability::record_error("memory", dir.error());
      return;
    }
  }

  if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
    const std::string msg =
        db_ == nullptr ? "sqlite3_open failed" : std::string(sqlite3_errmsg(db_));
    observability::record_error("memory", "failed to open " + db_path_.string() + ": " + msg);
    if (db_ != nullptr) {
      sqlite3_close(db_);
    }
    db_ = nullptr;
    return;
  }

  auto status = init_schema();
  if (!status.ok()) {
    observability::record_error("memory", "schema initialization failed: " + status.error());
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

SqliteMemoryStore::~SqliteMemoryStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

std::string_view SqliteMemoryStore::name() const { return "sqlite"; }

common::Status SqliteMemoryStore::init_schema() {
  if (db_ == nullptr) {
    return common::Status::error("database not initialized");
  }

  sqlite3_busy_timeout(db_, 5'000);

  auto status = exec_sql(db_, "PRAGMA journal_mode=WAL;");
  if (!status.ok()) {
    return status;
  }

  status = exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS memories (
  id TEXT PRIMARY KEY,
  type TEXT NOT NULL CHECK (type IN ('fact', 'preference', 'entity', 'episodic')),
  content TEXT NOT NULL,
  source_turn_id TEXT,
  importance REAL NOT NULL DEFAULT 0.5,
  embedding BLOB,
  created_at TEXT NOT NULL,
  accessed_at TEXT NOT NULL,
  access_count INTEGER NOT NULL DEFAULT 0,
  metadata TEXT
);
)");
  if (!status.ok()) {
    return status;
  }

  status = exec_sql(db_, "CREATE INDEX IF NOT EXISTS idx_memories_type_importance "
                         "ON memories(type, importance);");
  if (!status.ok()) {
    return status;
  }

  return exec_sql(db_, "CREATE INDEX IF NOT EXISTS idx_memories_source_turn "
                       "ON memories(source_turn_id);");
}

MemoryEntry SqliteMemoryStore::row_to_entry(sqlite3_stmt *stmt) const {
  MemoryEntry entry;
  entry.id = column_text(stmt, 0).value_or("");
  if (const auto type = column_text(stmt, 1); type.has_value()) {
    entry.type = memory_type_from_string(*type).value_or(MemoryType::Fact);
  }
  entry.content = column_text(stmt, 2).value_or("");
  entry.source_turn_id = column_text(stmt, 3);
  entry.importance = sqlite3_column_double(stmt, 4);
  entry.embedding = blob_to_embedding(sqlite3_column_blob(stmt, 5), sqlite3_column_bytes(stmt, 5));
  entry.created_at = parse_timestamp(column_text(stmt, 6).value_or("")).value_or(Timestamp{});
  entry.accessed_at = parse_timestamp(column_text(stmt, 7).value_or("")).value_or(Timestamp{});
  const sqlite3_int64 access_count = sqlite3_column_int64(stmt, 8);
  entry.access_count = access_count < 0 ? 0 : static_cast<std::uint64_t>(access_count);

  if (const auto metadata = column_text(stmt, 9); metadata.has_value()) {
    auto parsed = common::json_parse_flat(*metadata);
    if (parsed.ok()) {
      entry.metadata = std::move(parsed.value());
    }
  }
  return entry;
}

common::Result<std::optional<MemoryEntry>> SqliteMemoryStore::load_entry(const std::string &id) {
  sqlite3_stmt *stmt = nullptr;
  const std::string sql = std::string(kSelectColumns) + " WHERE id = ?1";
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return storage_failure<std::optional<MemoryEntry>>(sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    auto entry = row_to_entry(stmt);
    sqlite3_finalize(stmt);
    return common::Result<std::optional<MemoryEntry>>::success(std::move(entry));
  }

  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return storage_failure<std::optional<MemoryEntry>>(sqlite3_errmsg(db_));
  }
  return common::Result<std::optional<MemoryEntry>>::success(std::nullopt);
}

common::Result<MemoryEntry> SqliteMemoryStore::add(const NewMemory &entry) {
  auto importance = clamp_importance(entry.importance);
  if (!importance.ok()) {
    return importance.forward_error<MemoryEntry>();
  }

  MemoryEntry created;
  created.type = entry.type;
  created.content = entry.content;
  created.source_turn_id = entry.source_turn_id;
  created.importance = importance.value();
  created.metadata = entry.metadata;

  if (entry.embedding.has_value() && !entry.embedding->empty()) {
    auto valid = validate_embedding(*entry.embedding);
    if (!valid.ok()) {
      return common::Result<MemoryEntry>::failure(valid.error());
    }
    created.embedding = entry.embedding;
  } else {
    // Generated outside the store lock; the external function may be slow.
    created.embedding = embeddings_->generate_embedding(entry.content);
  }

  auto id = generate_memory_id();
  if (!id.ok()) {
    return id.forward_error<MemoryEntry>();
  }
  created.id = id.value();
  created.created_at = now();
  created.accessed_at = created.created_at;
  created.access_count = 0;

  const std::string timestamp = format_timestamp(created.created_at);
  const auto metadata_json = metadata_to_json(created.metadata);
  const std::string type_value = memory_type_to_string(created.type);

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_ == nullptr) {
      return common::Result<MemoryEntry>::failure("database not initialized");
    }

    sqlite3_stmt *stmt = nullptr;
    const char *sql = R"(
INSERT INTO memories(id, type, content, source_turn_id, importance, embedding, created_at,
                     accessed_at, access_count, metadata)
VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, 0, ?9)
)";
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
      return storage_failure<MemoryEntry>(sqlite3_errmsg(db_));
    }

    sqlite3_bind_text(stmt, 1, created.id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, type_value.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, created.content.c_str(), -1, SQLITE_TRANSIENT);
    bind_optional_text(stmt, 4, created.source_turn_id);
    sqlite3_bind_double(stmt, 5, created.importance);
    bind_optional_embedding(stmt, 6, created.embedding);
    sqlite3_bind_text(stmt, 7, timestamp.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 8, timestamp.c_str(), -1, SQLITE_TRANSIENT);
    bind_optional_text(stmt, 9, metadata_json);

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
      return storage_failure<MemoryEntry>(sqlite3_errmsg(db_));
    }
  }

  observability::record_memory_write("add", created.id);
  return common::Result<MemoryEntry>::success(std::move(created));
}

common::Result<std::optional<MemoryEntry>> SqliteMemoryStore::get(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::optional<MemoryEntry>>::failure("database not initialized");
  }

  auto status = exec_sql(db_, "BEGIN IMMEDIATE;");
  if (!status.ok()) {
    return storage_failure<std::optional<MemoryEntry>>(status.error());
  }

  const auto rollback = [this](const std::string &message) {
    (void)exec_sql(db_, "ROLLBACK;");
    return storage_failure<std::optional<MemoryEntry>>(message);
  };

  sqlite3_stmt *stmt = nullptr;
  // Keep a later stored accessed_at only when it is a timestamp; text compares would let
  // garbage outrank every date.
  const char *sql = "UPDATE memories SET accessed_at = CASE "
                    "WHEN accessed_at GLOB '[0-9][0-9][0-9][0-9]-[0-9][0-9]-[0-9][0-9]*' "
                    "AND accessed_at > ?1 THEN accessed_at ELSE ?1 END, "
                    "access_count = access_count + 1 WHERE id = ?2";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return rollback(sqlite3_errmsg(db_));
  }

  const std::string timestamp = format_timestamp(now());
  sqlite3_bind_text(stmt, 1, timestamp.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, id.c_str(), -1, SQLITE_TRANSIENT);
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return rollback(sqlite3_errmsg(db_));
  }

  std::optional<MemoryEntry> entry;
  if (sqlite3_changes(db_) > 0) {
    auto loaded = load_entry(id);
    if (!loaded.ok()) {
      return rollback(loaded.error());
    }
    entry = std::move(loaded.value());
  }

  status = exec_sql(db_, "COMMIT;");
  if (!status.ok()) {
    return rollback(status.error());
  }
  return common::Result<std::optional<MemoryEntry>>::success(std::move(entry));
}

common::Result<MemoryEntry> SqliteMemoryStore::update(const std::string &id,
                                                      const MemoryUpdate &update) {
  using Binder = std::function<void(sqlite3_stmt *, int)>;
  std::vector<std::pair<std::string, Binder>> assignments;

  if (update.type.has_value()) {
    const std::string value = memory_type_to_string(*update.type);
    assignments.emplace_back("type", [value](sqlite3_stmt *stmt, const int index) {
      sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
    });
  }
  if (update.content.has_value()) {
    const std::string value = *update.content;
    assignments.emplace_back("content", [value](sqlite3_stmt *stmt, const int index) {
      sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
    });
  }
  if (update.importance.has_value()) {
    auto importance = clamp_importance(*update.importance);
    if (!importance.ok()) {
      return importance.forward_error<MemoryEntry>();
    }
    const double value = importance.value();
    assignments.emplace_back("importance", [value](sqlite3_stmt *stmt, const int index) {
      sqlite3_bind_double(stmt, index, value);
    });
  }
  if (update.source_turn_id.has_value()) {
    const std::optional<std::string> value = *update.source_turn_id;
    assignments.emplace_back("source_turn_id", [value](sqlite3_stmt *stmt, const int index) {
      bind_optional_text(stmt, index, value);
    });
  }
  if (update.embedding.has_value()) {
    const std::optional<Embedding> value = *update.embedding;
    if (value.has_value()) {
      auto valid = validate_embedding(*value);
      if (!valid.ok()) {
        return common::Result<MemoryEntry>::failure(valid.error());
      }
    }
    // An empty vector clears, same as nullopt.
    assignments.emplace_back("embedding", [value](sqlite3_stmt *stmt, const int index) {
      bind_optional_embedding(stmt, index, value);
    });
  }
  if (update.metadata.has_value()) {
    const auto value = metadata_to_json(*update.metadata);
    assignments.emplace_back("metadata", [value](sqlite3_stmt *stmt, const int index) {
      bind_optional_text(stmt, index, value);
    });
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<MemoryEntry>::failure("database not initialized");
  }

  if (!assignments.empty()) {
    std::string sql = "UPDATE memories SET ";
    for (std::size_t i = 0; i < assignments.size(); ++i) {
      if (i > 0) {
        sql += ", ";
      }
      sql += assignments[i].first + " = ?" + std::to_string(i + 1);
    }
    sql += " WHERE id = ?" + std::to_string(assignments.size() + 1);

    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
      return storage_failure<MemoryEntry>(sqlite3_errmsg(db_));
    }
    for (std::size_t i = 0; i < assignments.size(); ++i) {
      assignments[i].second(stmt, static_cast<int>(i + 1));
    }
    sqlite3_bind_text(stmt, static_cast<int>(assignments.size() + 1), id.c_str(), -1,
                      SQLITE_TRANSIENT);

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
      return storage_failure<MemoryEntry>(sqlite3_errmsg(db_));
    }
    if (sqlite3_changes(db_) == 0) {
      return common::Result<MemoryEntry>::failure("memory not found: " + id);
    }
  }

  auto loaded = load_entry(id);
  if (!loaded.ok()) {
    return loaded.forward_error<MemoryEntry>();
  }
  if (!loaded.value().has_value()) {
    return common::Result<MemoryEntry>::failure("memory not found: " + id);
  }

  if (!assignments.empty()) {
    observability::record_memory_write("update", id);
  }
  return common::Result<MemoryEntry>::success(std::move(*loaded.value()));
}

common::Status SqliteMemoryStore::remove(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error("database not initialized");
  }

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "DELETE FROM memories WHERE id = ?1", -1, &stmt, nullptr) !=
      SQLITE_OK) {
    return storage_error(sqlite3_errmsg(db_));
  }

  sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return storage_error(sqlite3_errmsg(db_));
  }

  if (sqlite3_changes(db_) > 0) {
    observability::record_memory_write("remove", id);
  }
  return common::Status::success();
}

common::Result<std::vector<MemoryEntry>>
SqliteMemoryStore::load_candidates(const std::optional<MemoryType> type,
                                   const std::optional<double> min_importance,
                                   const std::size_t limit) {
  std::string sql = kSelectColumns;
  std::vector<std::string> conditions;
  if (type.has_value()) {
    conditions.emplace_back("type = ?" + std::to_string(conditions.size() + 1));
  }
  if (min_importance.has_value()) {
    conditions.emplace_back("importance >= ?" + std::to_string(conditions.size() + 1));
  }
  for (std::size_t i = 0; i < conditions.size(); ++i) {
    sql += i == 0 ? " WHERE " : " AND ";
    sql += conditions[i];
  }
  sql += " ORDER BY importance DESC, accessed_at DESC LIMIT ?" +
         std::to_string(conditions.size() + 1);

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return storage_failure<std::vector<MemoryEntry>>(sqlite3_errmsg(db_));
  }

  int index = 1;
  std::string type_value;
  if (type.has_value()) {
    type_value = memory_type_to_string(*type);
    sqlite3_bind_text(stmt, index++, type_value.c_str(), -1, SQLITE_TRANSIENT);
  }
  if (min_importance.has_value()) {
    sqlite3_bind_double(stmt, index++, *min_importance);
  }
  sqlite3_bind_int64(stmt, index, static_cast<sqlite3_int64>(limit));

  std::vector<MemoryEntry> entries;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    entries.push_back(row_to_entry(stmt));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return storage_failure<std::vector<MemoryEntry>>(sqlite3_errmsg(db_));
  }
  return common::Result<std::vector<MemoryEntry>>::success(std::move(entries));
}

common::Result<std::vector<MemorySearchResult>>
SqliteMemoryStore::search(const MemoryQuery &query) {
  const auto started = std::chrono::steady_clock::now();

  const std::size_t limit = query.limit.value_or(config_.default_limit);
  const RankWeights weights{
      .semantic = query.semantic_weight.value_or(config_.semantic_weight),
      .recency = query.recency_weight.value_or(config_.recency_weight),
      .importance = query.importance_weight.value_or(config_.importance_weight),
  };

  std::optional<std::string> text;
  if (query.text.has_value() && !common::trim(*query.text).empty()) {
    text = *query.text;
  }

  std::optional<Embedding> query_embedding;
  if (weights.semantic > 0.0 && text.has_value() && limit > 0) {
    query_embedding = embeddings_->generate_embedding(*text);
  }

  std::vector<MemoryEntry> candidates;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_ == nullptr) {
      return common::Result<std::vector<MemorySearchResult>>::failure("database not initialized");
    }
    ++stats_.searches;
    if (limit == 0) {
      return common::Result<std::vector<MemorySearchResult>>::success({});
    }

    auto loaded = load_candidates(
        query.type, query.min_importance,
        candidate_pool_size(limit, config_.candidate_multiplier, config_.candidate_floor));
    if (!loaded.ok()) {
      return loaded.forward_error<std::vector<MemorySearchResult>>();
    }
    candidates = std::move(loaded.value());
  }

  const std::size_t candidate_count = candidates.size();
  const HybridRanker ranker(weights, config_.recency_half_life_days);
  auto ranked = ranker.rank(std::move(candidates), text, query_embedding, limit, now());

  observability::record_memory_search(candidate_count, ranked.size(),
                                      query_embedding.has_value());
  observability::record_metric(observability::SearchLatencyMetric{
      .latency = std::chrono::duration_cast<std::chrono::microseconds>(
          std::chrono::steady_clock::now() - started)});
  return common::Result<std::vector<MemorySearchResult>>::success(std::move(ranked));
}

common::Result<std::optional<MemorySearchResult>>
SqliteMemoryStore::find_similar(const std::string &content, const MemoryType type,
                                const std::optional<double> threshold) {
  return memory::find_similar(*this, content, type, threshold.value_or(config_.dedup_threshold));
}

common::Result<std::size_t> SqliteMemoryStore::count(const std::optional<MemoryType> type) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::size_t>::failure("database not initialized");
  }

  sqlite3_stmt *stmt = nullptr;
  const char *sql = type.has_value() ? "SELECT COUNT(*) FROM memories WHERE type = ?1"
                                     : "SELECT COUNT(*) FROM memories";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return storage_failure<std::size_t>(sqlite3_errmsg(db_));
  }

  std::string type_value;
  if (type.has_value()) {
    type_value = memory_type_to_string(*type);
    sqlite3_bind_text(stmt, 1, type_value.c_str(), -1, SQLITE_TRANSIENT);
  }

  std::size_t value = 0;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    value = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
  }
  sqlite3_finalize(stmt);
  return common::Result<std::size_t>::success(value);
}

common::Result<std::vector<MemoryEntry>>
SqliteMemoryStore::list(const std::optional<MemoryType> type, const std::size_t limit) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::vector<MemoryEntry>>::failure("database not initialized");
  }
  return load_candidates(type, std::nullopt, limit);
}

common::Result<std::size_t> SqliteMemoryStore::detach_turn(const std::string &turn_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::size_t>::failure("database not initialized");
  }

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "UPDATE memories SET source_turn_id = NULL WHERE source_turn_id = ?1",
                         -1, &stmt, nullptr) != SQLITE_OK) {
    return storage_failure<std::size_t>(sqlite3_errmsg(db_));
  }

  sqlite3_bind_text(stmt, 1, turn_id.c_str(), -1, SQLITE_TRANSIENT);
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return storage_failure<std::size_t>(sqlite3_errmsg(db_));
  }
  return common::Result<std::size_t>::success(static_cast<std::size_t>(sqlite3_changes(db_)));
}

bool SqliteMemoryStore::health_check() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return false;
  }

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT 1", -1, &stmt, nullptr) != SQLITE_OK) {
    return false;
  }
  const bool ok = sqlite3_step(stmt) == SQLITE_ROW;
  sqlite3_finalize(stmt);
  return ok;
}

MemoryStats SqliteMemoryStore::stats() {
  MemoryStats out;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    out = stats_;
    out.embedding_fallbacks = embeddings_->fallback_count();
    if (db_ == nullptr) {
      return out;
    }

    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*), COUNT(embedding) FROM memories", -1, &stmt,
                           nullptr) == SQLITE_OK) {
      if (sqlite3_step(stmt) == SQLITE_ROW) {
        out.total_entries = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
        out.embedded_entries = static_cast<std::size_t>(sqlite3_column_int64(stmt, 1));
      }
      sqlite3_finalize(stmt);
    }
  }

  observability::record_metric(observability::StoreSizeMetric{.entries = out.total_entries});
  return out;
}

void SqliteMemoryStore::set_embed_fn(EmbedFn fn) { embeddings_->set_embed_fn(std::move(fn)); }

void SqliteMemoryStore::clear_embed_fn() { embeddings_->clear_embed_fn(); }

} // namespace engram::memory
