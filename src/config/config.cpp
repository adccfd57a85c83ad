#include "engram/config/config.hpp"

#include "engram/common/fs.hpp"
#include "engram/common/toml.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace engram::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".engram";
constexpr const char *CONFIG_FILENAME = "config.toml";

const char *non_empty_env(const char *name) {
  const char *value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return nullptr;
  }
  return value;
}

void apply_memory_section(const common::TomlDocument &doc, MemoryConfig &memory) {
  memory.db_path = doc.get_string("memory.db_path", memory.db_path);
  memory.fallback_dimensions = static_cast<std::size_t>(
      doc.get_u64("memory.fallback_dimensions", memory.fallback_dimensions));
  memory.candidate_floor =
      static_cast<std::size_t>(doc.get_u64("memory.candidate_floor", memory.candidate_floor));
  memory.candidate_multiplier = static_cast<std::size_t>(
      doc.get_u64("memory.candidate_multiplier", memory.candidate_multiplier));
  memory.default_limit =
      static_cast<std::size_t>(doc.get_u64("memory.default_limit", memory.default_limit));
  memory.recency_half_life_days =
      doc.get_double("memory.recency_half_life_days", memory.recency_half_life_days);
  memory.semantic_weight = doc.get_double("memory.semantic_weight", memory.semantic_weight);
  memory.recency_weight = doc.get_double("memory.recency_weight", memory.recency_weight);
  memory.importance_weight = doc.get_double("memory.importance_weight", memory.importance_weight);
  memory.dedup_threshold = doc.get_double("memory.dedup_threshold", memory.dedup_threshold);
}

void apply_embeddings_section(const common::TomlDocument &doc, EmbeddingsConfig &embeddings) {
  embeddings.provider = doc.get_string("embeddings.provider", embeddings.provider);
  embeddings.model = doc.get_string("embeddings.model", embeddings.model);
  embeddings.base_url = doc.get_string("embeddings.base_url", embeddings.base_url);
  if (doc.has("embeddings.api_key")) {
    const std::string key = doc.get_string("embeddings.api_key");
    if (!key.empty()) {
      embeddings.api_key = common::expand_path(key);
    }
  }
  embeddings.timeout_ms = doc.get_u64("embeddings.timeout_ms", embeddings.timeout_ms);
}

} // namespace

common::Result<std::filesystem::path> config_path() {
  if (const char *env = non_empty_env("ENGRAM_CONFIG_PATH"); env != nullptr) {
    return common::Result<std::filesystem::path>::success(common::expand_path(env));
  }
  auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER /
                                                        CONFIG_FILENAME);
}

common::Result<Config> parse_config(const std::string &toml) {
  auto parsed = common::parse_toml(toml);
  if (!parsed.ok()) {
    return common::Result<Config>::failure("Failed to parse config: " + parsed.error());
  }

  Config config;
  apply_memory_section(parsed.value(), config.memory);
  apply_embeddings_section(parsed.value(), config.embeddings);
  config.observability.backend =
      parsed.value().get_string("observability.backend", config.observability.backend);
  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config(const std::filesystem::path &path) {
  Config config;
  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    std::ifstream file(path);
    if (!file) {
      return common::Result<Config>::failure("Failed to open config: " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    auto parsed = parse_config(buffer.str());
    if (!parsed.ok()) {
      return parsed;
    }
    config = std::move(parsed.value());
  }

  apply_env_overrides(config);
  config.memory.db_path = common::expand_path(config.memory.db_path);
  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  auto path = config_path();
  if (!path.ok()) {
    return common::Result<Config>::failure(path.error());
  }
  return load_config(path.value());
}

common::Status save_config(const Config &config, const std::filesystem::path &path) {
  auto dir = common::ensure_dir(path.parent_path());
  if (!dir.ok()) {
    return common::Status::error(dir.error());
  }

  std::ofstream file(path, std::ios::trunc);
  if (!file) {
    return common::Status::error("Failed to write config: " + path.string());
  }

  file << "[memory]\n";
  file << "db_path = " << common::quote_toml_string(config.memory.db_path) << "\n";
  file << "fallback_dimensions = " << config.memory.fallback_dimensions << "\n";
  file << "candidate_floor = " << config.memory.candidate_floor << "\n";
  file << "candidate_multiplier = " << config.memory.candidate_multiplier << "\n";
  file << "default_limit = " << config.memory.default_limit << "\n";
  file << "recency_half_life_days = " << config.memory.recency_half_life_days << "\n";
  file << "semantic_weight = " << config.memory.semantic_weight << "\n";
  file << "recency_weight = " << config.memory.recency_weight << "\n";
  file << "importance_weight = " << config.memory.importance_weight << "\n";
  file << "dedup_threshold = " << config.memory.dedup_threshold << "\n\n";

  file << "[embeddings]\n";
  file << "provider = " << common::quote_toml_string(config.embeddings.provider) << "\n";
  file << "model = " << common::quote_toml_string(config.embeddings.model) << "\n";
  file << "base_url = " << common::quote_toml_string(config.embeddings.base_url) << "\n";
  file << "timeout_ms = " << config.embeddings.timeout_ms << "\n\n";

  file << "[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";

  if (!file) {
    return common::Status::error("Failed to write config: " + path.string());
  }
  return common::Status::success();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;
  const auto &memory = config.memory;

  if (memory.fallback_dimensions == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "memory.fallback_dimensions must be positive");
  }
  if (memory.semantic_weight < 0.0 || memory.recency_weight < 0.0 ||
      memory.importance_weight < 0.0) {
    return common::Result<std::vector<std::string>>::failure(
        "memory weights must be non-negative");
  }
  if (memory.dedup_threshold < 0.0 || memory.dedup_threshold > 1.0) {
    return common::Result<std::vector<std::string>>::failure(
        "memory.dedup_threshold must be within [0, 1]");
  }
  if (memory.recency_half_life_days <= 0.0) {
    return common::Result<std::vector<std::string>>::failure(
        "memory.recency_half_life_days must be positive");
  }
  if (memory.candidate_multiplier == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "memory.candidate_multiplier must be positive");
  }

  const std::string provider = common::to_lower(common::trim(config.embeddings.provider));
  if (provider != "local" && provider != "openai") {
    return common::Result<std::vector<std::string>>::failure("Invalid embeddings.provider: " +
                                                              config.embeddings.provider);
  }
  if (provider == "openai" && !config.embeddings.api_key.has_value()) {
    warnings.push_back("embeddings.provider is openai but no API key is set; local fallback "
                       "encoder will be used");
  }

  if (memory.semantic_weight + memory.recency_weight + memory.importance_weight == 0.0) {
    warnings.push_back("all memory weights are zero; search results will be unranked");
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

void apply_env_overrides(Config &config) {
  if (const char *db_path = non_empty_env("ENGRAM_DB_PATH"); db_path != nullptr) {
    config.memory.db_path = db_path;
  }
  if (const char *provider = non_empty_env("ENGRAM_EMBEDDING_PROVIDER"); provider != nullptr) {
    config.embeddings.provider = provider;
  }
  if (const char *api_key = non_empty_env("ENGRAM_API_KEY"); api_key != nullptr) {
    config.embeddings.api_key = std::string(api_key);
  }
  if (const char *backend = non_empty_env("ENGRAM_OBSERVABILITY"); backend != nullptr) {
    config.observability.backend = backend;
  }
}

} // namespace engram::config
