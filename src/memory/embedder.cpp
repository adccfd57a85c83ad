#include "engram/memory/embedder.hpp"

#include "engram/common/fs.hpp"
#include "engram/memory/embedder_local.hpp"
#include "engram/memory/embedder_openai.hpp"

#include <cstdlib>

namespace engram::memory {

std::unique_ptr<IEmbedder> create_embedder(const config::Config &config) {
  const std::string provider = common::to_lower(common::trim(config.embeddings.provider));

  if (provider == "openai") {
    std::string key;
    if (config.embeddings.api_key.has_value()) {
      key = *config.embeddings.api_key;
    } else if (const char *env = std::getenv("ENGRAM_API_KEY"); env != nullptr) {
      key = env;
    }

    if (!key.empty()) {
      return std::make_unique<OpenAiEmbedder>(key, config.embeddings.model,
                                              config.embeddings.base_url,
                                              config.embeddings.timeout_ms);
    }
  }

  return std::make_unique<LocalEmbedder>(config.memory.fallback_dimensions);
}

} // namespace engram::memory
