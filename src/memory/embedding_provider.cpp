#include "engram/memory/embedding_provider.hpp"

#include "engram/observability/global.hpp"

#include <cmath>
#include <exception>

namespace engram::memory {

EmbeddingProvider::EmbeddingProvider(const std::size_t fallback_dimensions)
    : fallback_(fallback_dimensions) {}

void EmbeddingProvider::set_embed_fn(EmbedFn fn) {
  std::lock_guard<std::mutex> lock(mutex_);
  embed_fn_ = std::move(fn);
}

void EmbeddingProvider::clear_embed_fn() {
  std::lock_guard<std::mutex> lock(mutex_);
  embed_fn_ = nullptr;
}

bool EmbeddingProvider::has_embed_fn() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<bool>(embed_fn_);
}

Embedding EmbeddingProvider::generate_embedding(const std::string &text) {
  EmbedFn fn;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    fn = embed_fn_;
  }
  if (!fn) {
    return fallback_.encode(text);
  }

  common::Result<std::vector<Embedding>> result =
      common::Result<std::vector<Embedding>>::failure("not called");
  try {
    result = fn({text});
  } catch (const std::exception &e) {
    return fall_back(text, std::string("embedding function threw: ") + e.what());
  } catch (...) {
    return fall_back(text, "embedding function threw a non-standard exception");
  }

  if (!result.ok()) {
    return fall_back(text, result.error());
  }
  if (result.value().size() != 1) {
    return fall_back(text, "embedding function returned " +
                               std::to_string(result.value().size()) + " vectors for 1 input");
  }

  Embedding &embedding = result.value().front();
  if (embedding.empty()) {
    return fall_back(text, "embedding function returned an empty vector");
  }
  for (const double v : embedding) {
    if (!std::isfinite(v)) {
      return fall_back(text, "embedding function returned a non-finite value");
    }
  }
  return std::move(embedding);
}

Embedding EmbeddingProvider::fall_back(const std::string &text, const std::string &reason) {
  ++fallbacks_;
  observability::record_embedding_fallback(reason);
  return fallback_.encode(text);
}

EmbedFn make_embed_fn(std::shared_ptr<IEmbedder> embedder) {
  return [embedder = std::move(embedder)](const std::vector<std::string> &texts) {
    return embedder->embed_batch(texts);
  };
}

} // namespace engram::memory
