#pragma once

#include "engram/memory/embedder.hpp"
#include "engram/memory/embedder_local.hpp"

#include <atomic>
#include <functional>
#include <mutex>

namespace engram::memory {

using EmbedFn =
    std::function<common::Result<std::vector<Embedding>>(const std::vector<std::string> &)>;

/// Holds the optional external embedding function and falls back to the local
/// encoder whenever it is absent or fails. generate_embedding never fails.
class EmbeddingProvider {
public:
  explicit EmbeddingProvider(std::size_t fallback_dimensions = LocalEmbedder::kDefaultDimensions);

  void set_embed_fn(EmbedFn fn);
  void clear_embed_fn();
  [[nodiscard]] bool has_embed_fn() const;

  [[nodiscard]] Embedding generate_embedding(const std::string &text);

  /// Number of times a configured external function failed and the fallback was used.
  [[nodiscard]] std::size_t fallback_count() const { return fallbacks_.load(); }

private:
  Embedding fall_back(const std::string &text, const std::string &reason);

  mutable std::mutex mutex_;
  EmbedFn embed_fn_;
  LocalEmbedder fallback_;
  std::atomic<std::size_t> fallbacks_{0};
};

/// Adapt an embedder into an EmbedFn. The embedder is shared with the returned function.
[[nodiscard]] EmbedFn make_embed_fn(std::shared_ptr<IEmbedder> embedder);

} // namespace engram::memory
