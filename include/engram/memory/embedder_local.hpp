#pragma once

#include "engram/memory/embedder.hpp"

namespace engram::memory {

/// Hashing bag-of-words encoder. Deterministic, no I/O, never fails.
class LocalEmbedder final : public IEmbedder {
public:
  static constexpr std::size_t kDefaultDimensions = 512;

  explicit LocalEmbedder(std::size_t dimensions = kDefaultDimensions);

  [[nodiscard]] Embedding encode(std::string_view text) const;

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] common::Result<Embedding> embed(std::string_view text) override;
  [[nodiscard]] common::Result<std::vector<Embedding>>
  embed_batch(const std::vector<std::string> &texts) override;
  [[nodiscard]] std::size_t dimensions() const override;

private:
  std::size_t dimensions_;
};

} // namespace engram::memory
