#pragma once

#include "engram/common/result.hpp"
#include "engram/config/schema.hpp"
#include "engram/memory/memory.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace engram::memory {

class IEmbedder {
public:
  virtual ~IEmbedder() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual common::Result<Embedding> embed(std::string_view text) = 0;
  [[nodiscard]] virtual common::Result<std::vector<Embedding>>
  embed_batch(const std::vector<std::string> &texts) = 0;
  [[nodiscard]] virtual std::size_t dimensions() const = 0;
};

/// openai when an API key is configured, local otherwise.
[[nodiscard]] std::unique_ptr<IEmbedder> create_embedder(const config::Config &config);

} // namespace engram::memory
