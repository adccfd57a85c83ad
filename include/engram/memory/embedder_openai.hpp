#pragma once

#include "engram/http/client.hpp"
#include "engram/memory/embedder.hpp"

#include <atomic>

namespace engram::memory {

/// Client for OpenAI-compatible /embeddings endpoints.
class OpenAiEmbedder final : public IEmbedder {
public:
  OpenAiEmbedder(std::string api_key, std::string model, std::string base_url,
                 std::uint64_t timeout_ms,
                 std::shared_ptr<http::HttpClient> http_client =
                     std::make_shared<http::CurlHttpClient>());

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] common::Result<Embedding> embed(std::string_view text) override;
  [[nodiscard]] common::Result<std::vector<Embedding>>
  embed_batch(const std::vector<std::string> &texts) override;
  /// Width of the most recent response; 0 until the first successful call.
  [[nodiscard]] std::size_t dimensions() const override;

private:
  std::string api_key_;
  std::string model_;
  std::string base_url_;
  std::uint64_t timeout_ms_;
  std::shared_ptr<http::HttpClient> http_client_;
  std::atomic<std::size_t> dimensions_{0};
};

[[nodiscard]] common::Result<std::vector<Embedding>>
parse_embeddings_response(const std::string &body, std::size_t expected);

} // namespace engram::memory
