#include "engram/memory/embedder_openai.hpp"

#include "engram/common/json_util.hpp"

#include <sstream>

namespace engram::memory {

namespace {

std::string embeddings_url(std::string base_url) {
  while (!base_url.empty() && base_url.back() == '/') {
    base_url.pop_back();
  }
  return base_url + "/embeddings";
}

} // namespace

common::Result<std::vector<Embedding>> parse_embeddings_response(const std::string &body,
                                                                 const std::size_t expected) {
  const std::string data = common::json_get_array(body, "data");
  if (data.empty()) {
    return common::Result<std::vector<Embedding>>::failure("embedding response missing data");
  }

  const auto objects = common::json_split_top_level_objects(data);
  if (objects.size() != expected) {
    return common::Result<std::vector<Embedding>>::failure(
        "embedding response has " + std::to_string(objects.size()) + " items, expected " +
        std::to_string(expected));
  }

  std::vector<Embedding> out;
  out.reserve(objects.size());
  for (const auto &object : objects) {
    const std::string array = common::json_get_array(object, "embedding");
    if (array.empty()) {
      return common::Result<std::vector<Embedding>>::failure("embedding field missing");
    }
    auto values = common::json_parse_number_array(array);
    if (!values.ok()) {
      return values.forward_error<std::vector<Embedding>>();
    }
    if (values.value().empty()) {
      return common::Result<std::vector<Embedding>>::failure("empty embedding");
    }
    out.push_back(std::move(values.value()));
  }

  return common::Result<std::vector<Embedding>>::success(std::move(out));
}

OpenAiEmbedder::OpenAiEmbedder(std::string api_key, std::string model, std::string base_url,
                               const std::uint64_t timeout_ms,
                               std::shared_ptr<http::HttpClient> http_client)
    : api_key_(std::move(api_key)), model_(std::move(model)), base_url_(std::move(base_url)),
      timeout_ms_(timeout_ms), http_client_(std::move(http_client)) {}

std::string_view OpenAiEmbedder::name() const { return "openai"; }

common::Result<Embedding> OpenAiEmbedder::embed(const std::string_view text) {
  auto batch = embed_batch({std::string(text)});
  if (!batch.ok()) {
    return batch.forward_error<Embedding>();
  }
  return common::Result<Embedding>::success(std::move(batch.value().front()));
}

common::Result<std::vector<Embedding>>
OpenAiEmbedder::embed_batch(const std::vector<std::string> &texts) {
  if (api_key_.empty()) {
    return common::Result<std::vector<Embedding>>::failure("missing API key");
  }
  if (texts.empty()) {
    return common::Result<std::vector<Embedding>>::success({});
  }

  std::ostringstream body;
  body << "{";
  body << "\"model\":\"" << common::json_escape(model_) << "\",";
  body << "\"input\":[";
  for (std::size_t i = 0; i < texts.size(); ++i) {
    if (i > 0) {
      body << ",";
    }
    body << "\"" << common::json_escape(texts[i]) << "\"";
  }
  body << "]}";

  const std::unordered_map<std::string, std::string> headers = {
      {"Content-Type", "application/json"},
      {"Authorization", "Bearer " + api_key_},
  };

  const auto response =
      http_client_->post_json(embeddings_url(base_url_), headers, body.str(), timeout_ms_);
  if (response.timeout) {
    return common::Result<std::vector<Embedding>>::failure("timeout");
  }
  if (response.network_error) {
    return common::Result<std::vector<Embedding>>::failure(response.network_error_message);
  }
  if (response.status < 200 || response.status >= 300) {
    return common::Result<std::vector<Embedding>>::failure(
        "embedding API error: HTTP " + std::to_string(response.status));
  }

  auto parsed = parse_embeddings_response(response.body, texts.size());
  if (parsed.ok()) {
    dimensions_.store(parsed.value().front().size());
  }
  return parsed;
}

std::size_t OpenAiEmbedder::dimensions() const { return dimensions_.load(); }

} // namespace engram::memory
