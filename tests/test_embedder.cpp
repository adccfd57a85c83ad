#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "engram/memory/embedder_local.hpp"
#include "engram/memory/embedder_openai.hpp"
#include "engram/memory/embedding_provider.hpp"
#include "engram/memory/similarity.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace {

namespace mem = engram::memory;

double l2_norm(const mem::Embedding &values) {
  double sum = 0.0;
  for (const double v : values) {
    sum += v * v;
  }
  return std::sqrt(sum);
}

engram::http::HttpResponse ok_response(std::string body) {
  engram::http::HttpResponse response;
  response.status = 200;
  response.body = std::move(body);
  return response;
}

mem::EmbedFn failing_fn(std::string message) {
  return [message](const std::vector<std::string> &) {
    return engram::common::Result<std::vector<mem::Embedding>>::failure(message);
  };
}

mem::EmbedFn constant_fn(mem::Embedding vector) {
  return [vector](const std::vector<std::string> &texts) {
    return engram::common::Result<std::vector<mem::Embedding>>::success(
        std::vector<mem::Embedding>(texts.size(), vector));
  };
}

} // namespace

void register_embedder_tests(std::vector<engram::tests::TestCase> &tests) {
  using engram::tests::require;
  using engram::testing::FakeHttpClient;
  using engram::testing::ScopedCapture;

  tests.push_back({"local_embedder_default_dimensions_and_norm", [] {
                     mem::LocalEmbedder embedder;
                     auto vec = embedder.embed("hello world");
                     require(vec.ok(), vec.error());
                     require(vec.value().size() == 512, "default dimension should be 512");
                     require(std::abs(l2_norm(vec.value()) - 1.0) < 1e-9, "vector not normalized");
                     require(embedder.name() == "local", "name mismatch");
                   }});

  tests.push_back({"local_embedder_is_deterministic", [] {
                     mem::LocalEmbedder a;
                     mem::LocalEmbedder b;
                     require(a.encode("The quick brown fox") == b.encode("The quick brown fox"),
                             "encoder should be deterministic");
                     require(a.encode("THE QUICK brown fox") == a.encode("the quick brown fox"),
                             "ASCII case should not matter");
                   }});

  tests.push_back({"local_embedder_custom_dimensions", [] {
                     mem::LocalEmbedder embedder(64);
                     require(embedder.dimensions() == 64, "dimensions mismatch");
                     require(embedder.encode("anything at all").size() == 64, "vector size");
                     mem::LocalEmbedder zero(0);
                     require(zero.dimensions() == 512, "zero should fall back to default");
                   }});

  tests.push_back({"local_embedder_tokenless_text_is_unit_vector", [] {
                     mem::LocalEmbedder embedder;
                     const auto vec = embedder.encode("!!! ?");
                     std::size_t non_zero = 0;
                     for (const double v : vec) {
                       if (v != 0.0) {
                         ++non_zero;
                         require(v == 1.0, "single component should be 1.0");
                       }
                     }
                     require(non_zero == 1, "expected exactly one non-zero component");
                     require(embedder.encode("") == vec, "empty text should match tokenless text");
                   }});

  tests.push_back({"local_embedder_overlapping_text_is_closer", [] {
                     mem::LocalEmbedder embedder;
                     const auto query = embedder.encode("I like green tea");
                     const auto related = embedder.encode("green tea is nice");
                     const auto unrelated = embedder.encode("the car engine broke");
                     require(mem::cosine_similarity(query, related) >
                                 mem::cosine_similarity(query, unrelated),
                             "shared tokens should increase similarity");
                   }});

  tests.push_back({"local_embedder_batch", [] {
                     mem::LocalEmbedder embedder;
                     auto batch = embedder.embed_batch({"a b", "c d", "e f"});
                     require(batch.ok(), batch.error());
                     require(batch.value().size() == 3, "batch count mismatch");
                     require(batch.value()[1] == embedder.encode("c d"), "batch order mismatch");
                   }});

  tests.push_back({"provider_without_fn_uses_local_encoder", [] {
                     mem::EmbeddingProvider provider;
                     require(!provider.has_embed_fn(), "no fn expected");
                     require(provider.generate_embedding("coffee beans") ==
                                 mem::LocalEmbedder().encode("coffee beans"),
                             "should equal local encoding");
                     require(provider.fallback_count() == 0, "absence is not a fallback");
                   }});

  tests.push_back({"provider_uses_configured_fn", [] {
                     mem::EmbeddingProvider provider;
                     provider.set_embed_fn(constant_fn({0.1, 0.2, 0.3}));
                     require(provider.has_embed_fn(), "fn should be set");
                     const auto vec = provider.generate_embedding("anything");
                     require(vec == mem::Embedding({0.1, 0.2, 0.3}), "fn output not returned");
                     require(provider.fallback_count() == 0, "no fallback expected");
                   }});

  tests.push_back({"provider_falls_back_on_error_result", [] {
                     ScopedCapture capture;
                     mem::EmbeddingProvider provider;
                     provider.set_embed_fn(failing_fn("service unavailable"));
                     const auto vec = provider.generate_embedding("coffee beans");
                     require(vec == mem::LocalEmbedder().encode("coffee beans"),
                             "fallback vector mismatch");
                     require(provider.fallback_count() == 1, "fallback not counted");
                     require(capture.events()
                                     .count<engram::observability::EmbeddingFallbackEvent>() == 1,
                             "fallback event not reported");
                   }});

  tests.push_back({"provider_falls_back_on_exception", [] {
                     mem::EmbeddingProvider provider;
                     provider.set_embed_fn([](const std::vector<std::string> &)
                                               -> engram::common::Result<std::vector<mem::Embedding>> {
                       throw std::runtime_error("socket closed");
                     });
                     const auto vec = provider.generate_embedding("tea");
                     require(vec == mem::LocalEmbedder().encode("tea"), "fallback vector mismatch");
                     require(provider.fallback_count() == 1, "exception not counted");
                   }});

  tests.push_back({"provider_falls_back_on_non_standard_throw", [] {
                     ScopedCapture capture;
                     mem::EmbeddingProvider provider;
                     provider.set_embed_fn([](const std::vector<std::string> &)
                                               -> engram::common::Result<std::vector<mem::Embedding>> {
                       throw 42;
                     });
                     const auto vec = provider.generate_embedding("tea");
                     require(vec == mem::LocalEmbedder().encode("tea"), "fallback vector mismatch");
                     require(provider.fallback_count() == 1, "throw not counted");
                     require(capture.events()
                                     .count<engram::observability::EmbeddingFallbackEvent>() == 1,
                             "fallback event not reported");
                   }});

  tests.push_back({"provider_falls_back_on_invalid_output", [] {
                     mem::EmbeddingProvider provider;

                     provider.set_embed_fn(constant_fn({}));
                     require(!provider.generate_embedding("x y").empty(), "empty vector returned");

                     provider.set_embed_fn(constant_fn({1.0, std::nan("")}));
                     const auto nan_result = provider.generate_embedding("x y");
                     for (const double v : nan_result) {
                       require(std::isfinite(v), "non-finite value leaked");
                     }

                     provider.set_embed_fn([](const std::vector<std::string> &) {
                       return engram::common::Result<std::vector<mem::Embedding>>::success(
                           {{1.0}, {2.0}});
                     });
                     require(provider.generate_embedding("x y") == mem::LocalEmbedder().encode("x y"),
                             "batch size mismatch should fall back");
                     require(provider.fallback_count() == 3, "all three failures should count");
                   }});

  tests.push_back({"provider_fn_can_be_replaced_and_cleared", [] {
                     mem::EmbeddingProvider provider;
                     provider.set_embed_fn(constant_fn({1.0}));
                     provider.set_embed_fn(constant_fn({2.0}));
                     require(provider.generate_embedding("q") == mem::Embedding({2.0}),
                             "replacement fn not used");
                     provider.clear_embed_fn();
                     require(!provider.has_embed_fn(), "fn should be cleared");
                     require(provider.generate_embedding("q").size() == 512,
                             "cleared provider should use local encoder");
                   }});

  tests.push_back({"make_embed_fn_wraps_embedder", [] {
                     mem::EmbeddingProvider provider;
                     provider.set_embed_fn(mem::make_embed_fn(std::make_shared<mem::LocalEmbedder>(16)));
                     const auto vec = provider.generate_embedding("wrapped embedder");
                     require(vec.size() == 16, "wrapped embedder dimension mismatch");
                     require(provider.fallback_count() == 0, "wrapped embedder should not fail");
                   }});

  tests.push_back({"openai_embedder_sends_batch_request", [] {
                     auto http = std::make_shared<FakeHttpClient>(ok_response(
                         R"({"object":"list","data":[{"object":"embedding","index":0,"embedding":[0.1,0.2,0.3]},{"object":"embedding","index":1,"embedding":[0.4,0.5,0.6]}],"model":"m"})"));
                     mem::OpenAiEmbedder embedder("sk-test", "text-embedding-3-small",
                                                  "https://example.test/v1/", 1234, http);
                     require(embedder.dimensions() == 0, "dimensions unknown before first call");

                     auto batch = embedder.embed_batch({"hello", "wo\"rld"});
                     require(batch.ok(), batch.error());
                     require(batch.value().size() == 2, "batch size mismatch");
                     require(batch.value()[1] == mem::Embedding({0.4, 0.5, 0.6}),
                             "second vector mismatch");
                     require(embedder.dimensions() == 3, "observed dimensions mismatch");

                     require(http->last_url == "https://example.test/v1/embeddings", "url mismatch");
                     require(http->last_headers.at("Authorization") == "Bearer sk-test",
                             "auth header mismatch");
                     require(http->last_timeout_ms == 1234, "timeout not forwarded");
                     require(http->last_body.find(R"("input":["hello","wo\"rld"])") !=
                                 std::string::npos,
                             "input not encoded: " + http->last_body);
                     require(http->last_body.find(R"("model":"text-embedding-3-small")") !=
                                 std::string::npos,
                             "model not encoded");
                   }});

  tests.push_back({"openai_embedder_reports_http_failures", [] {
                     engram::http::HttpResponse unauthorized;
                     unauthorized.status = 401;
                     unauthorized.body = R"({"error":{"message":"bad key"}})";
                     mem::OpenAiEmbedder rejected("sk", "m", "https://example.test/v1", 100,
                                                  std::make_shared<FakeHttpClient>(unauthorized));
                     require(!rejected.embed("x").ok(), "non-2xx should fail");

                     engram::http::HttpResponse timeout;
                     timeout.timeout = true;
                     mem::OpenAiEmbedder slow("sk", "m", "https://example.test/v1", 100,
                                              std::make_shared<FakeHttpClient>(timeout));
                     auto slow_result = slow.embed("x");
                     require(!slow_result.ok() && slow_result.error() == "timeout",
                             "timeout should fail");

                     auto http = std::make_shared<FakeHttpClient>(ok_response("{}"));
                     mem::OpenAiEmbedder keyless("", "m", "https://example.test/v1", 100, http);
                     require(!keyless.embed("x").ok(), "missing key should fail");
                     require(http->calls == 0, "no request without a key");
                   }});

  tests.push_back({"parse_embeddings_response_validates_shape", [] {
                     require(!mem::parse_embeddings_response(R"({"data":[]})", 1).ok(),
                             "count mismatch accepted");
                     require(!mem::parse_embeddings_response(R"({"nope":1})", 1).ok(),
                             "missing data accepted");
                     require(!mem::parse_embeddings_response(
                                  R"({"data":[{"embedding":[0.1,"x"]}]})", 1)
                                  .ok(),
                             "non-numeric value accepted");
                     require(!mem::parse_embeddings_response(R"({"data":[{"embedding":[]}]})", 1)
                                  .ok(),
                             "empty embedding accepted");
                     auto ok = mem::parse_embeddings_response(
                         R"({"data":[{"index":0,"embedding":[1e-2,-3]}]})", 1);
                     require(ok.ok(), ok.error());
                     require(ok.value().front() == mem::Embedding({0.01, -3.0}), "values mismatch");
                   }});

  tests.push_back({"provider_falls_back_when_remote_fails", [] {
                     engram::http::HttpResponse down;
                     down.network_error = true;
                     down.network_error_message = "connection refused";
                     auto remote = std::make_shared<mem::OpenAiEmbedder>(
                         "sk", "m", "https://example.test/v1", 100,
                         std::make_shared<FakeHttpClient>(down));

                     mem::EmbeddingProvider provider(32);
                     provider.set_embed_fn(mem::make_embed_fn(remote));
                     const auto vec = provider.generate_embedding("offline");
                     require(vec.size() == 32, "fallback dimension mismatch");
                     require(provider.fallback_count() == 1, "fallback not counted");
                   }});

  tests.push_back({"create_embedder_selects_provider", [] {
                     engram::testing::EnvGuard key("ENGRAM_API_KEY", std::nullopt);
                     engram::config::Config config;
                     config.memory.fallback_dimensions = 128;
                     auto local = mem::create_embedder(config);
                     require(local->name() == "local", "default should be local");
                     require(local->dimensions() == 128, "fallback dimensions not applied");

                     config.embeddings.provider = "openai";
                     require(mem::create_embedder(config)->name() == "local",
                             "openai without key should use local");

                     config.embeddings.api_key = "sk-config";
                     require(mem::create_embedder(config)->name() == "openai",
                             "openai with key should be remote");
                   }});
}
