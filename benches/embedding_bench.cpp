#include "bench_common.hpp"

#include "engram/memory/embedder_local.hpp"
#include "engram/memory/similarity.hpp"

void run_embedding_benchmark() {
  const engram::memory::LocalEmbedder embedder;
  const std::string text =
      "The user mentioned they are moving to Lisbon next spring and want vegetarian "
      "restaurant suggestions near the office. 他们也喜欢喝绿茶。";

  engram::bench::run_bench("local_encode", 5'000, [&] { (void)embedder.encode(text); });

  const auto a = embedder.encode(text);
  const auto b = embedder.encode("vegetarian restaurants in Lisbon");
  engram::bench::run_bench("cosine_similarity_512", 100'000,
                           [&] { (void)engram::memory::cosine_similarity(a, b); });

  engram::bench::run_bench("token_overlap", 20'000, [&] {
    (void)engram::memory::token_overlap("绿茶 restaurant Lisbon", text);
  });
}
