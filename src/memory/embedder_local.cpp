#include "engram/memory/embedder_local.hpp"

#include "engram/memory/similarity.hpp"

#include <cmath>
#include <cstdint>

namespace engram::memory {

namespace {

constexpr std::uint64_t kFnvOffset = 14695981039346656037ULL;
constexpr std::uint64_t kFnvPrime = 1099511628211ULL;

std::uint64_t fnv1a(const std::string_view text) {
  std::uint64_t hash = kFnvOffset;
  for (const char ch : text) {
    hash ^= static_cast<unsigned char>(ch);
    hash *= kFnvPrime;
  }
  return hash;
}

void normalize(Embedding &values) {
  double norm = 0.0;
  for (const double v : values) {
    norm += v * v;
  }
  norm = std::sqrt(norm);
  if (norm < 1e-12) {
    return;
  }
  for (double &v : values) {
    v /= norm;
  }
}

} // namespace

LocalEmbedder::LocalEmbedder(const std::size_t dimensions)
    : dimensions_(dimensions == 0 ? kDefaultDimensions : dimensions) {}

Embedding LocalEmbedder::encode(const std::string_view text) const {
  Embedding values(dimensions_, 0.0);

  const auto tokens = tokenize(text);
  for (const auto &token : tokens) {
    values[fnv1a(token) % dimensions_] += 1.0;
  }

  // Token-free text still gets a unit vector so stored embeddings are never all zero.
  if (tokens.empty()) {
    values[fnv1a("") % dimensions_] = 1.0;
    return values;
  }

  normalize(values);
  return values;
}

std::string_view LocalEmbedder::name() const { return "local"; }

common::Result<Embedding> LocalEmbedder::embed(const std::string_view text) {
  return common::Result<Embedding>::success(encode(text));
}

common::Result<std::vector<Embedding>>
LocalEmbedder::embed_batch(const std::vector<std::string> &texts) {
  std::vector<Embedding> out;
  out.reserve(texts.size());
  for (const auto &text : texts) {
    out.push_back(encode(text));
  }
  return common::Result<std::vector<Embedding>>::success(std::move(out));
}

std::size_t LocalEmbedder::dimensions() const { return dimensions_; }

} // namespace engram::memory
