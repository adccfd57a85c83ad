#include "engram/memory/memory.hpp"

#include "engram/common/fs.hpp"
#include "engram/memory/embedder.hpp"
#include "engram/memory/embedder_local.hpp"
#include "engram/memory/embedding_provider.hpp"
#include "engram/memory/sqlite_store.hpp"
#include "engram/observability/factory.hpp"
#include "engram/observability/global.hpp"

#include <openssl/rand.h>

#include <array>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace engram::memory {

std::string memory_type_to_string(const MemoryType type) {
  switch (type) {
  case MemoryType::Fact:
    return "fact";
  case MemoryType::Preference:
    return "preference";
  case MemoryType::Entity:
    return "entity";
  case MemoryType::Episodic:
    return "episodic";
  }
  return "fact";
}

common::Result<MemoryType> memory_type_from_string(const std::string_view value) {
  const std::string v = common::to_lower(common::trim(std::string(value)));
  if (v == "fact") {
    return common::Result<MemoryType>::success(MemoryType::Fact);
  }
  if (v == "preference") {
    return common::Result<MemoryType>::success(MemoryType::Preference);
  }
  if (v == "entity") {
    return common::Result<MemoryType>::success(MemoryType::Entity);
  }
  if (v == "episodic") {
    return common::Result<MemoryType>::success(MemoryType::Episodic);
  }
  return common::Result<MemoryType>::failure("unknown memory type: " + std::string(value));
}

common::Result<std::string> generate_memory_id() {
  std::array<unsigned char, 16> bytes{};
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    return common::Result<std::string>::failure("RAND_bytes failed");
  }
  // RFC 4122 version 4, variant 1.
  bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
  bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      stream << '-';
    }
    stream << std::setw(2) << static_cast<int>(bytes[i]);
  }
  return common::Result<std::string>::success(stream.str());
}

Timestamp now() { return std::chrono::time_point_cast<std::chrono::milliseconds>(Clock::now()); }

std::string format_timestamp(const Timestamp ts) {
  const auto since_epoch = ts.time_since_epoch().count();
  auto seconds = since_epoch / 1000;
  auto millis = since_epoch % 1000;
  if (millis < 0) {
    millis += 1000;
    --seconds;
  }

  const auto t = static_cast<std::time_t>(seconds);
  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis << 'Z';
  return out.str();
}

std::optional<Timestamp> parse_timestamp(const std::string &value) {
  const std::string text = common::trim(value);
  if (text.size() < 19) {
    return std::nullopt;
  }

  std::tm tm{};
  std::istringstream in(text.substr(0, 19));
  if (text[10] == 'T') {
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
  } else {
    in >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
  }
  if (in.fail()) {
    return std::nullopt;
  }

  long millis = 0;
  std::size_t pos = 19;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    long scale = 100;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      millis += (text[pos] - '0') * scale;
      scale /= 10;
      ++pos;
    }
  }
  if (pos < text.size() && text[pos] == 'Z') {
    ++pos;
  }
  if (pos != text.size()) {
    return std::nullopt;
  }

#ifdef _WIN32
  const std::time_t seconds = _mkgmtime(&tm);
#else
  const std::time_t seconds = timegm(&tm);
#endif
  if (seconds == static_cast<std::time_t>(-1)) {
    return std::nullopt;
  }

  return Timestamp(std::chrono::milliseconds(static_cast<std::int64_t>(seconds) * 1000 + millis));
}

double recency_score(const Timestamp accessed_at, const Timestamp reference,
                     const double half_life_days) {
  if (half_life_days <= 0.0) {
    return 0.0;
  }
  const double age_ms = static_cast<double>((reference - accessed_at).count());
  if (age_ms <= 0.0) {
    return 1.0;
  }
  return std::exp(-age_ms / (half_life_days * 86'400'000.0));
}

std::unique_ptr<IMemoryStore> create_memory_store(const config::Config &config) {
  if (observability::get_global_observer() == nullptr) {
    observability::set_global_observer(observability::create_observer(config));
  }

  auto provider = std::make_shared<EmbeddingProvider>(config.memory.fallback_dimensions);
  std::shared_ptr<IEmbedder> embedder = create_embedder(config);
  if (embedder->name() != "local") {
    provider->set_embed_fn(make_embed_fn(std::move(embedder)));
  }

  return std::make_unique<SqliteMemoryStore>(common::expand_path(config.memory.db_path),
                                             config.memory, std::move(provider));
}

} // namespace engram::memory
