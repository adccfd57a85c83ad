#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace engram::observability {

struct MemoryWriteEvent {
  std::string op;
  std::string id;
};

struct MemorySearchEvent {
  std::size_t candidates = 0;
  std::size_t returned = 0;
  bool semantic = false;
};

struct EmbeddingFallbackEvent {
  std::string reason;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<MemoryWriteEvent, MemorySearchEvent, EmbeddingFallbackEvent, ErrorEvent>;

struct SearchLatencyMetric {
  std::chrono::microseconds latency{0};
};

struct StoreSizeMetric {
  std::uint64_t entries = 0;
};

using ObserverMetric = std::variant<SearchLatencyMetric, StoreSizeMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace engram::observability
