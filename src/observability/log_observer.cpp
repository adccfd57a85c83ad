#include "engram/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace engram::observability {

LogObserver::LogObserver() : out_(std::cerr) {}

LogObserver::LogObserver(std::ostream &out) : out_(out) {}

void LogObserver::log_line(const std::string_view level, const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, MemoryWriteEvent>) {
          log_line("DEBUG", "memory." + evt.op + " id=" + evt.id);
        } else if constexpr (std::is_same_v<T, MemorySearchEvent>) {
          log_line("DEBUG", "memory.search candidates=" + std::to_string(evt.candidates) +
                                " returned=" + std::to_string(evt.returned) +
                                " semantic=" + (evt.semantic ? "true" : "false"));
        } else if constexpr (std::is_same_v<T, EmbeddingFallbackEvent>) {
          log_line("WARN", "embedding.fallback reason=" + evt.reason);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, SearchLatencyMetric>) {
          log_line("DEBUG", "metric.search_latency_us=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, StoreSizeMetric>) {
          log_line("DEBUG", "metric.store_entries=" + std::to_string(m.entries));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_.flush();
}

} // namespace engram::observability
