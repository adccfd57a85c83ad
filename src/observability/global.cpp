#include "engram/observability/global.hpp"

#include <mutex>

namespace engram::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_memory_write(const std::string &op, const std::string &id) {
  record_event(MemoryWriteEvent{.op = op, .id = id});
}

void record_memory_search(const std::size_t candidates, const std::size_t returned,
                          const bool semantic) {
  record_event(
      MemorySearchEvent{.candidates = candidates, .returned = returned, .semantic = semantic});
}

void record_embedding_fallback(const std::string &reason) {
  record_event(EmbeddingFallbackEvent{.reason = reason});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace engram::observability
