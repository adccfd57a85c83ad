#pragma once

#include "engram/observability/observer.hpp"

#include <memory>

namespace engram::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_memory_write(const std::string &op, const std::string &id);
void record_memory_search(std::size_t candidates, std::size_t returned, bool semantic);
void record_embedding_fallback(const std::string &reason);
void record_error(const std::string &component, const std::string &message);

} // namespace engram::observability
