#pragma once

#include "engram/observability/observer.hpp"

#include <mutex>
#include <ostream>

namespace engram::observability {

/// Writes one "[LEVEL] message" line per event. Defaults to stderr.
class LogObserver final : public IObserver {
public:
  LogObserver();
  explicit LogObserver(std::ostream &out);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void log_line(std::string_view level, const std::string &message);

  std::ostream &out_;
  std::mutex mutex_;
};

} // namespace engram::observability
