#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "engram/observability/factory.hpp"
#include "engram/observability/global.hpp"
#include "engram/observability/log_observer.hpp"
#include "engram/observability/multi_observer.hpp"
#include "engram/observability/noop_observer.hpp"

#include <sstream>

void register_observability_tests(std::vector<engram::tests::TestCase> &tests) {
  using engram::tests::require;
  namespace obs = engram::observability;

  tests.push_back({"log_observer_formats_events", [] {
                     std::ostringstream out;
                     obs::LogObserver observer(out);
                     observer.record_event(obs::MemoryWriteEvent{.op = "add", .id = "abc"});
                     observer.record_event(obs::EmbeddingFallbackEvent{.reason = "timeout"});
                     observer.record_event(
                         obs::ErrorEvent{.component = "memory", .message = "disk full"});
                     observer.record_metric(obs::StoreSizeMetric{.entries = 3});

                     const std::string text = out.str();
                     require(text.find("[DEBUG] memory.add id=abc\n") != std::string::npos,
                             "write event line missing");
                     require(text.find("[WARN] embedding.fallback reason=timeout\n") !=
                                 std::string::npos,
                             "fallback line missing");
                     require(text.find("[ERROR] memory: disk full\n") != std::string::npos,
                             "error line missing");
                     require(text.find("metric.store_entries=3") != std::string::npos,
                             "metric line missing");
                   }});

  tests.push_back({"multi_observer_fans_out", [] {
                     auto first = std::make_shared<engram::testing::CapturedEvents>();
                     auto second = std::make_shared<engram::testing::CapturedEvents>();
                     obs::MultiObserver multi;
                     multi.add(std::make_unique<engram::testing::CapturingObserver>(first));
                     multi.add(std::make_unique<engram::testing::CapturingObserver>(second));
                     multi.add(nullptr);
                     require(multi.size() == 2, "null observer should be skipped");

                     multi.record_event(obs::MemorySearchEvent{.candidates = 4, .returned = 2});
                     require(first->count<obs::MemorySearchEvent>() == 1, "first missed event");
                     require(second->count<obs::MemorySearchEvent>() == 1, "second missed event");
                   }});

  tests.push_back({"create_observer_selects_backend", [] {
                     engram::config::Config config;
                     config.observability.backend = "none";
                     require(obs::create_observer(config)->name() == "noop", "none -> noop");

                     config.observability.backend = "LOG";
                     require(obs::create_observer(config)->name() == "log", "log backend");

                     config.observability.backend = "log, noop";
                     auto multi = obs::create_observer(config);
                     require(multi->name() == "multi", "comma list -> multi");
                     auto *as_multi = dynamic_cast<obs::MultiObserver *>(multi.get());
                     require(as_multi != nullptr && as_multi->size() == 2, "multi size mismatch");
                   }});

  tests.push_back({"global_observer_records_helpers", [] {
                     engram::testing::ScopedCapture capture;
                     obs::record_memory_write("remove", "id-1");
                     obs::record_memory_search(10, 3, true);
                     obs::record_embedding_fallback("bad vector");
                     obs::record_error("memory", "oops");
                     obs::record_metric(
                         obs::SearchLatencyMetric{.latency = std::chrono::microseconds(42)});

                     auto &events = capture.events();
                     require(events.count<obs::MemoryWriteEvent>() == 1, "write event missing");
                     require(events.count<obs::MemorySearchEvent>() == 1, "search event missing");
                     require(events.count<obs::EmbeddingFallbackEvent>() == 1,
                             "fallback event missing");
                     require(events.count<obs::ErrorEvent>() == 1, "error event missing");
                     require(events.metrics.size() == 1, "metric missing");

                     const auto &write = std::get<obs::MemoryWriteEvent>(events.events.front());
                     require(write.op == "remove" && write.id == "id-1", "write payload mismatch");
                   }});

  tests.push_back({"global_observer_absent_drops_events", [] {
                     obs::set_global_observer(nullptr);
                     obs::record_error("memory", "nobody listening");
                     require(obs::get_global_observer() == nullptr, "observer should stay unset");
                   }});
}
