#include "tests/helpers/test_helpers.hpp"

#include "engram/observability/global.hpp"

#include <cstdlib>
#include <fstream>
#include <random>

namespace engram::testing {

TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() / ("engram-test-workspace-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempWorkspace::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc);
  out << content;
}

EnvGuard::EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
  if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
    old_value = existing;
  }
  if (value.has_value()) {
    setenv(key.c_str(), value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

EnvGuard::~EnvGuard() {
  if (old_value.has_value()) {
    setenv(key.c_str(), old_value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

config::Config temp_config(const TempWorkspace &workspace) {
  config::Config config;
  config.memory.db_path = (workspace.path() / "memory.db").string();
  config.embeddings.provider = "local";
  config.observability.backend = "none";
  return config;
}

void CapturingObserver::record_event(const observability::ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(sink_->mutex);
  sink_->events.push_back(event);
}

void CapturingObserver::record_metric(const observability::ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(sink_->mutex);
  sink_->metrics.push_back(metric);
}

ScopedCapture::ScopedCapture() : sink_(std::make_shared<CapturedEvents>()) {
  observability::set_global_observer(std::make_unique<CapturingObserver>(sink_));
}

ScopedCapture::~ScopedCapture() { observability::set_global_observer(nullptr); }

http::HttpResponse
FakeHttpClient::post_json(const std::string &url,
                          const std::unordered_map<std::string, std::string> &headers,
                          const std::string &body, const std::uint64_t timeout_ms) {
  ++calls;
  last_url = url;
  last_headers = headers;
  last_body = body;
  last_timeout_ms = timeout_ms;
  return response_;
}

} // namespace engram::testing
