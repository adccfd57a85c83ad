#pragma once

#include "engram/config/schema.hpp"
#include "engram/observability/observer.hpp"

#include <memory>

namespace engram::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace engram::observability
