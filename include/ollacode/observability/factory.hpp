#pragma once

#include "ollacode/config/schema.hpp"
#include "ollacode/observability/observer.hpp"

#include <memory>

namespace ollacode::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace ollacode::observability
