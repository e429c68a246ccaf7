#include "ollacode/observability/factory.hpp"

#include "ollacode/common/fs.hpp"
#include "ollacode/observability/log_observer.hpp"
#include "ollacode/observability/noop_observer.hpp"

namespace ollacode::observability {

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend == "log") {
    return std::make_unique<LogObserver>(parse_log_level(config.observability.level));
  }
  return std::make_unique<NoopObserver>();
}

} // namespace ollacode::observability
