#include "chunkguard/observability/factory.hpp"

#include "chunkguard/common/fs.hpp"
#include "chunkguard/observability/log_observer.hpp"
#include "chunkguard/observability/noop_observer.hpp"

namespace chunkguard::observability {

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend == "log") {
    return std::make_unique<LogObserver>();
  }
  return std::make_unique<NoopObserver>();
}

} // namespace chunkguard::observability
