#pragma once

#include "chunkguard/config/schema.hpp"
#include "chunkguard/observability/observer.hpp"

#include <memory>

namespace chunkguard::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace chunkguard::observability
