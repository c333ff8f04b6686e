#pragma once

#include "chunkguard/observability/observer.hpp"

#include <memory>

namespace chunkguard::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);

/// Shared handle to the installed observer; it stays alive while held even if
/// another thread replaces it.
[[nodiscard]] std::shared_ptr<IObserver> get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_chunk_start(const std::string &provider, const std::string &model,
                        std::uint64_t input_bytes, std::size_t image_count);
void record_chunk_end(const std::string &provider, const std::string &model, std::size_t chunks,
                      std::chrono::microseconds duration);
void record_limit_violation(const std::string &dimension, std::uint64_t actual,
                            std::uint64_t allowed);
void record_error(const std::string &component, const std::string &message);

} // namespace chunkguard::observability
