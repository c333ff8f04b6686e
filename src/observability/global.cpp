#include "chunkguard/observability/global.hpp"

#include <mutex>

namespace chunkguard::observability {

namespace {

std::mutex g_observer_mutex;
std::shared_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::shared_ptr<IObserver> previous;
  {
    std::lock_guard<std::mutex> lock(g_observer_mutex);
    previous = std::move(g_observer);
    g_observer = std::move(observer);
  }
  // Destroyed outside the lock. In-flight dispatches hold their own reference.
}

std::shared_ptr<IObserver> get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer;
}

void record_event(const ObserverEvent &event) {
  if (const auto observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (const auto observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_chunk_start(const std::string &provider, const std::string &model,
                        const std::uint64_t input_bytes, const std::size_t image_count) {
  record_event(ChunkStartEvent{.provider = provider,
                               .model = model,
                               .input_bytes = input_bytes,
                               .image_count = image_count});
}

void record_chunk_end(const std::string &provider, const std::string &model,
                      const std::size_t chunks, const std::chrono::microseconds duration) {
  record_event(ChunkEndEvent{
      .provider = provider, .model = model, .chunks = chunks, .duration = duration});
}

void record_limit_violation(const std::string &dimension, const std::uint64_t actual,
                            const std::uint64_t allowed) {
  record_event(LimitViolationEvent{.dimension = dimension, .actual = actual, .allowed = allowed});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace chunkguard::observability
