#include "chunkguard/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace chunkguard::observability {

LogObserver::LogObserver() : out_(&std::cerr) {}

LogObserver::LogObserver(std::ostream &out) : out_(&out) {}

void LogObserver::log_line(const std::string &level, const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  *out_ << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, ChunkStartEvent>) {
          log_line("INFO", "chunk.start provider=" + evt.provider + " model=" + evt.model +
                               " input_bytes=" + std::to_string(evt.input_bytes) +
                               " images=" + std::to_string(evt.image_count));
        } else if constexpr (std::is_same_v<T, ChunkEndEvent>) {
          log_line("INFO", "chunk.end provider=" + evt.provider + " model=" + evt.model +
                               " chunks=" + std::to_string(evt.chunks) +
                               " duration_us=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, LimitViolationEvent>) {
          log_line("WARN", "limit.violation dimension=" + evt.dimension +
                               " actual=" + std::to_string(evt.actual) +
                               " allowed=" + std::to_string(evt.allowed));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ChunksProducedMetric>) {
          log_line("DEBUG", "metric.chunks_produced=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, BytesProcessedMetric>) {
          log_line("DEBUG", "metric.bytes_processed=" + std::to_string(m.bytes));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_->flush();
}

} // namespace chunkguard::observability
