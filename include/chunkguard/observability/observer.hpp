#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace chunkguard::observability {

struct ChunkStartEvent {
  std::string provider;
  std::string model;
  std::uint64_t input_bytes = 0;
  std::size_t image_count = 0;
};

struct ChunkEndEvent {
  std::string provider;
  std::string model;
  std::size_t chunks = 0;
  std::chrono::microseconds duration{0};
};

struct LimitViolationEvent {
  std::string dimension;
  std::uint64_t actual = 0;
  std::uint64_t allowed = 0;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<ChunkStartEvent, ChunkEndEvent, LimitViolationEvent, ErrorEvent>;

struct ChunksProducedMetric {
  std::uint64_t count = 0;
};

struct BytesProcessedMetric {
  std::uint64_t bytes = 0;
};

using ObserverMetric = std::variant<ChunksProducedMetric, BytesProcessedMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace chunkguard::observability
