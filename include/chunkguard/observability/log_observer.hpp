#pragma once

#include "chunkguard/observability/observer.hpp"

#include <mutex>
#include <ostream>

namespace chunkguard::observability {

/// Writes one `[LEVEL] message` line per event to a stream (stderr by default).
/// Lines from concurrent callers never interleave.
class LogObserver final : public IObserver {
public:
  LogObserver();
  explicit LogObserver(std::ostream &out);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void log_line(const std::string &level, const std::string &message);

  std::mutex mutex_;
  std::ostream *out_;
};

} // namespace chunkguard::observability
