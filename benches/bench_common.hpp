#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <string>

namespace chunkguard::bench {

/// Runs `fn` `iterations` times and prints total and mean wall time. When
/// `bytes_per_iteration` is set, throughput in MB/s is printed too.
inline void run_bench(const std::string &name, const int iterations,
                      const std::function<void()> &fn,
                      const std::uint64_t bytes_per_iteration = 0) {
  const auto start = std::chrono::steady_clock::now();
  for (int i = 0; i < iterations; ++i) {
    fn();
  }
  const auto elapsed = std::chrono::steady_clock::now() - start;
  const auto total_us = std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count();
  const double avg_us = static_cast<double>(total_us) / static_cast<double>(iterations);

  std::cout << name << ": iterations=" << iterations << " total_us=" << total_us
            << " avg_us=" << avg_us;
  if (bytes_per_iteration > 0 && total_us > 0) {
    const double bytes = static_cast<double>(bytes_per_iteration) * iterations;
    std::cout << " mb_per_s=" << bytes / static_cast<double>(total_us);
  }
  std::cout << "\n";
}

} // namespace chunkguard::bench
