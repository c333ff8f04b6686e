#pragma once

#include "chunkguard/chunking/chunker.hpp"
#include "chunkguard/limits/registry.hpp"

#include <cstddef>
#include <string>

namespace chunkguard::config {

struct DefaultsConfig {
  std::size_t chunk_overlap = 0;
  bool respect_word_boundaries = true;
};

struct ObservabilityConfig {
  std::string backend = "none";
};

struct Config {
  DefaultsConfig defaults;
  ObservabilityConfig observability;
  // Extra or replacement presets from [limits.<provider>.<model>] tables.
  limits::PresetTable limits;

  /// Builtin presets with `limits` layered on top.
  [[nodiscard]] limits::LimitsRegistry registry() const;
  [[nodiscard]] chunking::ChunkOptions chunk_options() const;
};

} // namespace chunkguard::config
