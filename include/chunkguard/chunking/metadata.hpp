#pragma once

#include "chunkguard/chunking/chunker.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace chunkguard::chunking {

struct Metadata {
  std::string provider;
  std::string model;
  std::size_t total_chunks = 0;
  std::uint64_t estimated_tokens = 0;
  std::uint64_t estimated_bytes = 0;
};

/// Totals over the emitted chunks. Overlap regions are counted once per chunk
/// they appear in, i.e. what will actually be sent.
[[nodiscard]] Metadata aggregate(const std::vector<Chunk> &chunks, const std::string &provider,
                                 const std::string &model);

} // namespace chunkguard::chunking
