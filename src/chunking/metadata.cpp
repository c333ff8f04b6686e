#include "chunkguard/chunking/metadata.hpp"

#include "chunkguard/chunking/measure.hpp"

namespace chunkguard::chunking {

Metadata aggregate(const std::vector<Chunk> &chunks, const std::string &provider,
                   const std::string &model) {
  Metadata metadata;
  metadata.provider = provider;
  metadata.model = model;
  metadata.total_chunks = chunks.size();

  for (const auto &chunk : chunks) {
    metadata.estimated_tokens += estimate_tokens(chunk.text);
    metadata.estimated_bytes += byte_length(chunk.text) + images::images_byte_size(chunk.images);
  }

  return metadata;
}

} // namespace chunkguard::chunking
