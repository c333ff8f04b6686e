#pragma once

#include "chunkguard/chunking/chunker.hpp"
#include "chunkguard/chunking/metadata.hpp"
#include "chunkguard/common/error.hpp"
#include "chunkguard/common/result.hpp"
#include "chunkguard/images/image.hpp"
#include "chunkguard/limits/registry.hpp"

#include <string>
#include <vector>

namespace chunkguard {

struct ChunkRequest {
  std::string provider;
  std::string model;
  std::string input;
  std::vector<images::RawImage> images;
  chunking::ChunkOptions options;
};

struct ChunkResult {
  std::vector<chunking::Chunk> chunks;
  chunking::Metadata metadata;
};

/// Resolves limits for the request's provider/model, validates images and
/// returns the input as one chunk when it fits or as a partition otherwise.
[[nodiscard]] common::Result<ChunkResult, common::ChunkError>
chunk_prompt(const ChunkRequest &request, const limits::LimitsRegistry &registry);

/// Same, against the builtin presets.
[[nodiscard]] common::Result<ChunkResult, common::ChunkError>
chunk_prompt(const ChunkRequest &request);

} // namespace chunkguard
