#pragma once

#include "chunkguard/common/error.hpp"
#include "chunkguard/common/result.hpp"
#include "chunkguard/images/image.hpp"
#include "chunkguard/limits/limits.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chunkguard::chunking {

inline constexpr std::size_t SENTENCE_SCAN_WINDOW = 200;
inline constexpr std::size_t WORD_SCAN_WINDOW = 100;

struct Chunk {
  std::string text;
  std::vector<images::Image> images;
  std::size_t index = 0;
};

struct ChunkOptions {
  std::size_t chunk_overlap = 0;
  bool respect_word_boundaries = true;
  std::optional<limits::LimitOverrides> custom_limits;
};

/// Preferred split length, in characters, for a chunk of at most `max_length`
/// characters taken from the start of `text`. Prefers just after a sentence
/// terminator followed by whitespace, then just after whitespace, and falls
/// back to `max_length`. Never returns more than `max_length`, and never 0
/// when both the text and `max_length` are non-zero.
[[nodiscard]] std::size_t find_split_point(std::string_view text, std::size_t max_length);

/// Splits `text` into chunks that each satisfy `limits`. All images ride on
/// chunk 0. Fails as a whole when no compliant partition exists.
[[nodiscard]] common::Result<std::vector<Chunk>, common::ChunkError>
partition(std::string_view text, const std::vector<images::Image> &images,
          const limits::Limits &limits, const ChunkOptions &options = {});

} // namespace chunkguard::chunking
