#pragma once

#include "chunkguard/common/error.hpp"
#include "chunkguard/common/result.hpp"
#include "chunkguard/images/image.hpp"
#include "chunkguard/limits/limits.hpp"

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace chunkguard::chunking {

inline constexpr std::uint64_t CHARS_PER_TOKEN = 4;

/// UTF-8 encoded size.
[[nodiscard]] std::uint64_t byte_length(std::string_view text);

/// Number of Unicode code points.
[[nodiscard]] std::uint64_t char_count(std::string_view text);

/// ceil(chars / 4). An upper-bound heuristic, never an exact tokenizer count.
[[nodiscard]] std::uint64_t estimate_tokens(std::string_view text);

struct FitCheck {
  bool fits = true;
  std::optional<common::LimitDimension> dimension;
  std::uint64_t actual = 0;
  std::uint64_t allowed = 0;
};

/// Checks bytes (text + images), then chars, then estimated tokens and reports
/// the first violation. Bytes are checked first because they bind hardest.
[[nodiscard]] FitCheck check_fits(std::string_view text, const std::vector<images::Image> &images,
                                  const limits::Limits &limits);

/// check_fits as a CapacityExceeded failure.
[[nodiscard]] common::Result<void, common::ChunkError>
enforce_fits(std::string_view text, const std::vector<images::Image> &images,
             const limits::Limits &limits);

} // namespace chunkguard::chunking
