#include "chunkguard/chunking/measure.hpp"

#include "chunkguard/common/utf8.hpp"

namespace chunkguard::chunking {

std::uint64_t byte_length(const std::string_view text) { return text.size(); }

std::uint64_t char_count(const std::string_view text) { return common::utf8_length(text); }

std::uint64_t estimate_tokens(const std::string_view text) {
  const std::uint64_t chars = char_count(text);
  return (chars + CHARS_PER_TOKEN - 1) / CHARS_PER_TOKEN;
}

FitCheck check_fits(const std::string_view text, const std::vector<images::Image> &images,
                    const limits::Limits &limits) {
  const std::uint64_t total_bytes = byte_length(text) + images::images_byte_size(images);
  if (total_bytes > limits.max_bytes) {
    return FitCheck{.fits = false,
                    .dimension = common::LimitDimension::Bytes,
                    .actual = total_bytes,
                    .allowed = limits.max_bytes};
  }

  const std::uint64_t chars = char_count(text);
  if (chars > limits.max_chars) {
    return FitCheck{.fits = false,
                    .dimension = common::LimitDimension::Chars,
                    .actual = chars,
                    .allowed = limits.max_chars};
  }

  const std::uint64_t tokens = estimate_tokens(text);
  if (tokens > limits.max_tokens) {
    return FitCheck{.fits = false,
                    .dimension = common::LimitDimension::Tokens,
                    .actual = tokens,
                    .allowed = limits.max_tokens};
  }

  return FitCheck{};
}

common::Result<void, common::ChunkError> enforce_fits(const std::string_view text,
                                                      const std::vector<images::Image> &images,
                                                      const limits::Limits &limits) {
  const FitCheck check = check_fits(text, images, limits);
  if (check.fits) {
    return common::Result<void, common::ChunkError>::success();
  }
  return common::Result<void, common::ChunkError>::failure(
      common::ChunkError::capacity_exceeded(*check.dimension, check.actual, check.allowed));
}

} // namespace chunkguard::chunking
