#include "chunkguard/chunking/chunker.hpp"

#include "chunkguard/common/utf8.hpp"

#include <algorithm>
#include <limits>

namespace chunkguard::chunking {

namespace {

using ChunksResult = common::Result<std::vector<Chunk>, common::ChunkError>;

// Code-point view over a bounded window of a UTF-8 string. Positions are
// character indices relative to the window start.
class CharWindow {
public:
  CharWindow(const std::string_view text, const std::size_t begin, const std::size_t max_chars)
      : text_(text), offsets_(common::utf8_offsets(text, begin, max_chars)) {}

  [[nodiscard]] std::size_t size() const { return offsets_.size() - 1; }

  [[nodiscard]] std::uint64_t bytes(const std::size_t begin, const std::size_t length) const {
    return offsets_[begin + length] - offsets_[begin];
  }

  [[nodiscard]] std::string_view slice(const std::size_t begin, const std::size_t length) const {
    return text_.substr(offsets_[begin], bytes(begin, length));
  }

  // Absolute byte offset of character `pos`.
  [[nodiscard]] std::size_t offset(const std::size_t pos) const { return offsets_[pos]; }

  [[nodiscard]] bool is_space(const std::size_t pos) const {
    if (bytes(pos, 1) != 1) {
      return false;
    }
    const char ch = text_[offsets_[pos]];
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
  }

  [[nodiscard]] bool is_terminator(const std::size_t pos) const {
    if (bytes(pos, 1) != 1) {
      return false;
    }
    const char ch = text_[offsets_[pos]];
    return ch == '.' || ch == '!' || ch == '?';
  }

private:
  std::string_view text_;
  std::vector<std::size_t> offsets_;
};

// Split length for the region starting at `begin` with `remaining` characters.
std::size_t split_length(const CharWindow &chars, const std::size_t begin,
                         const std::size_t remaining, const std::size_t max_length) {
  if (max_length >= remaining) {
    return remaining;
  }

  const std::size_t sentence_floor =
      max_length > SENTENCE_SCAN_WINDOW ? max_length - SENTENCE_SCAN_WINDOW : 0;
  for (std::size_t i = max_length; i > sentence_floor; --i) {
    if (i >= 2 && chars.is_terminator(begin + i - 2) && chars.is_space(begin + i - 1)) {
      return i;
    }
    if (chars.is_terminator(begin + i - 1) && chars.is_space(begin + i)) {
      return i;
    }
  }

  const std::size_t word_floor = max_length > WORD_SCAN_WINDOW ? max_length - WORD_SCAN_WINDOW : 0;
  for (std::size_t i = max_length; i > word_floor; --i) {
    if (chars.is_space(begin + i - 1)) {
      return i;
    }
  }

  return max_length;
}

// Largest prefix of at most `length` characters whose UTF-8 size fits `budget`.
std::size_t fit_prefix(const CharWindow &chars, const std::size_t begin, const std::size_t length,
                       const std::uint64_t budget) {
  std::size_t low = 0;
  std::size_t high = length;
  while (low < high) {
    const std::size_t mid = low + (high - low + 1) / 2;
    if (chars.bytes(begin, mid) <= budget) {
      low = mid;
    } else {
      high = mid - 1;
    }
  }
  return low;
}

// Fails when not even one character can ever be emitted.
common::Result<void, common::ChunkError> check_splittable(const std::string_view text,
                                                          const std::uint64_t image_bytes,
                                                          const limits::Limits &limits) {
  using common::ChunkError;
  using common::LimitDimension;
  using GuardResult = common::Result<void, ChunkError>;

  const std::uint64_t first_chunk_floor = CharWindow(text, 0, 1).bytes(0, 1) + image_bytes;
  if (first_chunk_floor > limits.max_bytes) {
    return GuardResult::failure(
        ChunkError::capacity_exceeded(LimitDimension::Bytes, first_chunk_floor, limits.max_bytes));
  }
  const std::uint64_t widest = common::utf8_max_width(text);
  if (widest > limits.max_bytes) {
    return GuardResult::failure(
        ChunkError::capacity_exceeded(LimitDimension::Bytes, widest, limits.max_bytes));
  }
  if (limits.max_chars < 1) {
    return GuardResult::failure(
        ChunkError::capacity_exceeded(LimitDimension::Chars, 1, limits.max_chars));
  }
  if (limits.max_tokens < 1) {
    return GuardResult::failure(
        ChunkError::capacity_exceeded(LimitDimension::Tokens, 1, limits.max_tokens));
  }
  return GuardResult::success();
}

std::uint64_t token_char_cap(const std::uint64_t max_tokens) {
  constexpr std::uint64_t chars_per_token = 4;
  if (max_tokens > std::numeric_limits<std::uint64_t>::max() / chars_per_token) {
    return std::numeric_limits<std::uint64_t>::max();
  }
  return max_tokens * chars_per_token;
}

} // namespace

std::size_t find_split_point(const std::string_view text, const std::size_t max_length) {
  // One character past `max_length` is enough to see every candidate boundary.
  const std::size_t window = max_length < text.size() ? max_length + 1 : text.size();
  const CharWindow chars(text, 0, window);
  return split_length(chars, 0, chars.size(), max_length);
}

common::Result<std::vector<Chunk>, common::ChunkError>
partition(const std::string_view text, const std::vector<images::Image> &images,
          const limits::Limits &limits, const ChunkOptions &options) {
  if (text.empty()) {
    return ChunksResult::failure(
        common::ChunkError::invalid_input("Text input is required and must be non-empty"));
  }
  if (!common::is_valid_utf8(text)) {
    return ChunksResult::failure(
        common::ChunkError::invalid_input("Text input must be valid UTF-8"));
  }

  const std::uint64_t image_bytes = images::images_byte_size(images);

  if (auto guard = check_splittable(text, image_bytes, limits); !guard.ok()) {
    return ChunksResult::failure(guard.error());
  }

  const std::uint64_t max_chars_by_tokens = token_char_cap(limits.max_tokens);
  std::vector<Chunk> chunks;
  std::size_t cursor = 0;

  while (cursor < text.size()) {
    const bool first = chunks.empty();
    const std::uint64_t chunk_image_bytes = first ? image_bytes : 0;
    const std::uint64_t byte_budget = limits.max_bytes - chunk_image_bytes;
    // Two bytes per character is only a first guess; exact bytes are verified below.
    const std::uint64_t char_budget = std::min(limits.max_chars, byte_budget / 2);
    // Remaining bytes bound the remaining characters.
    const std::size_t candidate = static_cast<std::size_t>(std::min<std::uint64_t>(
        std::max<std::uint64_t>(1, char_budget), text.size() - cursor));

    // Only the characters a chunk can use, plus one to look past the end.
    const CharWindow chars(text, cursor, candidate + 1);
    const std::size_t remaining = chars.size();

    std::size_t length = remaining;
    if (remaining > candidate) {
      length = options.respect_word_boundaries ? split_length(chars, 0, remaining, candidate)
                                               : candidate;
    }

    if (chars.bytes(0, length) > byte_budget) {
      length = fit_prefix(chars, 0, length, byte_budget);
    }

    if (length > max_chars_by_tokens) {
      length = static_cast<std::size_t>(max_chars_by_tokens);
    }

    if (length == 0) {
      return ChunksResult::failure(common::ChunkError::partition_stalled(
          chars.bytes(0, 1) + chunk_image_bytes, limits.max_bytes));
    }

    Chunk chunk;
    chunk.text = std::string(chars.slice(0, length));
    if (first) {
      chunk.images = images;
    }
    chunk.index = chunks.size();
    chunks.push_back(std::move(chunk));

    std::size_t next = length;
    if (options.chunk_overlap > 0 && chars.offset(length) < text.size()) {
      // Keep at least one new character per chunk so the loop always advances.
      next -= std::min(options.chunk_overlap, length - 1);
    }
    cursor = chars.offset(next);
  }

  return ChunksResult::success(std::move(chunks));
}

} // namespace chunkguard::chunking
