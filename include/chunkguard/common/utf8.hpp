#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

namespace chunkguard::common {

/// Byte width of the UTF-8 sequence introduced by `lead`, or 0 for a byte that
/// cannot start a sequence.
[[nodiscard]] std::size_t utf8_sequence_length(unsigned char lead);

/// Strict validation: rejects overlong forms, surrogates and truncated tails.
[[nodiscard]] bool is_valid_utf8(std::string_view text);

/// Number of code points. Expects valid UTF-8.
[[nodiscard]] std::size_t utf8_length(std::string_view text);

/// Byte offset of every code point start, followed by text.size(). Entry i is
/// where character i begins, so a character range [a, b) spans bytes
/// offsets[a]..offsets[b].
[[nodiscard]] std::vector<std::size_t> utf8_offsets(std::string_view text);

/// Same layout for at most `max_chars` code points starting at byte `begin`;
/// the last entry is the end of the final character taken. Offsets stay
/// relative to the start of `text`.
[[nodiscard]] std::vector<std::size_t> utf8_offsets(std::string_view text, std::size_t begin,
                                                    std::size_t max_chars);

/// Widest code point in bytes (0 for empty text).
[[nodiscard]] std::size_t utf8_max_width(std::string_view text);

} // namespace chunkguard::common
