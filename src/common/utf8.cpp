#include "chunkguard/common/utf8.hpp"

namespace chunkguard::common {

namespace {

bool is_continuation(const unsigned char byte) { return (byte & 0xC0U) == 0x80U; }

} // namespace

std::size_t utf8_sequence_length(const unsigned char lead) {
  if (lead < 0x80U) {
    return 1;
  }
  if (lead >= 0xC2U && lead <= 0xDFU) {
    return 2;
  }
  if (lead >= 0xE0U && lead <= 0xEFU) {
    return 3;
  }
  if (lead >= 0xF0U && lead <= 0xF4U) {
    return 4;
  }
  return 0;
}

bool is_valid_utf8(const std::string_view text) {
  const auto *data = reinterpret_cast<const unsigned char *>(text.data());
  const std::size_t n = text.size();
  std::size_t i = 0;
  while (i < n) {
    const unsigned char lead = data[i];
    const std::size_t width = utf8_sequence_length(lead);
    if (width == 0 || i + width > n) {
      return false;
    }
    for (std::size_t k = 1; k < width; ++k) {
      if (!is_continuation(data[i + k])) {
        return false;
      }
    }
    if (width == 3) {
      const unsigned char second = data[i + 1];
      if (lead == 0xE0U && second < 0xA0U) {
        return false;
      }
      if (lead == 0xEDU && second >= 0xA0U) {
        return false;
      }
    } else if (width == 4) {
      const unsigned char second = data[i + 1];
      if (lead == 0xF0U && second < 0x90U) {
        return false;
      }
      if (lead == 0xF4U && second >= 0x90U) {
        return false;
      }
    }
    i += width;
  }
  return true;
}

std::size_t utf8_length(const std::string_view text) {
  std::size_t count = 0;
  for (const char ch : text) {
    if (!is_continuation(static_cast<unsigned char>(ch))) {
      ++count;
    }
  }
  return count;
}

std::vector<std::size_t> utf8_offsets(const std::string_view text) {
  std::vector<std::size_t> offsets;
  offsets.reserve(text.size() + 1);
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (!is_continuation(static_cast<unsigned char>(text[i]))) {
      offsets.push_back(i);
    }
  }
  offsets.push_back(text.size());
  return offsets;
}

std::vector<std::size_t> utf8_offsets(const std::string_view text, const std::size_t begin,
                                      const std::size_t max_chars) {
  std::size_t pos = begin < text.size() ? begin : text.size();
  std::vector<std::size_t> offsets;
  offsets.reserve((max_chars < text.size() - pos ? max_chars : text.size() - pos) + 1);
  while (pos < text.size() && offsets.size() < max_chars) {
    offsets.push_back(pos);
    ++pos;
    while (pos < text.size() && is_continuation(static_cast<unsigned char>(text[pos]))) {
      ++pos;
    }
  }
  offsets.push_back(pos);
  return offsets;
}

std::size_t utf8_max_width(const std::string_view text) {
  std::size_t widest = 0;
  std::size_t current = 0;
  for (const char ch : text) {
    if (is_continuation(static_cast<unsigned char>(ch))) {
      ++current;
      continue;
    }
    if (current > widest) {
      widest = current;
    }
    current = 1;
  }
  return current > widest ? current : widest;
}

} // namespace chunkguard::common
