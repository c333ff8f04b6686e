#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace chunkguard::limits {

/// Capacity ceiling a downstream provider enforces on one request.
struct Limits {
  std::uint64_t max_tokens = 0;
  std::uint64_t max_chars = 0;
  std::uint64_t max_bytes = 0;
  std::uint64_t max_images = 0;
  std::uint64_t image_byte_limit = 0;

  bool operator==(const Limits &) const = default;
};

/// Caller-supplied partial limits; set fields replace the resolved value.
struct LimitOverrides {
  std::optional<std::uint64_t> max_tokens;
  std::optional<std::uint64_t> max_chars;
  std::optional<std::uint64_t> max_bytes;
  std::optional<std::uint64_t> max_images;
  std::optional<std::uint64_t> image_byte_limit;

  [[nodiscard]] bool empty() const;
  [[nodiscard]] Limits apply(Limits base) const;
};

[[nodiscard]] std::string describe(const Limits &limits);

} // namespace chunkguard::limits
