#include "chunkguard/limits/limits.hpp"

namespace chunkguard::limits {

bool LimitOverrides::empty() const {
  return !max_tokens.has_value() && !max_chars.has_value() && !max_bytes.has_value() &&
         !max_images.has_value() && !image_byte_limit.has_value();
}

Limits LimitOverrides::apply(Limits base) const {
  if (max_tokens.has_value()) {
    base.max_tokens = *max_tokens;
  }
  if (max_chars.has_value()) {
    base.max_chars = *max_chars;
  }
  if (max_bytes.has_value()) {
    base.max_bytes = *max_bytes;
  }
  if (max_images.has_value()) {
    base.max_images = *max_images;
  }
  if (image_byte_limit.has_value()) {
    base.image_byte_limit = *image_byte_limit;
  }
  return base;
}

std::string describe(const Limits &limits) {
  return "max_tokens=" + std::to_string(limits.max_tokens) +
         " max_chars=" + std::to_string(limits.max_chars) +
         " max_bytes=" + std::to_string(limits.max_bytes) +
         " max_images=" + std::to_string(limits.max_images) +
         " image_byte_limit=" + std::to_string(limits.image_byte_limit);
}

} // namespace chunkguard::limits
