#pragma once

#include "chunkguard/common/error.hpp"
#include "chunkguard/common/result.hpp"
#include "chunkguard/limits/limits.hpp"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace chunkguard::images {

inline constexpr const char *DEFAULT_MIME_TYPE = "image/png";

/// Normalized image. Built once, then only shared by reference or copied whole.
struct Image {
  std::vector<std::uint8_t> bytes;
  std::string mime_type = DEFAULT_MIME_TYPE;
  std::uint64_t size_bytes = 0;
};

/// Opaque byte buffer; mime type defaults to image/png.
struct ImageBytes {
  std::vector<std::uint8_t> data;
};

/// Base64 payload, optionally as a `data:image/<subtype>;base64,` URL.
struct Base64Image {
  std::string data;
};

/// Buffer with an explicit mime type.
struct ImageBuffer {
  std::vector<std::uint8_t> buffer;
  std::string mime_type;
};

using RawImage = std::variant<ImageBytes, Base64Image, ImageBuffer>;

[[nodiscard]] common::Result<Image, common::ChunkError> normalize_image(const RawImage &raw);

/// Checks the image count, normalizes each image and checks its size.
[[nodiscard]] common::Result<std::vector<Image>, common::ChunkError>
validate_images(const std::vector<RawImage> &raw, const limits::Limits &limits);

[[nodiscard]] std::uint64_t images_byte_size(const std::vector<Image> &images);

} // namespace chunkguard::images
