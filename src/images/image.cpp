#include "chunkguard/images/image.hpp"

#include "chunkguard/common/base64.hpp"
#include "chunkguard/common/fs.hpp"

#include <type_traits>

namespace chunkguard::images {

namespace {

using ImageResult = common::Result<Image, common::ChunkError>;

Image make_image(std::vector<std::uint8_t> bytes, std::string mime_type) {
  Image image;
  image.size_bytes = bytes.size();
  image.bytes = std::move(bytes);
  image.mime_type = mime_type.empty() ? DEFAULT_MIME_TYPE : std::move(mime_type);
  return image;
}

ImageResult decode_base64_image(const std::string &raw) {
  std::string payload = common::trim(raw);
  std::string mime_type = DEFAULT_MIME_TYPE;

  if (common::starts_with(common::to_lower(payload.substr(0, 5)), "data:")) {
    const std::size_t comma = payload.find(',');
    if (comma == std::string::npos) {
      return ImageResult::failure(
          common::ChunkError::invalid_input("Image data URL is missing its payload"));
    }
    const std::string header = common::to_lower(payload.substr(5, comma - 5));
    const std::size_t marker = header.find(";base64");
    if (marker == std::string::npos) {
      return ImageResult::failure(
          common::ChunkError::invalid_input("Image data URL must be base64 encoded"));
    }
    const std::string declared = common::trim(header.substr(0, marker));
    if (!declared.empty()) {
      if (!common::starts_with(declared, "image/")) {
        return ImageResult::failure(
            common::ChunkError::invalid_input("Data URL is not an image: " + declared));
      }
      mime_type = declared;
    }
    payload = payload.substr(comma + 1);
  }

  auto decoded = common::base64_decode(payload);
  if (!decoded.ok()) {
    return ImageResult::failure(
        common::ChunkError::invalid_input("Image is not valid base64: " + decoded.error()));
  }
  return ImageResult::success(make_image(std::move(decoded.value()), std::move(mime_type)));
}

} // namespace

common::Result<Image, common::ChunkError> normalize_image(const RawImage &raw) {
  return std::visit(
      [](const auto &source) -> ImageResult {
        using T = std::decay_t<decltype(source)>;
        if constexpr (std::is_same_v<T, ImageBytes>) {
          return ImageResult::success(make_image(source.data, DEFAULT_MIME_TYPE));
        } else if constexpr (std::is_same_v<T, Base64Image>) {
          return decode_base64_image(source.data);
        } else {
          return ImageResult::success(make_image(source.buffer, common::trim(source.mime_type)));
        }
      },
      raw);
}

common::Result<std::vector<Image>, common::ChunkError>
validate_images(const std::vector<RawImage> &raw, const limits::Limits &limits) {
  using ValidateResult = common::Result<std::vector<Image>, common::ChunkError>;

  if (raw.empty()) {
    return ValidateResult::success({});
  }

  if (raw.size() > limits.max_images) {
    return ValidateResult::failure(common::ChunkError::image_limit_exceeded(
        common::LimitDimension::Images, raw.size(), limits.max_images));
  }

  std::vector<Image> normalized;
  normalized.reserve(raw.size());
  for (std::size_t index = 0; index < raw.size(); ++index) {
    auto image = normalize_image(raw[index]);
    if (!image.ok()) {
      auto error = image.error();
      error.image_index = index;
      return ValidateResult::failure(std::move(error));
    }
    if (image.value().size_bytes > limits.image_byte_limit) {
      return ValidateResult::failure(common::ChunkError::image_limit_exceeded(
          common::LimitDimension::ImageBytes, image.value().size_bytes, limits.image_byte_limit,
          index));
    }
    normalized.push_back(std::move(image.value()));
  }

  return ValidateResult::success(std::move(normalized));
}

std::uint64_t images_byte_size(const std::vector<Image> &images) {
  std::uint64_t total = 0;
  for (const auto &image : images) {
    total += image.size_bytes;
  }
  return total;
}

} // namespace chunkguard::images
