#include "chunkguard/common/error.hpp"

#include <sstream>

namespace chunkguard::common {

std::string_view error_code_name(const ErrorCode code) {
  switch (code) {
  case ErrorCode::InvalidInput:
    return "INVALID_INPUT";
  case ErrorCode::ProviderNotSupported:
    return "PROVIDER_NOT_SUPPORTED";
  case ErrorCode::ImageLimitExceeded:
    return "IMAGE_LIMIT_EXCEEDED";
  case ErrorCode::CapacityExceeded:
    return "LIMIT_EXCEEDED";
  case ErrorCode::PartitionStalled:
    return "PARTITION_STALLED";
  }
  return "UNKNOWN";
}

std::string_view dimension_name(const LimitDimension dimension) {
  switch (dimension) {
  case LimitDimension::Bytes:
    return "maxBytes";
  case LimitDimension::Chars:
    return "maxChars";
  case LimitDimension::Tokens:
    return "maxTokens";
  case LimitDimension::Images:
    return "maxImages";
  case LimitDimension::ImageBytes:
    return "imageByteLimit";
  }
  return "unknown";
}

std::string ChunkError::to_string() const {
  std::ostringstream out;
  out << error_code_name(code);
  if (!provider.empty() || !model.empty()) {
    out << " for " << provider << "/" << model;
  }
  if (!message.empty()) {
    out << ": " << message;
  }
  if (dimension.has_value()) {
    out << " [" << dimension_name(*dimension) << " actual=" << actual << " allowed=" << allowed;
    if (image_index.has_value()) {
      out << " image_index=" << *image_index;
    }
    out << "]";
  }
  return out.str();
}

ChunkError ChunkError::invalid_input(std::string message) {
  ChunkError error;
  error.code = ErrorCode::InvalidInput;
  error.message = std::move(message);
  return error;
}

ChunkError ChunkError::provider_not_supported(std::string provider) {
  ChunkError error;
  error.code = ErrorCode::ProviderNotSupported;
  error.message = "Provider \"" + provider + "\" is not supported";
  error.provider = std::move(provider);
  return error;
}

ChunkError ChunkError::capacity_exceeded(const LimitDimension dimension, const std::uint64_t actual,
                                         const std::uint64_t allowed) {
  ChunkError error;
  error.code = ErrorCode::CapacityExceeded;
  error.message = "limit exceeded";
  error.dimension = dimension;
  error.actual = actual;
  error.allowed = allowed;
  return error;
}

ChunkError ChunkError::image_limit_exceeded(const LimitDimension dimension,
                                            const std::uint64_t actual, const std::uint64_t allowed,
                                            const std::optional<std::size_t> image_index) {
  ChunkError error;
  error.code = ErrorCode::ImageLimitExceeded;
  error.message = std::string(dimension_name(dimension)) + " exceeded";
  error.dimension = dimension;
  error.actual = actual;
  error.allowed = allowed;
  error.image_index = image_index;
  return error;
}

ChunkError ChunkError::partition_stalled(const std::uint64_t actual, const std::uint64_t allowed) {
  ChunkError error;
  error.code = ErrorCode::PartitionStalled;
  error.message = "partitioner made no progress";
  error.dimension = LimitDimension::Bytes;
  error.actual = actual;
  error.allowed = allowed;
  return error;
}

ChunkError &ChunkError::with_target(const std::string &provider_name,
                                    const std::string &model_name) {
  if (provider.empty()) {
    provider = provider_name;
  }
  if (model.empty()) {
    model = model_name;
  }
  return *this;
}

} // namespace chunkguard::common
