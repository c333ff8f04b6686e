#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace chunkguard::common {

enum class ErrorCode {
  InvalidInput,
  ProviderNotSupported,
  ImageLimitExceeded,
  CapacityExceeded,
  // The partitioner produced an empty chunk. Guards make this unreachable, so
  // seeing it means an internal invariant broke.
  PartitionStalled,
};

enum class LimitDimension {
  Bytes,
  Chars,
  Tokens,
  Images,
  ImageBytes,
};

[[nodiscard]] std::string_view error_code_name(ErrorCode code);
[[nodiscard]] std::string_view dimension_name(LimitDimension dimension);

struct ChunkError {
  ErrorCode code = ErrorCode::InvalidInput;
  std::string message;
  std::string provider;
  std::string model;
  std::optional<LimitDimension> dimension;
  std::uint64_t actual = 0;
  std::uint64_t allowed = 0;
  std::optional<std::size_t> image_index;

  [[nodiscard]] std::string to_string() const;

  [[nodiscard]] static ChunkError invalid_input(std::string message);
  [[nodiscard]] static ChunkError provider_not_supported(std::string provider);
  [[nodiscard]] static ChunkError capacity_exceeded(LimitDimension dimension, std::uint64_t actual,
                                                    std::uint64_t allowed);
  [[nodiscard]] static ChunkError image_limit_exceeded(LimitDimension dimension,
                                                       std::uint64_t actual, std::uint64_t allowed,
                                                       std::optional<std::size_t> image_index = {});
  [[nodiscard]] static ChunkError partition_stalled(std::uint64_t actual, std::uint64_t allowed);

  // Fills provider/model when the originating layer did not know them.
  ChunkError &with_target(const std::string &provider_name, const std::string &model_name);
};

} // namespace chunkguard::common
