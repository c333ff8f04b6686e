#include "chunkguard/api.hpp"

#include "chunkguard/chunking/measure.hpp"
#include "chunkguard/common/fs.hpp"
#include "chunkguard/common/utf8.hpp"
#include "chunkguard/observability/global.hpp"

#include <chrono>

namespace chunkguard {

namespace {

using ChunkPromptResult = common::Result<ChunkResult, common::ChunkError>;

ChunkPromptResult fail(const ChunkRequest &request, common::ChunkError error) {
  error.with_target(request.provider, request.model);
  if (error.dimension.has_value()) {
    observability::record_limit_violation(std::string(common::dimension_name(*error.dimension)),
                                          error.actual, error.allowed);
  }
  observability::record_error("chunker", error.to_string());
  return ChunkPromptResult::failure(std::move(error));
}

common::Result<void, common::ChunkError> validate_request(const ChunkRequest &request) {
  using ValidateResult = common::Result<void, common::ChunkError>;
  if (common::trim(request.provider).empty()) {
    return ValidateResult::failure(
        common::ChunkError::invalid_input("Provider is required and must be a string"));
  }
  if (common::trim(request.model).empty()) {
    return ValidateResult::failure(
        common::ChunkError::invalid_input("Model is required and must be a string"));
  }
  if (request.input.empty()) {
    return ValidateResult::failure(
        common::ChunkError::invalid_input("Input is required and must be a string"));
  }
  if (!common::is_valid_utf8(request.input)) {
    return ValidateResult::failure(
        common::ChunkError::invalid_input("Input must be valid UTF-8 text"));
  }
  return ValidateResult::success();
}

} // namespace

common::Result<ChunkResult, common::ChunkError> chunk_prompt(const ChunkRequest &request,
                                                             const limits::LimitsRegistry &registry) {
  const auto started = std::chrono::steady_clock::now();

  if (auto valid = validate_request(request); !valid.ok()) {
    return fail(request, valid.error());
  }

  auto resolved = registry.resolve(request.provider, request.model);
  if (!resolved.has_value()) {
    return fail(request, common::ChunkError::provider_not_supported(request.provider));
  }
  limits::Limits limits = *resolved;
  if (request.options.custom_limits.has_value()) {
    limits = request.options.custom_limits->apply(limits);
  }

  observability::record_chunk_start(request.provider, request.model,
                                    chunking::byte_length(request.input), request.images.size());

  auto images = images::validate_images(request.images, limits);
  if (!images.ok()) {
    return fail(request, images.error());
  }

  ChunkResult result;
  if (chunking::check_fits(request.input, images.value(), limits).fits) {
    chunking::Chunk single;
    single.text = request.input;
    single.images = std::move(images.value());
    single.index = 0;
    result.chunks.push_back(std::move(single));
  } else {
    auto chunks = chunking::partition(request.input, images.value(), limits, request.options);
    if (!chunks.ok()) {
      return fail(request, chunks.error());
    }
    result.chunks = std::move(chunks.value());
  }

  result.metadata = chunking::aggregate(result.chunks, request.provider, request.model);

  const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - started);
  observability::record_chunk_end(request.provider, request.model, result.chunks.size(), elapsed);
  observability::record_metric(
      observability::ChunksProducedMetric{.count = result.metadata.total_chunks});
  observability::record_metric(
      observability::BytesProcessedMetric{.bytes = result.metadata.estimated_bytes});

  return ChunkPromptResult::success(std::move(result));
}

common::Result<ChunkResult, common::ChunkError> chunk_prompt(const ChunkRequest &request) {
  return chunk_prompt(request, limits::LimitsRegistry::builtin());
}

} // namespace chunkguard
