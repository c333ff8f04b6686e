#pragma once

#include "chunkguard/common/result.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace chunkguard::common {

[[nodiscard]] std::string base64_encode(const std::vector<std::uint8_t> &bytes);

/// Decodes standard or URL-safe base64. Whitespace is ignored and missing
/// padding is restored before decoding.
[[nodiscard]] Result<std::vector<std::uint8_t>> base64_decode(std::string_view text);

} // namespace chunkguard::common
