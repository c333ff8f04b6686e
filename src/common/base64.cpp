#include "chunkguard/common/base64.hpp"

#include <openssl/evp.h>

#include <cctype>

namespace chunkguard::common {

std::string base64_encode(const std::vector<std::uint8_t> &bytes) {
  if (bytes.empty()) {
    return "";
  }
  const int output_len = 4 * static_cast<int>((bytes.size() + 2) / 3);
  // EVP_EncodeBlock writes a trailing NUL.
  std::string output(static_cast<std::size_t>(output_len) + 1, '\0');
  EVP_EncodeBlock(reinterpret_cast<unsigned char *>(output.data()), bytes.data(),
                  static_cast<int>(bytes.size()));
  output.resize(static_cast<std::size_t>(output_len));
  return output;
}

Result<std::vector<std::uint8_t>> base64_decode(const std::string_view text) {
  std::string clean;
  clean.reserve(text.size() + 3);
  for (const char ch : text) {
    if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
      continue;
    }
    if (ch == '-') {
      clean.push_back('+');
    } else if (ch == '_') {
      clean.push_back('/');
    } else {
      clean.push_back(ch);
    }
  }

  if (clean.empty()) {
    return Result<std::vector<std::uint8_t>>::success({});
  }
  if (clean.size() % 4 == 1) {
    return Result<std::vector<std::uint8_t>>::failure("Invalid base64 length");
  }
  while (clean.size() % 4 != 0) {
    clean.push_back('=');
  }

  std::vector<std::uint8_t> decoded(clean.size() / 4 * 3);
  const int len = EVP_DecodeBlock(decoded.data(), reinterpret_cast<const unsigned char *>(clean.data()),
                                  static_cast<int>(clean.size()));
  if (len < 0) {
    return Result<std::vector<std::uint8_t>>::failure("Invalid base64 input");
  }

  std::size_t padding = 0;
  if (clean.back() == '=') {
    ++padding;
  }
  if (clean.size() > 1 && clean[clean.size() - 2] == '=') {
    ++padding;
  }

  decoded.resize(static_cast<std::size_t>(len) - padding);
  return Result<std::vector<std::uint8_t>>::success(std::move(decoded));
}

} // namespace chunkguard::common
