#include "tests/helpers/test_helpers.hpp"

#include "chunkguard/common/utf8.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <random>

namespace chunkguard::testing {

std::string repeat(const std::string &unit, const std::size_t times) {
  std::string out;
  out.reserve(unit.size() * times);
  for (std::size_t i = 0; i < times; ++i) {
    out += unit;
  }
  return out;
}

limits::Limits make_limits(const std::uint64_t max_bytes, const std::uint64_t max_chars,
                           const std::uint64_t max_tokens, const std::uint64_t max_images,
                           const std::uint64_t image_byte_limit) {
  return limits::Limits{.max_tokens = max_tokens,
                        .max_chars = max_chars,
                        .max_bytes = max_bytes,
                        .max_images = max_images,
                        .image_byte_limit = image_byte_limit};
}

std::string utf8_head(const std::string &text, const std::size_t count) {
  const auto offsets = common::utf8_offsets(text);
  const std::size_t chars = offsets.size() - 1;
  return text.substr(0, offsets[std::min(count, chars)]);
}

std::string utf8_tail(const std::string &text, const std::size_t count) {
  const auto offsets = common::utf8_offsets(text);
  const std::size_t chars = offsets.size() - 1;
  return text.substr(offsets[chars - std::min(count, chars)]);
}

std::string reconstruct(const std::vector<chunking::Chunk> &chunks, const std::size_t overlap) {
  std::string out;
  std::size_t previous_chars = 0;
  for (const auto &chunk : chunks) {
    const std::size_t chars = common::utf8_length(chunk.text);
    if (chunk.index == 0 || overlap == 0) {
      out += chunk.text;
    } else {
      const std::size_t restated = std::min(overlap, previous_chars - 1);
      out += chunk.text.substr(utf8_head(chunk.text, restated).size());
    }
    previous_chars = chars;
  }
  return out;
}

void RecordingObserver::record_event(const observability::ObserverEvent &event) {
  events.push_back(event);
}

void RecordingObserver::record_metric(const observability::ObserverMetric &metric) {
  metrics.push_back(metric);
}

TempDir::TempDir() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() / ("chunkguard-test-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempDir::~TempDir() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

std::filesystem::path TempDir::create_file(const std::string &name,
                                           const std::string &content) const {
  const auto file = path_ / name;
  std::filesystem::create_directories(file.parent_path());
  std::ofstream out(file, std::ios::trunc);
  out << content;
  return file;
}

EnvGuard::EnvGuard(std::string key, std::optional<std::string> value) : key_(std::move(key)) {
  if (const char *existing = std::getenv(key_.c_str()); existing != nullptr) {
    old_value_ = existing;
  }
  if (value.has_value()) {
    setenv(key_.c_str(), value->c_str(), 1);
  } else {
    unsetenv(key_.c_str());
  }
}

EnvGuard::~EnvGuard() {
  if (old_value_.has_value()) {
    setenv(key_.c_str(), old_value_->c_str(), 1);
  } else {
    unsetenv(key_.c_str());
  }
}

} // namespace chunkguard::testing
