#pragma once

#include "chunkguard/common/result.hpp"
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace chunkguard::common {

struct TomlTable {
  std::vector<std::string> path;
  std::unordered_map<std::string, std::string> values;
  std::size_t line = 0;
};

struct TomlDocument {
  // Full dotted key ("section.key") to raw value. Quoted segments are unquoted,
  // so keys whose segments contain dots are only reachable through `tables`.
  std::unordered_map<std::string, std::string> values;
  std::vector<TomlTable> tables;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
  [[nodiscard]] std::uint64_t get_u64(const std::string &key, std::uint64_t fallback) const;

  /// Tables whose path starts with `prefix`, in document order.
  [[nodiscard]] std::vector<const TomlTable *> tables_under(const std::string &prefix) const;
};

[[nodiscard]] Result<std::uint64_t> parse_toml_u64(const std::string &raw);
[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);

} // namespace chunkguard::common
