#include "chunkguard/common/toml.hpp"

#include "chunkguard/common/fs.hpp"

#include <charconv>
#include <sstream>

namespace chunkguard::common {

namespace {

std::string strip_comment(const std::string &line) {
  bool in_quotes = false;
  std::string output;
  output.reserve(line.size());

  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if (ch == '"' && (i == 0 || line[i - 1] != '\\')) {
      in_quotes = !in_quotes;
    }
    if (!in_quotes && ch == '#') {
      break;
    }
    output.push_back(ch);
  }

  return output;
}

std::string unquote(std::string value) {
  value = trim(value);
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    value = value.substr(1, value.size() - 2);
  }
  return value;
}

// Splits `a."b.c".d` into {a, b.c, d}.
Result<std::vector<std::string>> split_key_path(const std::string &raw) {
  std::vector<std::string> segments;
  std::string current;
  bool in_quotes = false;
  bool quoted_segment = false;

  for (const char ch : raw) {
    if (ch == '"') {
      if (!in_quotes) {
        if (quoted_segment || !trim(current).empty()) {
          return Result<std::vector<std::string>>::failure("unexpected quote in key");
        }
        current.clear();
      }
      in_quotes = !in_quotes;
      quoted_segment = true;
      continue;
    }
    if (!in_quotes && ch == '.') {
      const std::string segment = quoted_segment ? current : trim(current);
      if (segment.empty()) {
        return Result<std::vector<std::string>>::failure("empty key segment");
      }
      segments.push_back(segment);
      current.clear();
      quoted_segment = false;
      continue;
    }
    if (!in_quotes && quoted_segment && ch != ' ' && ch != '\t') {
      return Result<std::vector<std::string>>::failure("unexpected character after quoted key");
    }
    if (quoted_segment && !in_quotes) {
      continue;
    }
    current.push_back(ch);
  }

  if (in_quotes) {
    return Result<std::vector<std::string>>::failure("unterminated quoted key");
  }
  const std::string last = quoted_segment ? current : trim(current);
  if (last.empty()) {
    return Result<std::vector<std::string>>::failure("empty key segment");
  }
  segments.push_back(last);
  return Result<std::vector<std::string>>::success(std::move(segments));
}

std::string join_path(const std::vector<std::string> &segments) {
  std::string joined;
  for (const auto &segment : segments) {
    if (!joined.empty()) {
      joined.push_back('.');
    }
    joined += segment;
  }
  return joined;
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  return unquote(it->second);
}

bool TomlDocument::get_bool(const std::string &key, bool fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string normalized = to_lower(trim(it->second));
  if (normalized == "true") {
    return true;
  }
  if (normalized == "false") {
    return false;
  }
  return fallback;
}

std::uint64_t TomlDocument::get_u64(const std::string &key, std::uint64_t fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const auto parsed = parse_toml_u64(it->second);
  return parsed.ok() ? parsed.value() : fallback;
}

std::vector<const TomlTable *> TomlDocument::tables_under(const std::string &prefix) const {
  std::vector<const TomlTable *> matches;
  for (const auto &table : tables) {
    if (!table.path.empty() && table.path.front() == prefix) {
      matches.push_back(&table);
    }
  }
  return matches;
}

Result<std::uint64_t> parse_toml_u64(const std::string &raw) {
  std::string normalized;
  for (const char ch : trim(raw)) {
    if (ch != '_') {
      normalized.push_back(ch);
    }
  }
  if (normalized.empty()) {
    return Result<std::uint64_t>::failure("empty integer");
  }

  std::uint64_t parsed = 0;
  const auto *first = normalized.data();
  const auto *last = first + normalized.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last) {
    return Result<std::uint64_t>::failure("not an unsigned integer: " + trim(raw));
  }
  return Result<std::uint64_t>::success(parsed);
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::vector<std::string> current_section;
  TomlTable *current_table = nullptr;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string clean_line = trim(strip_comment(line));
    if (clean_line.empty()) {
      continue;
    }

    if (clean_line.front() == '[' && clean_line.back() == ']') {
      const std::string header = trim(clean_line.substr(1, clean_line.size() - 2));
      if (header.empty()) {
        return Result<TomlDocument>::failure("Invalid empty section at line " +
                                             std::to_string(line_number));
      }
      auto path = split_key_path(header);
      if (!path.ok()) {
        return Result<TomlDocument>::failure("Invalid section at line " +
                                             std::to_string(line_number) + ": " + path.error());
      }
      current_section = path.value();
      document.tables.push_back(TomlTable{.path = current_section, .values = {}, .line = line_number});
      current_table = &document.tables.back();
      continue;
    }

    const std::size_t equals_index = clean_line.find('=');
    if (equals_index == std::string::npos) {
      return Result<TomlDocument>::failure("Invalid key/value at line " +
                                           std::to_string(line_number));
    }

    const std::string key = unquote(clean_line.substr(0, equals_index));
    const std::string value = trim(clean_line.substr(equals_index + 1));
    if (key.empty()) {
      return Result<TomlDocument>::failure("Missing key at line " +
                                           std::to_string(line_number));
    }
    if (value.empty()) {
      return Result<TomlDocument>::failure("Missing value at line " +
                                           std::to_string(line_number));
    }

    if (current_table != nullptr) {
      current_table->values[key] = value;
    }
    const std::string section = join_path(current_section);
    const std::string full_key = section.empty() ? key : section + "." + key;
    document.values[full_key] = value;
  }

  return Result<TomlDocument>::success(std::move(document));
}

} // namespace chunkguard::common
