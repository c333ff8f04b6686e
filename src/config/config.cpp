#include "chunkguard/config/config.hpp"

#include "chunkguard/common/fs.hpp"
#include "chunkguard/common/toml.hpp"

#include <array>
#include <cstdlib>
#include <filesystem>

namespace chunkguard::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".chunkguard";
constexpr const char *CONFIG_FILENAME = "config.toml";
constexpr const char *LIMITS_SECTION = "limits";

std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("CHUNKGUARD_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::optional<bool> parse_flag(const std::string &raw) {
  const std::string value = common::to_lower(common::trim(raw));
  if (value == "1" || value == "true" || value == "yes" || value == "on") {
    return true;
  }
  if (value == "0" || value == "false" || value == "no" || value == "off") {
    return false;
  }
  return std::nullopt;
}

struct LimitField {
  const char *key;
  std::uint64_t limits::Limits::*member;
};

constexpr std::array<LimitField, 5> LIMIT_FIELDS = {{
    {"max_tokens", &limits::Limits::max_tokens},
    {"max_chars", &limits::Limits::max_chars},
    {"max_bytes", &limits::Limits::max_bytes},
    {"max_images", &limits::Limits::max_images},
    {"image_byte_limit", &limits::Limits::image_byte_limit},
}};

common::Status parse_limit_tables(const common::TomlDocument &doc, limits::PresetTable &out) {
  for (const auto *table : doc.tables_under(LIMITS_SECTION)) {
    const std::string where = "[limits] table at line " + std::to_string(table->line);
    if (table->path.size() != 3) {
      return common::Status::error(where + " must be named [limits.<provider>.<model>]");
    }

    limits::Limits parsed;
    for (const auto &field : LIMIT_FIELDS) {
      const auto it = table->values.find(field.key);
      if (it == table->values.end()) {
        return common::Status::error(where + " is missing " + field.key);
      }
      const auto value = common::parse_toml_u64(it->second);
      if (!value.ok()) {
        return common::Status::error(where + ": " + field.key + ": " + value.error());
      }
      parsed.*field.member = value.value();
    }

    for (const auto &[key, value] : table->values) {
      (void)value;
      bool known = false;
      for (const auto &field : LIMIT_FIELDS) {
        known = known || key == field.key;
      }
      if (!known) {
        return common::Status::error(where + " has unknown key " + key);
      }
    }

    out[limits::normalize_provider_id(table->path[1])][table->path[2]] = parsed;
  }
  return common::Status::success();
}

} // namespace

limits::LimitsRegistry Config::registry() const {
  return limits::LimitsRegistry::merged(limits::LimitsRegistry::builtin(), limits);
}

chunking::ChunkOptions Config::chunk_options() const {
  chunking::ChunkOptions options;
  options.chunk_overlap = defaults.chunk_overlap;
  options.respect_word_boundaries = defaults.respect_word_boundaries;
  return options;
}

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path);
    }
    return common::Result<std::filesystem::path>::success(override_path->parent_path());
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  return path.ok() && std::filesystem::exists(path.value());
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

void apply_env_overrides(Config &config) {
  if (const char *overlap = std::getenv("CHUNKGUARD_CHUNK_OVERLAP");
      overlap != nullptr && *overlap != '\0') {
    if (const auto parsed = common::parse_toml_u64(overlap); parsed.ok()) {
      config.defaults.chunk_overlap = static_cast<std::size_t>(parsed.value());
    }
  }

  if (const char *respect = std::getenv("CHUNKGUARD_RESPECT_WORD_BOUNDARIES");
      respect != nullptr && *respect != '\0') {
    if (const auto flag = parse_flag(respect); flag.has_value()) {
      config.defaults.respect_word_boundaries = *flag;
    }
  }

  if (const char *observer = std::getenv("CHUNKGUARD_OBSERVER");
      observer != nullptr && *observer != '\0') {
    config.observability.backend = common::trim(observer);
  }
}

common::Result<Config> parse_config(const std::string &content) {
  const auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;
  if (doc.has("defaults.chunk_overlap")) {
    const auto overlap = common::parse_toml_u64(doc.values.at("defaults.chunk_overlap"));
    if (!overlap.ok()) {
      return common::Result<Config>::failure("defaults.chunk_overlap: " + overlap.error());
    }
    config.defaults.chunk_overlap = static_cast<std::size_t>(overlap.value());
  }
  config.defaults.respect_word_boundaries =
      doc.get_bool("defaults.respect_word_boundaries", config.defaults.respect_word_boundaries);
  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  if (auto status = parse_limit_tables(doc, config.limits); !status.ok()) {
    return common::Result<Config>::failure(status.error());
  }

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  if (!std::filesystem::exists(path)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto content = common::read_text_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure(content.error());
  }

  auto config = parse_config(content.value());
  if (!config.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + config.error());
  }
  apply_env_overrides(config.value());
  return config;
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend != "none" && backend != "noop" && backend != "log") {
    return common::Result<std::vector<std::string>>::failure("Invalid observability.backend: " +
                                                              config.observability.backend);
  }

  for (const auto &[provider, models] : config.limits) {
    for (const auto &[model, entry] : models) {
      const std::string name = "limits." + provider + "." + model;
      if (entry.max_bytes == 0) {
        return common::Result<std::vector<std::string>>::failure(name +
                                                                  ".max_bytes must be positive");
      }
      if (entry.max_chars == 0 || entry.max_tokens == 0) {
        return common::Result<std::vector<std::string>>::failure(
            name + ".max_chars and max_tokens must be positive");
      }
      if (entry.max_chars > entry.max_bytes) {
        warnings.push_back(name + ".max_chars exceeds max_bytes; max_bytes will bind first");
      }
      if (entry.max_images > 0 && entry.image_byte_limit == 0) {
        warnings.push_back(name + " allows images but image_byte_limit is 0");
      }
    }
  }

  if (config.defaults.chunk_overlap > 0 && !config.limits.empty()) {
    for (const auto &[provider, models] : config.limits) {
      for (const auto &[model, entry] : models) {
        if (config.defaults.chunk_overlap >= entry.max_chars) {
          warnings.push_back("defaults.chunk_overlap is not smaller than limits." + provider +
                             "." + model + ".max_chars");
        }
      }
    }
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace chunkguard::config
