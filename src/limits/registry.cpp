#include "chunkguard/limits/registry.hpp"

#include "chunkguard/common/fs.hpp"

#include <unordered_map>

namespace chunkguard::limits {

namespace {

constexpr Limits limits_of(const std::uint64_t tokens, const std::uint64_t chars,
                           const std::uint64_t bytes, const std::uint64_t images,
                           const std::uint64_t image_bytes) {
  return Limits{.max_tokens = tokens,
                .max_chars = chars,
                .max_bytes = bytes,
                .max_images = images,
                .image_byte_limit = image_bytes};
}

constexpr std::uint64_t MB_20 = 20'000'000;
constexpr std::uint64_t MB_5 = 5'000'000;

constexpr Limits OPENAI_128K = limits_of(128'000, 512'000, 512'000, 10, MB_20);
constexpr Limits TEXT_128K = limits_of(128'000, 512'000, 512'000, 0, 0);
constexpr Limits TEXT_131K = limits_of(131'072, 524'288, 524'288, 0, 0);
constexpr Limits TEXT_32K = limits_of(32'768, 131'072, 131'072, 0, 0);
constexpr Limits TEXT_8K = limits_of(8'192, 32'768, 32'768, 0, 0);
constexpr Limits CLAUDE_200K = limits_of(200'000, 800'000, 800'000, 20, MB_5);
constexpr Limits GEMINI_2M = limits_of(2'097'152, 8'388'608, 8'388'608, 16, MB_20);

PresetTable make_builtin_presets() {
  PresetTable table;

  table["openai"] = {
      {"gpt-4o", OPENAI_128K},
      {"gpt-4-turbo", OPENAI_128K},
      {"gpt-4", limits_of(8'192, 32'768, 32'768, 0, 0)},
      {"gpt-3.5-turbo", limits_of(16'385, 65'540, 65'540, 0, 0)},
      {DEFAULT_MODEL_KEY, OPENAI_128K},
  };

  table["gemini"] = {
      {"gemini-1.5-pro", GEMINI_2M},
      {"gemini-1.5-flash", limits_of(1'048'576, 4'194'304, 4'194'304, 16, MB_20)},
      {"gemini-pro", TEXT_32K},
      {DEFAULT_MODEL_KEY, GEMINI_2M},
  };

  table["anthropic"] = {
      {"claude-3-5-sonnet-20241022", CLAUDE_200K},
      {"claude-3-opus-20240229", CLAUDE_200K},
      {"claude-3-sonnet-20240229", CLAUDE_200K},
      {"claude-3-haiku-20240307", CLAUDE_200K},
      {DEFAULT_MODEL_KEY, CLAUDE_200K},
  };

  table["mistral"] = {
      {"mistral-large-latest", TEXT_128K},
      {"mistral-medium-latest", limits_of(32'000, 128'000, 128'000, 0, 0)},
      {"mistral-small-latest", limits_of(32'000, 128'000, 128'000, 0, 0)},
      {DEFAULT_MODEL_KEY, TEXT_128K},
  };

  table["cohere"] = {
      {"command-r-plus", TEXT_128K},
      {"command-r", TEXT_128K},
      {DEFAULT_MODEL_KEY, TEXT_128K},
  };

  table["groq"] = {
      {"llama-3.1-70b-versatile", TEXT_131K},
      {"llama-3.1-8b-instant", TEXT_131K},
      {"mixtral-8x7b-32768", TEXT_32K},
      {DEFAULT_MODEL_KEY, TEXT_131K},
  };

  table["azure-openai"] = {
      {DEFAULT_MODEL_KEY, OPENAI_128K},
  };

  table["bedrock"] = {
      {"anthropic.claude-3-5-sonnet-20241022-v2:0", CLAUDE_200K},
      {"anthropic.claude-3-opus-20240229-v1:0", CLAUDE_200K},
      {"meta.llama3-1-405b-instruct-v1:0", TEXT_131K},
      {DEFAULT_MODEL_KEY, CLAUDE_200K},
  };

  table["together"] = {
      {"meta-llama/Llama-3-70b-chat-hf", TEXT_8K},
      {DEFAULT_MODEL_KEY, TEXT_8K},
  };

  table["ollama"] = {
      {"llama3", TEXT_8K},
      {"mistral", TEXT_8K},
      {DEFAULT_MODEL_KEY, TEXT_8K},
  };

  return table;
}

PresetTable normalize_table(PresetTable presets) {
  PresetTable normalized;
  for (auto &[provider, models] : presets) {
    auto &target = normalized[normalize_provider_id(provider)];
    for (auto &[model, limits] : models) {
      target[common::trim(model)] = limits;
    }
  }
  return normalized;
}

} // namespace

const PresetTable &builtin_presets() {
  static const PresetTable presets = make_builtin_presets();
  return presets;
}

std::string normalize_provider_id(const std::string &name) {
  static const std::unordered_map<std::string, std::string> aliases = {
      {"google", "gemini"},
      {"google-gemini", "gemini"},
      {"azure", "azure-openai"},
      {"aws-bedrock", "bedrock"},
      {"amazon-bedrock", "bedrock"},
      {"together-ai", "together"},
      {"claude", "anthropic"},
  };
  std::string normalized = common::to_lower(common::trim(name));
  if (const auto it = aliases.find(normalized); it != aliases.end()) {
    return it->second;
  }
  return normalized;
}

LimitsRegistry::LimitsRegistry(PresetTable presets) : presets_(normalize_table(std::move(presets))) {}

const LimitsRegistry &LimitsRegistry::builtin() {
  static const LimitsRegistry registry(builtin_presets());
  return registry;
}

LimitsRegistry LimitsRegistry::merged(const LimitsRegistry &base, const PresetTable &overlay) {
  PresetTable combined = base.presets_;
  for (const auto &[provider, models] : normalize_table(overlay)) {
    auto &target = combined[provider];
    for (const auto &[model, limits] : models) {
      target[model] = limits;
    }
  }
  return LimitsRegistry(std::move(combined));
}

std::optional<Limits> LimitsRegistry::resolve(const std::string &provider,
                                              const std::string &model) const {
  const auto provider_it = presets_.find(normalize_provider_id(provider));
  if (provider_it == presets_.end()) {
    return std::nullopt;
  }

  const auto &models = provider_it->second;
  if (const auto exact = models.find(common::trim(model)); exact != models.end()) {
    return exact->second;
  }
  if (const auto fallback = models.find(DEFAULT_MODEL_KEY); fallback != models.end()) {
    return fallback->second;
  }
  return std::nullopt;
}

bool LimitsRegistry::has_provider(const std::string &provider) const {
  return presets_.contains(normalize_provider_id(provider));
}

std::vector<std::string> LimitsRegistry::providers() const {
  std::vector<std::string> names;
  names.reserve(presets_.size());
  for (const auto &[provider, models] : presets_) {
    (void)models;
    names.push_back(provider);
  }
  return names;
}

std::vector<std::string> LimitsRegistry::models(const std::string &provider) const {
  std::vector<std::string> names;
  const auto it = presets_.find(normalize_provider_id(provider));
  if (it == presets_.end()) {
    return names;
  }
  for (const auto &[model, limits] : it->second) {
    (void)limits;
    names.push_back(model);
  }
  return names;
}

} // namespace chunkguard::limits
