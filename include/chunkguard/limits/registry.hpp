#pragma once

#include "chunkguard/limits/limits.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace chunkguard::limits {

inline constexpr const char *DEFAULT_MODEL_KEY = "default";

using ModelTable = std::map<std::string, Limits>;
using PresetTable = std::map<std::string, ModelTable>;

/// Conservative per-model presets compiled into the library.
[[nodiscard]] const PresetTable &builtin_presets();

/// Lowercases, trims and folds known aliases ("google" -> "gemini").
[[nodiscard]] std::string normalize_provider_id(const std::string &name);

/// Immutable provider/model -> Limits lookup. Built once and passed by
/// reference to whoever needs it.
class LimitsRegistry {
public:
  explicit LimitsRegistry(PresetTable presets);

  [[nodiscard]] static const LimitsRegistry &builtin();

  /// Layers `overlay` over `base`; overlay models replace base models of the
  /// same provider, untouched base models are kept.
  [[nodiscard]] static LimitsRegistry merged(const LimitsRegistry &base,
                                             const PresetTable &overlay);

  /// Exact model match first, then the provider's "default" entry.
  [[nodiscard]] std::optional<Limits> resolve(const std::string &provider,
                                              const std::string &model) const;

  [[nodiscard]] bool has_provider(const std::string &provider) const;
  [[nodiscard]] std::vector<std::string> providers() const;
  [[nodiscard]] std::vector<std::string> models(const std::string &provider) const;
  [[nodiscard]] const PresetTable &presets() const { return presets_; }

private:
  PresetTable presets_;
};

} // namespace chunkguard::limits
