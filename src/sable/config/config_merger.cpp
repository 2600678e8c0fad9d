#include "sable/config/config_merger.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <expected>
#include <format>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "sable/common/diagnostic/diagnostic.hpp"
#include "sable/config/option.hpp"
#include "sable/config/resolved_config.hpp"
#include "sable/config/target_version.hpp"
#include "sable/filter/path_pattern.hpp"

namespace sable::config {

namespace {

struct PrecedenceRule {
  std::string_view name;
  OptionSource source;
};

// Highest precedence first. Evaluation of an option stops at the first rule
// whose layer sets it.
constexpr std::array<PrecedenceRule, 3> kPrecedenceRules = {{
    {.name = "override", .source = OptionSource::kOverride},
    {.name = "file", .source = OptionSource::kFile},
    {.name = "builtin", .source = OptionSource::kBuiltin},
}};

struct PatternOption {
  std::string_view name;
  filter::PatternRole role;
  bool optional;
};

constexpr std::array<PatternOption, 4> kPatternOptions = {{
    {.name = kForceExclude,
     .role = filter::PatternRole::kForceExclude,
     .optional = true},
    {.name = kInclude, .role = filter::PatternRole::kInclude, .optional = false},
    {.name = kExclude, .role = filter::PatternRole::kExclude, .optional = false},
    {.name = kExtendExclude,
     .role = filter::PatternRole::kExtendExclude,
     .optional = true},
}};

// Error attributed to the source of an entry: file entries point at the
// config file, other entries name their origin in the message.
auto EntryError(
    std::string_view name, const ConfigEntry& entry, std::string msg)
    -> Diagnostic {
  if (entry.source == OptionSource::kFile) {
    return Diagnostic::ConfigError(
        SourceLocation{.path = entry.origin, .line = entry.line},
        std::format("option '{}': {}", name, msg));
  }
  return Diagnostic::ConfigError(
      std::format("option '{}' (from {}): {}", name, entry.origin, msg));
}

auto CheckLayer(const ConfigLayer& layer) -> Result<void> {
  for (const auto& [name, entry] : layer.entries) {
    const OptionDescriptor* desc = FindOption(name);
    if (desc == nullptr) {
      return std::unexpected(EntryError(name, entry, "unknown option"));
    }
    OptionType actual = TypeOf(entry.value);
    if (actual != desc->type) {
      return std::unexpected(
          EntryError(
              name, entry,
              std::format(
                  "expected {}, got {}", OptionTypeName(desc->type),
                  OptionTypeName(actual))));
    }
  }
  return {};
}

// Later layers of the same source win.
auto Lookup(
    std::span<const ConfigLayer> layers, OptionSource source,
    std::string_view name) -> const ConfigEntry* {
  for (auto it = layers.rbegin(); it != layers.rend(); ++it) {
    if (it->source != source) {
      continue;
    }
    auto found = it->entries.find(name);
    if (found != it->entries.end()) {
      return &found->second;
    }
  }
  return nullptr;
}

}  // namespace

void ConfigLayer::Set(std::string_view name, OptionValue value, uint32_t line) {
  entries.insert_or_assign(
      CanonicalOptionName(name),
      ConfigEntry{
          .value = std::move(value),
          .source = source,
          .origin = origin,
          .line = line,
      });
}

auto BuiltinLayer() -> ConfigLayer {
  ConfigLayer layer{.source = OptionSource::kBuiltin, .origin = "built-in"};
  layer.Set(kLineLength, kDefaultLineLength);
  layer.Set(kTargetVersion, std::vector<std::string>{});
  layer.Set(kInclude, std::string(kDefaultInclude));
  layer.Set(kExclude, std::string(kDefaultExclude));
  layer.Set(kExtendExclude, std::string());
  layer.Set(kForceExclude, std::string());
  layer.Set(kSkipStringNormalization, false);
  layer.Set(kSkipMagicTrailingComma, false);
  return layer;
}

auto OverrideLayer() -> ConfigLayer {
  return ConfigLayer{
      .source = OptionSource::kOverride, .origin = "command line"};
}

auto Merge(std::span<const ConfigLayer> layers) -> Result<ResolvedConfig> {
  for (const auto& layer : layers) {
    if (auto checked = CheckLayer(layer); !checked) {
      return std::unexpected(checked.error());
    }
  }

  EntryMap merged;
  for (const OptionDescriptor& desc : AllOptions()) {
    const ConfigEntry* winner = nullptr;
    for (const PrecedenceRule& rule : kPrecedenceRules) {
      winner = Lookup(layers, rule.source, desc.name);
      if (winner != nullptr) {
        break;
      }
    }
    if (winner == nullptr) {
      return std::unexpected(
          Diagnostic::ConfigError(
              std::format("option '{}' has no value", desc.name)));
    }
    merged.emplace(std::string(desc.name), *winner);
  }

  const ConfigEntry& line_length = merged.at(std::string(kLineLength));
  if (std::get<int64_t>(line_length.value) < 1) {
    return std::unexpected(
        EntryError(kLineLength, line_length, "must be a positive integer"));
  }

  std::vector<TargetVersion> target_versions;
  const ConfigEntry& targets = merged.at(std::string(kTargetVersion));
  for (const auto& token : std::get<std::vector<std::string>>(targets.value)) {
    auto version = ParseTargetVersion(token);
    if (!version) {
      return std::unexpected(
          EntryError(
              kTargetVersion, targets,
              std::format("unknown target version '{}'", token)));
    }
    target_versions.push_back(*version);
  }

  std::vector<filter::PathPattern> patterns;
  for (const PatternOption& option : kPatternOptions) {
    const ConfigEntry& entry = merged.at(std::string(option.name));
    const auto& source = std::get<std::string>(entry.value);
    if (option.optional && source.empty()) {
      continue;
    }
    auto compiled = filter::CompilePattern(option.role, source);
    if (!compiled) {
      return std::unexpected(
          EntryError(option.name, entry, compiled.error().primary.message));
    }
    patterns.push_back(std::move(*compiled));
  }
  std::ranges::stable_sort(
      patterns, {}, [](const filter::PathPattern& p) { return p.rank; });

  std::optional<std::filesystem::path> config_path;
  for (const auto& layer : layers) {
    if (layer.path) {
      config_path = layer.path;
    }
  }

  return ResolvedConfig(
      std::move(merged), std::move(target_versions), std::move(patterns),
      std::move(config_path));
}

auto AsBaseLayer(const ResolvedConfig& config) -> ConfigLayer {
  return ConfigLayer{
      .source = OptionSource::kBuiltin,
      .origin = "pre-merged",
      .path = config.ConfigPath(),
      .entries = config.Entries(),
  };
}

}  // namespace sable::config
