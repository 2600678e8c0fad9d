#include "sable/config/project_file.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <format>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sable/common/diagnostic/diagnostic.hpp"
#include "sable/config/config_merger.hpp"
#include "sable/config/option.hpp"
#include "sable/config/target_version.hpp"

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-literal-operator"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-literal-operator"
#endif
#include <toml++/toml.hpp>
#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

namespace sable::config {

namespace fs = std::filesystem;

namespace {

auto NodeTypeName(toml::node_type type) -> std::string_view {
  switch (type) {
    case toml::node_type::table:
      return "table";
    case toml::node_type::array:
      return "array";
    case toml::node_type::string:
      return "string";
    case toml::node_type::integer:
      return "integer";
    case toml::node_type::floating_point:
      return "float";
    case toml::node_type::boolean:
      return "boolean";
    case toml::node_type::date:
    case toml::node_type::time:
    case toml::node_type::date_time:
      return "date/time";
    case toml::node_type::none:
      break;
  }
  return "none";
}

auto NodeLine(const toml::node& node) -> uint32_t {
  return static_cast<uint32_t>(node.source().begin.line);
}

// Convert a TOML value to the closest option value type. Arrays must hold
// only strings.
auto ToOptionValue(const toml::node& node) -> std::optional<OptionValue> {
  if (auto s = node.value_exact<std::string>()) {
    return OptionValue{*s};
  }
  if (auto i = node.value_exact<int64_t>()) {
    return OptionValue{*i};
  }
  if (auto b = node.value_exact<bool>()) {
    return OptionValue{*b};
  }
  if (const auto* arr = node.as_array()) {
    std::vector<std::string> items;
    for (const auto& elem : *arr) {
      auto s = elem.value_exact<std::string>();
      if (!s) {
        return std::nullopt;
      }
      items.push_back(*s);
    }
    return OptionValue{std::move(items)};
  }
  return std::nullopt;
}

auto ParseToml(const fs::path& path) -> Result<toml::table> {
  std::ifstream probe(path);
  if (!probe) {
    return std::unexpected(
        Diagnostic::ConfigError(
            SourceLocation{.path = path.string()},
            "cannot read configuration file"));
  }

  try {
    return toml::parse_file(path.string());
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        Diagnostic::ConfigError(
            SourceLocation{
                .path = path.string(),
                .line = static_cast<uint32_t>(e.source().begin.line)},
            std::format("failed to parse: {}", e.description())));
  }
}

}  // namespace

auto HasToolTable(const fs::path& path) -> Result<bool> {
  auto tbl = ParseToml(path);
  if (!tbl) {
    return std::unexpected(tbl.error());
  }
  return (*tbl)["tool"][kToolTable].is_table();
}

auto LoadConfigFile(const fs::path& path) -> Result<ConfigLayer> {
  auto tbl = ParseToml(path);
  if (!tbl) {
    return std::unexpected(tbl.error());
  }

  ConfigLayer layer{
      .source = OptionSource::kFile,
      .origin = path.string(),
      .path = path,
  };

  // [tool.sable] section (optional)
  if (const auto* tool = (*tbl)["tool"][kToolTable].as_table()) {
    for (const auto& [key, node] : *tool) {
      std::string name = CanonicalOptionName(key.str());
      SourceLocation loc{.path = path.string(), .line = NodeLine(node)};

      const OptionDescriptor* desc = FindOption(name);
      if (desc == nullptr) {
        return std::unexpected(
            Diagnostic::ConfigError(
                loc, std::format("unknown option '{}' in [tool.{}]",
                                 key.str(), kToolTable)));
      }

      auto value = ToOptionValue(node);
      if (!value) {
        return std::unexpected(
            Diagnostic::ConfigError(
                loc, std::format(
                         "option '{}': expected {}, got {}", name,
                         OptionTypeName(desc->type),
                         NodeTypeName(node.type()))));
      }
      layer.Set(name, std::move(*value), NodeLine(node));
    }
  }

  // Infer target-version from [project].requires-python
  if (!layer.entries.contains(kTargetVersion)) {
    auto requires_python = (*tbl)["project"]["requires-python"];
    if (auto text = requires_python.value<std::string>()) {
      if (auto versions = InferTargetVersions(*text)) {
        std::vector<std::string> tokens;
        for (TargetVersion v : *versions) {
          tokens.push_back(TargetVersionName(v));
        }
        layer.Set(
            kTargetVersion, std::move(tokens),
            NodeLine(*requires_python.node()));
      }
    }
  }

  return layer;
}

}  // namespace sable::config
