#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "sable/common/diagnostic/diagnostic.hpp"
#include "sable/config/option.hpp"
#include "sable/config/resolved_config.hpp"

namespace sable::config {

// One precedence level of option values.
struct ConfigLayer {
  OptionSource source = OptionSource::kBuiltin;
  // "built-in", "command line", or the config file path
  std::string origin;
  // Set for layers read from a file
  std::optional<std::filesystem::path> path;
  EntryMap entries;

  // Record a value with this layer's provenance. `name` is canonicalized.
  void Set(std::string_view name, OptionValue value, uint32_t line = 0);
};

// Complete set of built-in defaults.
auto BuiltinLayer() -> ConfigLayer;

// Empty override layer, filled from explicitly set CLI flags.
auto OverrideLayer() -> ConfigLayer;

// Merge layers into one validated configuration.
//
// For each option the layers are consulted highest precedence first
// (override, file, built-in; later layers win among equal sources) and the
// first layer that sets the option provides its value. Values are replaced,
// never combined: a list set by a higher layer hides lower lists entirely.
//
// Errors: unknown option name, value of the wrong type, line-length < 1,
// unknown target version, invalid regular expression.
auto Merge(std::span<const ConfigLayer> layers) -> Result<ResolvedConfig>;

// A built-in-level layer carrying the effective entries of `config` with
// their original provenance. Merge({AsBaseLayer(Merge(a, b)), c}) is
// equivalent to Merge({a, b, c}).
auto AsBaseLayer(const ResolvedConfig& config) -> ConfigLayer;

}  // namespace sable::config
