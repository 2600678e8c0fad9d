#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace sable::config {

enum class OptionType : uint8_t {
  kString,
  kInteger,
  kStringList,
  kBoolean,
};

// Precedence source of an effective value, lowest first.
enum class OptionSource : uint8_t {
  kBuiltin,
  kFile,
  kOverride,
};

using OptionValue =
    std::variant<std::string, int64_t, std::vector<std::string>, bool>;

struct OptionDescriptor {
  std::string_view name;
  OptionType type;
  std::string_view help;
};

// One option value with provenance.
struct ConfigEntry {
  OptionValue value;
  OptionSource source = OptionSource::kBuiltin;
  // Where the value came from: config file path, "command line", "built-in"
  std::string origin;
  // Line in the config file, 0 when not from a file
  uint32_t line = 0;

  auto operator==(const ConfigEntry&) const -> bool = default;
};

inline constexpr std::string_view kLineLength = "line-length";
inline constexpr std::string_view kTargetVersion = "target-version";
inline constexpr std::string_view kInclude = "include";
inline constexpr std::string_view kExclude = "exclude";
inline constexpr std::string_view kExtendExclude = "extend-exclude";
inline constexpr std::string_view kForceExclude = "force-exclude";
inline constexpr std::string_view kSkipStringNormalization =
    "skip-string-normalization";
inline constexpr std::string_view kSkipMagicTrailingComma =
    "skip-magic-trailing-comma";

inline constexpr int64_t kDefaultLineLength = 88;
inline constexpr std::string_view kDefaultInclude = R"((\.pyi?|\.ipynb)$)";
inline constexpr std::string_view kDefaultExclude =
    R"(/(\.direnv|\.eggs|\.git|\.hg|\.ipynb_checkpoints|\.mypy_cache|\.nox|\.pytest_cache|\.ruff_cache|\.tox|\.svn|\.venv|\.vscode|__pypackages__|_build|buck-out|build|dist|venv)/)";

// Every recognized option, in declaration order.
auto AllOptions() -> std::span<const OptionDescriptor>;

// Returns nullptr for unknown names. Expects the canonical (dashed) form.
auto FindOption(std::string_view name) -> const OptionDescriptor*;

// "--line_length" -> "line-length"
auto CanonicalOptionName(std::string_view raw) -> std::string;

auto TypeOf(const OptionValue& value) -> OptionType;
auto OptionTypeName(OptionType type) -> std::string_view;
auto OptionSourceName(OptionSource source) -> std::string_view;

// Human-readable rendering for verbose output and messages.
auto DescribeValue(const OptionValue& value) -> std::string;

}  // namespace sable::config
