#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sable::config {

// Python versions the formatted output must stay compatible with. The
// underlying value is the minor version.
enum class TargetVersion : uint8_t {
  kPy33 = 3,
  kPy34 = 4,
  kPy35 = 5,
  kPy36 = 6,
  kPy37 = 7,
  kPy38 = 8,
  kPy39 = 9,
  kPy310 = 10,
  kPy311 = 11,
  kPy312 = 12,
  kPy313 = 13,
};

auto AllTargetVersions() -> std::span<const TargetVersion>;

// "py38" -> kPy38. Case-insensitive.
auto ParseTargetVersion(std::string_view token) -> std::optional<TargetVersion>;

// kPy38 -> "py38"
auto TargetVersionName(TargetVersion version) -> std::string;

// Infer target versions from a `requires-python` value: either a plain
// version ("3.8") or a specifier set (">=3.8,<3.11", "~=3.9", "==3.10.*").
// Returns nullopt when the value cannot be parsed or selects no version.
auto InferTargetVersions(std::string_view requires_python)
    -> std::optional<std::vector<TargetVersion>>;

}  // namespace sable::config
