#pragma once

#include <filesystem>
#include <string_view>

#include "sable/common/diagnostic/diagnostic.hpp"
#include "sable/config/config_merger.hpp"

namespace sable::config {

inline constexpr std::string_view kProjectFileName = "pyproject.toml";
inline constexpr std::string_view kToolTable = "sable";

// True if the TOML file has a [tool.sable] table.
// Returns error Diagnostic if the file cannot be parsed.
auto HasToolTable(const std::filesystem::path& path) -> Result<bool>;

// Parse [tool.sable] of a TOML file into a file-level layer. A missing table
// yields an empty layer. When target-version is not set, it is inferred
// from [project].requires-python if possible.
// Returns error Diagnostic on unreadable files, syntax errors, unknown option
// names and values that no option type can hold.
auto LoadConfigFile(const std::filesystem::path& path) -> Result<ConfigLayer>;

}  // namespace sable::config
