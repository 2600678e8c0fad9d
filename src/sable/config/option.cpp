#include "sable/config/option.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <format>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace sable::config {

namespace {

constexpr std::array<OptionDescriptor, 8> kOptions = {{
    {.name = kLineLength,
     .type = OptionType::kInteger,
     .help = "How many characters per line to allow"},
    {.name = kTargetVersion,
     .type = OptionType::kStringList,
     .help = "Python versions that should be supported by the output"},
    {.name = kInclude,
     .type = OptionType::kString,
     .help = "Regex of files to include in recursive searches"},
    {.name = kExclude,
     .type = OptionType::kString,
     .help = "Regex of files and directories to exclude"},
    {.name = kExtendExclude,
     .type = OptionType::kString,
     .help = "Regex excluded in addition to --exclude"},
    {.name = kForceExclude,
     .type = OptionType::kString,
     .help = "Regex excluded even when passed explicitly"},
    {.name = kSkipStringNormalization,
     .type = OptionType::kBoolean,
     .help = "Don't normalize string quotes or prefixes"},
    {.name = kSkipMagicTrailingComma,
     .type = OptionType::kBoolean,
     .help = "Don't use trailing commas as a reason to split lines"},
}};

}  // namespace

auto AllOptions() -> std::span<const OptionDescriptor> {
  return kOptions;
}

auto FindOption(std::string_view name) -> const OptionDescriptor* {
  auto it = std::ranges::find_if(
      kOptions, [&](const OptionDescriptor& d) { return d.name == name; });
  if (it == kOptions.end()) {
    return nullptr;
  }
  return &*it;
}

auto CanonicalOptionName(std::string_view raw) -> std::string {
  while (raw.starts_with('-')) {
    raw.remove_prefix(1);
  }
  std::string name(raw);
  std::ranges::replace(name, '_', '-');
  return name;
}

auto TypeOf(const OptionValue& value) -> OptionType {
  switch (value.index()) {
    case 0:
      return OptionType::kString;
    case 1:
      return OptionType::kInteger;
    case 2:
      return OptionType::kStringList;
    default:
      return OptionType::kBoolean;
  }
}

auto OptionTypeName(OptionType type) -> std::string_view {
  switch (type) {
    case OptionType::kString:
      return "string";
    case OptionType::kInteger:
      return "integer";
    case OptionType::kStringList:
      return "list of strings";
    case OptionType::kBoolean:
      return "boolean";
  }
  return "unknown";
}

auto OptionSourceName(OptionSource source) -> std::string_view {
  switch (source) {
    case OptionSource::kBuiltin:
      return "built-in";
    case OptionSource::kFile:
      return "file";
    case OptionSource::kOverride:
      return "override";
  }
  return "unknown";
}

auto DescribeValue(const OptionValue& value) -> std::string {
  if (const auto* s = std::get_if<std::string>(&value)) {
    return std::format("\"{}\"", *s);
  }
  if (const auto* i = std::get_if<int64_t>(&value)) {
    return std::to_string(*i);
  }
  if (const auto* b = std::get_if<bool>(&value)) {
    return *b ? "true" : "false";
  }
  const auto& list = std::get<std::vector<std::string>>(value);
  std::string out = "[";
  for (size_t i = 0; i < list.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += std::format("\"{}\"", list[i]);
  }
  out += "]";
  return out;
}

}  // namespace sable::config
