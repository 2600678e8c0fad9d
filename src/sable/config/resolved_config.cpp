#include "sable/config/resolved_config.hpp"

#include <cstdint>
#include <string_view>
#include <variant>

#include "sable/config/option.hpp"

namespace sable::config {

auto ResolvedConfig::Get(std::string_view name) const -> const ConfigEntry* {
  auto it = entries_.find(name);
  if (it == entries_.end()) {
    return nullptr;
  }
  return &it->second;
}

// Merge guarantees every recognized option is present with its declared type.
auto ResolvedConfig::LineLength() const -> int64_t {
  return std::get<int64_t>(Get(kLineLength)->value);
}

auto ResolvedConfig::SkipStringNormalization() const -> bool {
  return std::get<bool>(Get(kSkipStringNormalization)->value);
}

auto ResolvedConfig::SkipMagicTrailingComma() const -> bool {
  return std::get<bool>(Get(kSkipMagicTrailingComma)->value);
}

}  // namespace sable::config
