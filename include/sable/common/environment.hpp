#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace sable {

// Environment variable lookup. Unset and empty variables both yield nullopt.
// Injected so that tests can supply their own environment.
using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

// Lookup backed by the process environment (std::getenv).
auto ProcessEnvironment() -> EnvLookup;

}  // namespace sable
