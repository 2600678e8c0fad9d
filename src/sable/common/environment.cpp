#include "sable/common/environment.hpp"

#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

namespace sable {

auto ProcessEnvironment() -> EnvLookup {
  return [](std::string_view name) -> std::optional<std::string> {
    const char* value = std::getenv(std::string(name).c_str());
    if (value == nullptr || *value == '\0') {
      return std::nullopt;
    }
    return std::string(value);
  };
}

}  // namespace sable
