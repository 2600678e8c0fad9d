#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "sable/common/source_location.hpp"

namespace sable {

// Type of diagnostic message
enum class DiagKind : uint8_t {
  kConfigError,     // Malformed config, unknown option, bad type or regex
  kPathError,       // Unreadable input file, symlink loop
  kRangeError,      // Malformed or inverted --line-ranges request
  kDirectiveError,  // Directive anomaly escalated by scan policy
  kWarning,         // Non-fatal
  kNote,            // Auxiliary message
};

// Represents missing location (for run-level errors)
struct UnknownLocation {
  auto operator==(const UnknownLocation&) const -> bool = default;
};

using DiagLocation = std::variant<SourceLocation, UnknownLocation>;

// Single diagnostic item (primary or note)
struct DiagItem {
  DiagKind kind;
  DiagLocation location;
  std::string message;

  auto operator==(const DiagItem&) const -> bool = default;
};

// Complete diagnostic with primary message and optional notes
struct Diagnostic {
  DiagItem primary;
  std::vector<DiagItem> notes;

  auto operator==(const Diagnostic&) const -> bool = default;

  // Factory: configuration error without location (e.g. CLI override)
  static auto ConfigError(std::string msg) -> Diagnostic {
    return Make(DiagKind::kConfigError, UnknownLocation{}, std::move(msg));
  }

  // Factory: configuration error attributed to a config file
  static auto ConfigError(SourceLocation loc, std::string msg) -> Diagnostic {
    return Make(DiagKind::kConfigError, std::move(loc), std::move(msg));
  }

  // Factory: per-file path error
  static auto PathError(std::string path, std::string msg) -> Diagnostic {
    return Make(
        DiagKind::kPathError, SourceLocation{.path = std::move(path)},
        std::move(msg));
  }

  static auto RangeError(std::string msg) -> Diagnostic {
    return Make(DiagKind::kRangeError, UnknownLocation{}, std::move(msg));
  }

  static auto DirectiveError(SourceLocation loc, std::string msg)
      -> Diagnostic {
    return Make(DiagKind::kDirectiveError, std::move(loc), std::move(msg));
  }

  static auto Warning(SourceLocation loc, std::string msg) -> Diagnostic {
    return Make(DiagKind::kWarning, std::move(loc), std::move(msg));
  }

  // Add a note without location
  auto WithNote(std::string msg) && -> Diagnostic {
    notes.push_back(
        DiagItem{
            .kind = DiagKind::kNote,
            .location = UnknownLocation{},
            .message = std::move(msg),
        });
    return std::move(*this);
  }

  [[nodiscard]] auto IsError() const -> bool {
    return primary.kind != DiagKind::kWarning &&
           primary.kind != DiagKind::kNote;
  }

 private:
  static auto Make(DiagKind kind, DiagLocation loc, std::string msg)
      -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = kind, .location = std::move(loc), .message = std::move(msg)},
        .notes = {},
    };
  }
};

template <typename T>
using Result = std::expected<T, Diagnostic>;

}  // namespace sable
