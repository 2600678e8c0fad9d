#pragma once

#include <string>
#include <utility>
#include <vector>

#include "sable/common/diagnostic/diagnostic.hpp"

namespace sable {

// Collects diagnostics for one file. Not thread-safe; each worker owns the
// sink of the file it is processing.
// Diagnostics are stored in order of reporting; callers may rely on this.
class DiagnosticSink {
 public:
  void Report(Diagnostic diag) {
    if (diag.IsError()) {
      has_errors_ = true;
    }
    diagnostics_.push_back(std::move(diag));
  }

  void Warning(SourceLocation loc, std::string msg) {
    Report(Diagnostic::Warning(std::move(loc), std::move(msg)));
  }

  [[nodiscard]] auto HasErrors() const -> bool {
    return has_errors_;
  }

  [[nodiscard]] auto GetDiagnostics() const -> const std::vector<Diagnostic>& {
    return diagnostics_;
  }

 private:
  std::vector<Diagnostic> diagnostics_;
  bool has_errors_ = false;
};

}  // namespace sable
