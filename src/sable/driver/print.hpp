#pragma once

#include <span>
#include <string>

#include "sable/common/diagnostic/diagnostic.hpp"
#include "sable/common/diagnostic/diagnostic_sink.hpp"
#include "sable/pipeline/process_file.hpp"

namespace sable::driver {

void PrintError(const std::string& message);
void PrintDiagnostic(const Diagnostic& diag);
void PrintDiagnostics(const DiagnosticSink& sink);

// One line per region on stdout: "<display>:<start>-<end>".
void PrintRegions(const pipeline::FileResult& result);

// Final "N files planned, M excluded, K failed" summary on stderr.
void PrintSummary(std::span<const pipeline::FileResult> results);

}  // namespace sable::driver
