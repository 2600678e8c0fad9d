#pragma once

#include "input.hpp"

namespace sable::driver {

// Plan a run: resolve configuration, discover sources, compute format regions
// for every file on the worker pool and print them in input order.
// Returns the process exit code: 0 on success, 1 if any error was reported.
auto Run(RunOptions options) -> int;

}  // namespace sable::driver
