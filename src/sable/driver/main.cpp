#include <argparse/argparse.hpp>
#include <exception>
#include <iostream>
#include <string>
#include <utility>

#include "input.hpp"
#include "print.hpp"
#include "run.hpp"
#include "sable/config/run_environment.hpp"

auto main(int argc, char* argv[]) -> int {
  argparse::ArgumentParser program("sable", std::string(sable::config::kVersion));
  program.add_description(
      "Resolve formatter configuration and plan the line regions of each "
      "Python source file that may be rewritten");
  sable::driver::AddRunFlags(program);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    sable::driver::PrintError(err.what());
    std::cerr << program;
    return 1;
  }

  auto options = sable::driver::BuildRunOptions(program);
  if (!options) {
    sable::driver::PrintDiagnostic(options.error());
    return 1;
  }

  return sable::driver::Run(std::move(*options));
}
