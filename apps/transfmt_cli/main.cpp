#include "cli_options.h"
#include "commands/run.h"

#include "transfmt/core/version.h"

#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
  if (argc < 2) {
    transfmt::cli::print_usage(std::cerr);
    return 2;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "format") {
    return cmd_format(argc, argv);
  }
  if (subcommand == "check") {
    return cmd_check(argc, argv);
  }
  if (subcommand == "--version") {
    std::cout << "transfmt v" << transfmt::core::kBuildVersion << "\n";
    return 0;
  }
  if (subcommand == "--help" || subcommand == "help") {
    transfmt::cli::print_usage(std::cout);
    return 0;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  transfmt::cli::print_usage(std::cerr);
  return 2;
}
