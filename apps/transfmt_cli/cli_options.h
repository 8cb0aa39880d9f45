#pragma once

#include "transfmt/app/format_config.h"

#include "shared/arg_parser.h"

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace transfmt::cli {

// CliOptions holds everything the format/check subcommands accept.
// format_overrides wins over the file named by config_path.
struct CliOptions {
  app::FormatConfig format_overrides;        // NOLINT(readability-identifier-naming)
  std::optional<std::string> config_path;    // NOLINT(readability-identifier-naming)
  std::optional<std::string> report_path;    // NOLINT(readability-identifier-naming)
  std::optional<std::string> audit_db_path;  // NOLINT(readability-identifier-naming)
  bool verbose{false};                       // NOLINT(readability-identifier-naming)
  bool help{false};                          // NOLINT(readability-identifier-naming)
};

[[nodiscard]] std::vector<apps::Option<CliOptions>> build_option_registry();

// parse_cli_options reads argv[start..]; returns nullopt (after reporting to err) when any
// argument is invalid.
[[nodiscard]] std::optional<CliOptions> parse_cli_options(int argc,
                                                          char* argv[],  // NOLINT
                                                          int start, std::ostream& err);

void print_usage(std::ostream& out);

}  // namespace transfmt::cli
