#include "cli_options.h"

#include <iostream>

namespace transfmt::cli {

namespace {

// ────────────────────────────────────────────────────────────────
// Option Handlers
// ────────────────────────────────────────────────────────────────

bool handle_dir(CliOptions& options, const std::string& value) {
  options.format_overrides.dir = value;
  return true;
}

bool handle_output_dir(CliOptions& options, const std::string& value) {
  options.format_overrides.output_dir = value;
  return true;
}

bool handle_include(CliOptions& options, const std::string& value) {
  options.format_overrides.includes.push_back(value);
  return true;
}

bool handle_exclude(CliOptions& options, const std::string& value) {
  options.format_overrides.excludes.push_back(value);
  return true;
}

bool handle_eol(CliOptions& options, const std::string& value) {
  // Validated with the rest of the configuration so a bad value is a configuration error.
  options.format_overrides.eol_style = value;
  return true;
}

}  // namespace

// ────────────────────────────────────────────────────────────────
// Option Registry
// ────────────────────────────────────────────────────────────────

std::vector<apps::Option<CliOptions>> build_option_registry() {
  return {
      {"--dir", true, "Input directory (default: .)", handle_dir},
      {"--output-dir", true, "Output directory (default: the input directory)",
       handle_output_dir},
      {"--include", true, "Wildcard for files to process, '*' and '?' (repeatable)",
       handle_include},
      {"--exclude", true, "Wildcard for files to skip, overrides --include (repeatable)",
       handle_exclude},
      {"--eol", true, "Line terminator style (unix|win|mac, default: platform)", handle_eol},
      {"--write-if-unchanged", false, "Write output files even when nothing changed",
       [](CliOptions& o, const std::string&) {
         o.format_overrides.write_if_unchanged = true;
         return true;
       }},
      {"--no-fail", false, "check: report files needing formatting but exit 0",
       [](CliOptions& o, const std::string&) {
         o.format_overrides.fail_on_error = false;
         return true;
       }},
      {"--config", true, "JSON config file (command-line options take precedence)",
       [](CliOptions& o, const std::string& v) {
         o.config_path = v;
         return true;
       }},
      {"--report", true, "Write a JSON run report to this path",
       [](CliOptions& o, const std::string& v) {
         o.report_path = v;
         return true;
       }},
      {"--audit-db", true, "Append the run's audit trail to this SQLite database",
       [](CliOptions& o, const std::string& v) {
         o.audit_db_path = v;
         return true;
       }},
      {"--verbose", false, "Print progress for every file",
       [](CliOptions& o, const std::string&) {
         o.verbose = true;
         return true;
       }},
      {"--help", false, "Show this help",
       [](CliOptions& o, const std::string&) {
         o.help = true;
         return true;
       }},
  };
}

std::optional<CliOptions> parse_cli_options(int argc, char* argv[], int start,  // NOLINT
                                            std::ostream& err) {
  const auto registry = build_option_registry();
  auto outcome = apps::parse_options(argc, argv, registry, start, err);
  if (!outcome.valid) {
    return std::nullopt;
  }
  return outcome.config;
}

void print_usage(std::ostream& out) {
  out << "usage:\n"
      << "  transfmt format [options]   sort, deduplicate and rewrite translation files\n"
      << "  transfmt check [options]    report files that are not normalized\n"
      << "  transfmt --version\n"
      << "\noptions:\n";
  apps::print_options(build_option_registry(), out);
}

}  // namespace transfmt::cli
