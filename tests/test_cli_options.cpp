#include "cli_options.h"

#include <catch2/catch.hpp>

#include <sstream>
#include <string>
#include <vector>

using namespace transfmt;

namespace {

// Owns mutable copies of the arguments so they can be passed as char* argv[].
struct Args {
  std::vector<std::string> storage;
  std::vector<char*> pointers;

  Args(std::initializer_list<const char*> args) : storage(args.begin(), args.end()) {
    for (auto& arg : storage) {
      pointers.push_back(arg.data());
    }
  }

  [[nodiscard]] int argc() const { return static_cast<int>(pointers.size()); }
  char** argv() { return pointers.data(); }
};

}  // namespace

TEST_CASE("parse_cli_options reads every option", "[cli][options]") {
  Args args{"transfmt",   "format",    "--dir",      "translations", "--output-dir",
            "out",        "--include", "*.properties", "--include",    "*.txt",
            "--exclude",  "en*",       "--eol",      "win",          "--write-if-unchanged",
            "--no-fail",  "--config",  "cfg.json",   "--report",     "report.json",
            "--audit-db", "audit.db",  "--verbose"};
  std::ostringstream err;

  auto options = cli::parse_cli_options(args.argc(), args.argv(), 2, err);
  REQUIRE(options.has_value());
  CHECK(err.str().empty());

  const auto& overrides = options->format_overrides;
  CHECK(overrides.dir == "translations");
  CHECK(overrides.output_dir == "out");
  CHECK(overrides.includes == std::vector<std::string>{"*.properties", "*.txt"});
  CHECK(overrides.excludes == std::vector<std::string>{"en*"});
  CHECK(overrides.eol_style == "win");
  CHECK(overrides.write_if_unchanged == true);
  CHECK(overrides.fail_on_error == false);
  CHECK(options->config_path == "cfg.json");
  CHECK(options->report_path == "report.json");
  CHECK(options->audit_db_path == "audit.db");
  CHECK(options->verbose);
  CHECK_FALSE(options->help);
}

TEST_CASE("parse_cli_options leaves unset options empty", "[cli][options]") {
  Args args{"transfmt", "check"};
  std::ostringstream err;

  auto options = cli::parse_cli_options(args.argc(), args.argv(), 2, err);
  REQUIRE(options.has_value());
  CHECK_FALSE(options->format_overrides.dir.has_value());
  CHECK_FALSE(options->format_overrides.fail_on_error.has_value());
  CHECK_FALSE(options->config_path.has_value());
  CHECK_FALSE(options->verbose);
}

TEST_CASE("parse_cli_options rejects unknown and incomplete arguments", "[cli][options]") {
  Args args{"transfmt", "format", "--bogus", "stray", "--dir"};
  std::ostringstream err;

  auto options = cli::parse_cli_options(args.argc(), args.argv(), 2, err);
  CHECK_FALSE(options.has_value());
  CHECK(err.str().find("Unknown option: --bogus") != std::string::npos);
  CHECK(err.str().find("Unexpected argument: stray") != std::string::npos);
  CHECK(err.str().find("Option --dir requires a value") != std::string::npos);
}

TEST_CASE("print_usage lists the subcommands and options", "[cli][options]") {
  std::ostringstream out;
  cli::print_usage(out);

  const std::string text = out.str();
  CHECK(text.find("transfmt format") != std::string::npos);
  CHECK(text.find("transfmt check") != std::string::npos);
  for (const auto& option : cli::build_option_registry()) {
    CHECK(text.find(option.name) != std::string::npos);
  }
}
