#include "run.h"

#include "run_logic.h"

#include "transfmt/app/format_config.h"
#include "transfmt/core/clock.h"
#include "transfmt/core/id_generator.h"
#include "transfmt/storage/audit_log.h"
#include "transfmt/storage/sqlite/sqlite_audit_log.h"
#include "transfmt/storage/sqlite/sqlite_db.h"

#include "../cli_options.h"

#include <iostream>
#include <memory>
#include <utility>

namespace {

int run_subcommand(int argc, char* argv[], const transfmt::app::RunMode mode) {  // NOLINT
  using namespace transfmt;

  auto options = cli::parse_cli_options(argc, argv, 2, std::cerr);
  if (!options.has_value()) {
    cli::print_usage(std::cerr);
    return 2;
  }
  if (options->help) {
    cli::print_usage(std::cout);
    return 0;
  }

  app::FormatConfig config;
  if (options->config_path.has_value()) {
    auto loaded = app::load_format_config_file(options->config_path.value());
    if (!loaded.has_value()) {
      std::cerr << "error: " << loaded.error().message << "\n";
      return 1;
    }
    config = loaded.value();
  }
  config = app::overlay_format_config(std::move(config), options->format_overrides);

  auto resolved = app::resolve_format_config(config);
  if (!resolved.has_value()) {
    std::cerr << "error: " << resolved.error().message << "\n";
    return 1;
  }

  std::unique_ptr<storage::IAuditLog> audit_log;
  if (options->audit_db_path.has_value()) {
    auto db_result = storage::sqlite::SqliteDb::open(options->audit_db_path.value());
    if (!db_result.has_value()) {
      std::cerr << "error: " << db_result.error() << "\n";
      return 1;
    }
    auto db = db_result.value();
    auto schema_result = db->ensure_schema_v1();
    if (!schema_result.has_value()) {
      std::cerr << "error: Failed to initialize schema: " << schema_result.error() << "\n";
      return 1;
    }
    audit_log = std::make_unique<storage::sqlite::SqliteAuditLog>(db);
  } else {
    audit_log = std::make_unique<storage::InMemoryAuditLog>();
  }

  core::SystemIdGenerator id_gen;
  core::SystemClock clock;

  cli::RunRequest request;
  request.mode = mode;
  request.verbose = options->verbose;
  request.report_path = options->report_path;

  return cli::execute_run(resolved.value(), request, *audit_log, id_gen, clock, std::cout,
                          std::cerr);
}

}  // namespace

int cmd_format(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  return run_subcommand(argc, argv, transfmt::app::RunMode::kApply);
}

int cmd_check(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  return run_subcommand(argc, argv, transfmt::app::RunMode::kCheck);
}
