#include "run_logic.h"

#include "transfmt/app/run_report.h"
#include "transfmt/domain/diagnostic.h"

#include <ostream>

namespace transfmt::cli {

namespace {

void render(const domain::Diagnostic& diagnostic, std::ostream& out, std::ostream& err) {
  if (diagnostic.severity == domain::DiagnosticSeverity::kWarn) {
    err << "warning: " << domain::render_diagnostic(diagnostic) << "\n";
  } else {
    out << domain::render_diagnostic(diagnostic) << "\n";
  }
}

}  // namespace

int execute_run(const app::ResolvedFormatConfig& config, const RunRequest& request,
                storage::IAuditLog& audit_log, core::IIdGenerator& id_gen, core::IClock& clock,
                std::ostream& out, std::ostream& err) {
  app::RunHooks hooks;
  hooks.on_file_started = [&](const std::filesystem::path& path) {
    if (request.verbose) {
      out << "processing " << path.string() << "...\n";
    }
  };
  hooks.on_file_finished = [&](const app::FileOutcome& outcome) {
    for (const auto& diagnostic : outcome.diagnostics) {
      render(diagnostic, out, err);
    }
    if (!outcome.formatting_required) {
      return;
    }
    const std::string shown = (config.input_dir / outcome.file_name).string();
    if (request.mode == app::RunMode::kCheck) {
      err << "warning: " << shown << " requires proper formatting\n";
    } else if (request.verbose) {
      out << "formatted " << shown << "\n";
    }
  };

  auto result = app::run_format_pipeline(config, request.mode, audit_log, id_gen, clock, hooks);
  if (!result.has_value()) {
    err << "error: " << result.error().path << ": " << result.error().message << "\n";
    return 1;
  }
  const app::RunSummary& summary = result.value();

  if (request.report_path.has_value()) {
    auto written = app::write_run_report(request.report_path.value(), summary);
    if (!written.has_value()) {
      err << "error: " << written.error().path << ": " << written.error().message << "\n";
      return 1;
    }
  }

  if (request.mode == app::RunMode::kApply) {
    out << "formatted " << summary.files_requiring_formatting << " files\n";
    return 0;
  }

  const std::size_t count = summary.files_requiring_formatting;
  if (count == 0) {
    out << "0 files require proper formatting\n";
    return 0;
  }
  err << count << " files require proper formatting - run format to fix\n";
  return config.fail_on_error ? 1 : 0;
}

}  // namespace transfmt::cli
