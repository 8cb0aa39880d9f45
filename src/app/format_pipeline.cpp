#include "transfmt/app/format_pipeline.h"

#include "transfmt/core/hashing.h"
#include "transfmt/domain/formatter.h"
#include "transfmt/domain/translation_normalizer.h"
#include "transfmt/io/file_selector.h"
#include "transfmt/io/line_file.h"

#include <nlohmann/json.hpp>

#include <string_view>
#include <utility>

namespace transfmt::app {

namespace {

using RunResult = core::Result<RunSummary, core::IoError>;

// Appends events for one run; the first audit failure is kept and reported as an IoError.
class RunAuditor {
 public:
  RunAuditor(storage::IAuditLog& audit_log, core::IIdGenerator& id_gen, core::IClock& clock,
             std::string run_id)
      : audit_log_(audit_log), id_gen_(id_gen), clock_(clock), run_id_(std::move(run_id)) {}

  void emit(const std::string& event_type, const nlohmann::json& payload,
            std::vector<std::string> refs = {}) {
    if (!error_.empty()) {
      return;
    }
    auto appended = audit_log_.append({id_gen_.next("evt"), run_id_, event_type, payload.dump(),
                                       clock_.now_iso8601(), std::move(refs)});
    if (!appended.has_value()) {
      error_ = appended.error();
    }
  }

  [[nodiscard]] const std::string& error() const { return error_; }

 private:
  storage::IAuditLog& audit_log_;
  core::IIdGenerator& id_gen_;
  core::IClock& clock_;
  std::string run_id_;
  std::string error_;
};

nlohmann::json diagnostic_payload(const domain::Diagnostic& diagnostic) {
  nlohmann::json j;
  j["detail"] = diagnostic.detail;
  j["file"] = diagnostic.file;
  j["severity"] = std::string(domain::severity_to_string(diagnostic.severity));
  j["tag"] = std::string(domain::tag_to_string(diagnostic.tag));
  return j;
}

nlohmann::json outcome_payload(const FileOutcome& outcome) {
  nlohmann::json j;
  j["content_changed"] = outcome.content_changed;
  j["diagnostics"] = outcome.diagnostics.size();
  j["file"] = outcome.file_name;
  j["formatting_required"] = outcome.formatting_required;
  j["input_lines"] = outcome.input_lines;
  j["output_hash"] = outcome.output_hash;
  j["output_lines"] = outcome.output_lines;
  j["source_hash"] = outcome.source_hash;
  j["written"] = outcome.written;
  return j;
}

RunResult fail_run(RunAuditor& auditor, core::IoError error) {
  nlohmann::json payload;
  payload["message"] = error.message;
  payload["path"] = error.path;
  auditor.emit("RunFailed", payload, {error.path});
  return RunResult::err(std::move(error));
}

}  // namespace

std::string run_mode_to_string(const RunMode mode) {
  switch (mode) {
    case RunMode::kApply:
      return "apply";
    case RunMode::kCheck:
      return "check";
  }
  return "unknown";
}

core::Result<RunSummary, core::IoError> run_format_pipeline(
    const ResolvedFormatConfig& config, const RunMode mode, storage::IAuditLog& audit_log,
    core::IIdGenerator& id_gen, core::IClock& clock, const RunHooks& hooks) {
  RunSummary summary;
  summary.run_id = id_gen.next("run");
  summary.mode = mode;

  RunAuditor auditor(audit_log, id_gen, clock, summary.run_id);
  const std::string_view terminator = domain::line_terminator(config.eol_style);

  {
    nlohmann::json payload;
    payload["eol_style"] = std::string(domain::eol_style_name(config.eol_style));
    payload["input_dir"] = config.input_dir.string();
    payload["mode"] = run_mode_to_string(mode);
    payload["output_dir"] = config.output_dir.string();
    payload["write_if_unchanged"] = config.write_if_unchanged;
    auditor.emit("RunStarted", payload);
  }

  auto files = io::select_files(config.input_dir, config.selector);
  if (!files.has_value()) {
    return fail_run(auditor, files.error());
  }

  for (const auto& path : files.value()) {
    if (hooks.on_file_started) {
      hooks.on_file_started(path);
    }

    auto read = io::read_line_file(path);
    if (!read.has_value()) {
      return fail_run(auditor, read.error());
    }
    const io::LineFile& input = read.value();

    FileOutcome outcome;
    outcome.file_name = path.filename().string();

    domain::NormalizedFile normalized = domain::normalize_lines(outcome.file_name, input.lines);

    outcome.content_changed = normalized.content_changed;
    outcome.formatting_required =
        normalized.content_changed ||
        !io::layout_matches(input.layout, config.eol_style, input.lines.size());
    outcome.input_lines = input.lines.size();
    outcome.output_lines = normalized.lines.size();
    // Fingerprints cover line content only, independent of the terminator convention.
    outcome.source_hash = core::stable_hash64_hex(domain::join_lines(input.lines, "\n"));
    outcome.output_hash = core::stable_hash64_hex(domain::join_lines(normalized.lines, "\n"));
    outcome.diagnostics = std::move(normalized.diagnostics);

    for (const auto& diagnostic : outcome.diagnostics) {
      auditor.emit("Diagnostic", diagnostic_payload(diagnostic), {outcome.file_name});
    }

    if (mode == RunMode::kApply && (outcome.formatting_required || config.write_if_unchanged)) {
      const std::filesystem::path target = config.output_dir / path.filename();
      auto written = io::write_line_file(target, normalized.lines, terminator);
      if (!written.has_value()) {
        return fail_run(auditor, written.error());
      }
      outcome.written = true;
      ++summary.files_written;
    }

    ++summary.files_processed;
    if (outcome.formatting_required) {
      ++summary.files_requiring_formatting;
    }

    auditor.emit("FileProcessed", outcome_payload(outcome), {outcome.file_name});

    if (hooks.on_file_finished) {
      hooks.on_file_finished(outcome);
    }
    summary.files.push_back(std::move(outcome));
  }

  {
    nlohmann::json payload;
    payload["files_processed"] = summary.files_processed;
    payload["files_requiring_formatting"] = summary.files_requiring_formatting;
    payload["files_written"] = summary.files_written;
    auditor.emit("RunCompleted", payload);
  }

  if (!auditor.error().empty()) {
    return RunResult::err(core::IoError{"audit log", auditor.error()});
  }
  return RunResult::ok(std::move(summary));
}

}  // namespace transfmt::app
