#pragma once

#include "transfmt/app/format_config.h"
#include "transfmt/core/clock.h"
#include "transfmt/core/id_generator.h"
#include "transfmt/core/result.h"
#include "transfmt/domain/diagnostic.h"
#include "transfmt/storage/audit_log.h"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace transfmt::app {

enum class RunMode {
  kApply,  // write normalized files
  kCheck,  // write nothing, only count files that would change
};

[[nodiscard]] std::string run_mode_to_string(RunMode mode);

// FileOutcome describes what happened to one input file.
struct FileOutcome {
  std::string file_name;                        // NOLINT(readability-identifier-naming)
  bool formatting_required{false};              // NOLINT(readability-identifier-naming)
  bool content_changed{false};                  // NOLINT(readability-identifier-naming)
  bool written{false};                          // NOLINT(readability-identifier-naming)
  std::size_t input_lines{0};                   // NOLINT(readability-identifier-naming)
  std::size_t output_lines{0};                  // NOLINT(readability-identifier-naming)
  std::string source_hash;                      // NOLINT(readability-identifier-naming)
  std::string output_hash;                      // NOLINT(readability-identifier-naming)
  std::vector<domain::Diagnostic> diagnostics;  // NOLINT(readability-identifier-naming)
};

struct RunSummary {
  std::string run_id;                           // NOLINT(readability-identifier-naming)
  RunMode mode{RunMode::kApply};                // NOLINT(readability-identifier-naming)
  std::size_t files_processed{0};               // NOLINT(readability-identifier-naming)
  std::size_t files_requiring_formatting{0};    // NOLINT(readability-identifier-naming)
  std::size_t files_written{0};                 // NOLINT(readability-identifier-naming)
  std::vector<FileOutcome> files;               // NOLINT(readability-identifier-naming)
};

// Optional progress callbacks, invoked synchronously in file order.
struct RunHooks {
  std::function<void(const std::filesystem::path&)> on_file_started;  // NOLINT
  std::function<void(const FileOutcome&)> on_file_finished;           // NOLINT
};

// run_format_pipeline processes every selected file of config.input_dir in name order.
//
// For each file: read lines, normalize, and mark it as requiring formatting when the
// lines changed or its line terminators differ from config.eol_style. In kApply mode the
// normalized lines go to output_dir/<file name> when formatting is required or
// write_if_unchanged is set; kCheck mode never writes.
//
// Audit events (trace_id = run id): RunStarted, one Diagnostic per decision,
// FileProcessed per file, then RunCompleted. A read or write failure appends RunFailed
// and ends the run with an IoError naming the file.
[[nodiscard]] core::Result<RunSummary, core::IoError> run_format_pipeline(
    const ResolvedFormatConfig& config, RunMode mode, storage::IAuditLog& audit_log,
    core::IIdGenerator& id_gen, core::IClock& clock, const RunHooks& hooks = {});

}  // namespace transfmt::app
