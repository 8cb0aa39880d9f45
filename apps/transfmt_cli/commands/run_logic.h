#pragma once

#include "transfmt/app/format_config.h"
#include "transfmt/app/format_pipeline.h"
#include "transfmt/core/clock.h"
#include "transfmt/core/id_generator.h"
#include "transfmt/storage/audit_log.h"

#include <iosfwd>
#include <optional>
#include <string>

namespace transfmt::cli {

struct RunRequest {
  app::RunMode mode{app::RunMode::kApply};  // NOLINT(readability-identifier-naming)
  bool verbose{false};                      // NOLINT(readability-identifier-naming)
  std::optional<std::string> report_path;   // NOLINT(readability-identifier-naming)
};

// execute_run drives one run and renders it: informational diagnostics go to out,
// warnings to err. Takes only interface types so tests can inject in-memory storage.
//
// Exit codes: 0 success; 1 I/O failure, or check mode found files needing formatting
// while config.fail_on_error is set.
int execute_run(const app::ResolvedFormatConfig& config, const RunRequest& request,
                storage::IAuditLog& audit_log, core::IIdGenerator& id_gen, core::IClock& clock,
                std::ostream& out, std::ostream& err);

}  // namespace transfmt::cli
