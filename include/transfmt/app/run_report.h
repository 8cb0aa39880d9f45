#pragma once

#include "transfmt/app/format_pipeline.h"
#include "transfmt/core/result.h"

#include <string>

namespace transfmt::app {

// run_summary_to_json serializes a summary with alphabetically sorted keys.
// Output is deterministic given the same summary.
[[nodiscard]] std::string run_summary_to_json(const RunSummary& summary);

[[nodiscard]] core::Result<bool, core::IoError> write_run_report(const std::string& path,
                                                                 const RunSummary& summary);

}  // namespace transfmt::app
