#include "transfmt/app/run_report.h"

#include "transfmt/core/version.h"

#include <nlohmann/json.hpp>

#include <fstream>

namespace transfmt::app {

std::string run_summary_to_json(const RunSummary& summary) {
  using json = nlohmann::json;

  json files = json::array();
  for (const auto& outcome : summary.files) {
    json diagnostics = json::array();
    for (const auto& diagnostic : outcome.diagnostics) {
      diagnostics.push_back({
          {"detail", diagnostic.detail},
          {"severity", std::string(domain::severity_to_string(diagnostic.severity))},
          {"tag", std::string(domain::tag_to_string(diagnostic.tag))},
      });
    }

    json j;
    j["content_changed"] = outcome.content_changed;
    j["diagnostics"] = diagnostics;
    j["file"] = outcome.file_name;
    j["formatting_required"] = outcome.formatting_required;
    j["input_lines"] = outcome.input_lines;
    j["output_hash"] = outcome.output_hash;
    j["output_lines"] = outcome.output_lines;
    j["source_hash"] = outcome.source_hash;
    j["written"] = outcome.written;
    files.push_back(j);
  }

  json j;
  j["build_version"] = core::kBuildVersion;
  j["files"] = files;
  j["files_processed"] = summary.files_processed;
  j["files_requiring_formatting"] = summary.files_requiring_formatting;
  j["files_written"] = summary.files_written;
  j["mode"] = run_mode_to_string(summary.mode);
  j["run_id"] = summary.run_id;
  return j.dump(2);
}

core::Result<bool, core::IoError> write_run_report(const std::string& path,
                                                   const RunSummary& summary) {
  std::ofstream out(path, std::ios::trunc);
  if (!out.is_open()) {
    return core::Result<bool, core::IoError>::err(
        core::IoError{path, "failed to open report for writing"});
  }
  out << run_summary_to_json(summary) << "\n";
  out.flush();
  if (!out) {
    return core::Result<bool, core::IoError>::err(core::IoError{path, "failed to write report"});
  }
  return core::Result<bool, core::IoError>::ok(true);
}

}  // namespace transfmt::app
