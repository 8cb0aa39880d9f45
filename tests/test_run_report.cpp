#include "transfmt/app/run_report.h"

#include <catch2/catch.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>

using namespace transfmt;

namespace {

app::RunSummary sample_summary() {
  app::FileOutcome outcome;
  outcome.file_name = "Resources_de.properties";
  outcome.formatting_required = true;
  outcome.content_changed = true;
  outcome.written = true;
  outcome.input_lines = 3;
  outcome.output_lines = 2;
  outcome.source_hash = "00000000000000aa";
  outcome.output_hash = "00000000000000bb";
  outcome.diagnostics.push_back({domain::DiagnosticSeverity::kInfo, "Resources_de.properties",
                                 domain::DiagnosticTag::kDrop, "a=1 [translate me]"});

  app::RunSummary summary;
  summary.run_id = "run-0";
  summary.mode = app::RunMode::kApply;
  summary.files_processed = 1;
  summary.files_requiring_formatting = 1;
  summary.files_written = 1;
  summary.files.push_back(outcome);
  return summary;
}

}  // namespace

TEST_CASE("run_summary_to_json carries counts and diagnostics", "[app][report]") {
  const auto j = nlohmann::json::parse(app::run_summary_to_json(sample_summary()));

  CHECK(j["run_id"] == "run-0");
  CHECK(j["mode"] == "apply");
  CHECK(j["files_processed"] == 1);
  CHECK(j["files_requiring_formatting"] == 1);
  CHECK(j["files_written"] == 1);
  CHECK(j.contains("build_version"));

  REQUIRE(j["files"].size() == 1);
  const auto& file = j["files"][0];
  CHECK(file["file"] == "Resources_de.properties");
  CHECK(file["input_lines"] == 3);
  CHECK(file["output_lines"] == 2);
  REQUIRE(file["diagnostics"].size() == 1);
  CHECK(file["diagnostics"][0]["tag"] == "drop");
  CHECK(file["diagnostics"][0]["severity"] == "info");
  CHECK(file["diagnostics"][0]["detail"] == "a=1 [translate me]");
}

TEST_CASE("run_summary_to_json is deterministic", "[app][report]") {
  CHECK(app::run_summary_to_json(sample_summary()) ==
        app::run_summary_to_json(sample_summary()));
}

TEST_CASE("write_run_report writes the JSON document", "[app][report]") {
  const auto path = std::filesystem::temp_directory_path() / "transfmt_test_report.json";
  std::filesystem::remove(path);

  auto written = app::write_run_report(path.string(), sample_summary());
  REQUIRE(written.has_value());

  std::ifstream in(path);
  const auto j = nlohmann::json::parse(in);
  CHECK(j["run_id"] == "run-0");

  std::filesystem::remove(path);
}

TEST_CASE("write_run_report reports an unwritable path", "[app][report]") {
  auto written = app::write_run_report("/nonexistent/dir/report.json", sample_summary());
  REQUIRE_FALSE(written.has_value());
  CHECK(written.error().path == "/nonexistent/dir/report.json");
}
