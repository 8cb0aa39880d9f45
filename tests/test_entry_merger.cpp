#include "transfmt/domain/entry_merger.h"

#include <catch2/catch.hpp>

#include <string>
#include <vector>

using namespace transfmt::domain;

namespace {

constexpr const char* kFile = "Resources_de.properties";

Diagnostic info(DiagnosticTag tag, std::string detail) {
  return Diagnostic{DiagnosticSeverity::kInfo, kFile, tag, std::move(detail)};
}

Diagnostic warn(DiagnosticTag tag, std::string detail) {
  return Diagnostic{DiagnosticSeverity::kWarn, kFile, tag, std::move(detail)};
}

std::vector<std::string> lines_of(const MergeResult& result) {
  std::vector<std::string> lines;
  for (const auto& entry : result.entries) {
    lines.push_back(to_line(entry));
  }
  return lines;
}

}  // namespace

TEST_CASE("EntryMerger replaces a translate-me entry by a manual one", "[domain][merger]") {
  const auto result = merge_sorted_lines(kFile, {"a=1 [translate me]", "a=1", "b=2"});

  REQUIRE(lines_of(result) == std::vector<std::string>{"a=1", "b=2"});
  REQUIRE(result.diagnostics.size() == 1);
  CHECK(result.diagnostics[0] == info(DiagnosticTag::kDrop, "a=1 [translate me]"));
}

TEST_CASE("EntryMerger drops identical duplicates", "[domain][merger]") {
  const auto result = merge_sorted_lines(kFile, {"x=hello", "x=hello"});

  REQUIRE(lines_of(result) == std::vector<std::string>{"x=hello"});
  REQUIRE(result.diagnostics.size() == 1);
  CHECK(result.diagnostics[0] == info(DiagnosticTag::kDropDuplicate, "x=hello"));
}

TEST_CASE("EntryMerger treats whitespace around the separator as insignificant",
          "[domain][merger]") {
  const auto result = merge_sorted_lines(kFile, {"x = hello", "x=hello"});

  REQUIRE(lines_of(result) == std::vector<std::string>{"x=hello"});
  REQUIRE(result.diagnostics.size() == 1);
  CHECK(result.diagnostics[0].tag == DiagnosticTag::kDropDuplicate);
}

TEST_CASE("EntryMerger keeps the first of two different manual translations",
          "[domain][merger]") {
  const auto result = merge_sorted_lines(kFile, {"y=foo", "y=bar"});

  REQUIRE(lines_of(result) == std::vector<std::string>{"y=foo"});
  REQUIRE(result.diagnostics.size() == 2);
  CHECK(result.diagnostics[0] == warn(DiagnosticTag::kRevisitKeep, "y=foo"));
  CHECK(result.diagnostics[1] == warn(DiagnosticTag::kRevisitDrop, "y=bar"));
}

TEST_CASE("EntryMerger drops lines without a key", "[domain][merger]") {
  const auto result = merge_sorted_lines(kFile, {" = orphan", "no separator"});

  CHECK(result.entries.empty());
  REQUIRE(result.diagnostics.size() == 2);
  CHECK(result.diagnostics[0] == warn(DiagnosticTag::kNoKeyValue, " = orphan"));
  CHECK(result.diagnostics[1] == warn(DiagnosticTag::kNoKeyValue, "no separator"));
}

TEST_CASE("EntryMerger skips comments and blank lines silently", "[domain][merger]") {
  const auto result = merge_sorted_lines(kFile, {"# header", "", "   ", "a=1"});

  REQUIRE(lines_of(result) == std::vector<std::string>{"a=1"});
  CHECK(result.diagnostics.empty());
}

TEST_CASE("EntryMerger drops a lower-quality entry that follows", "[domain][merger]") {
  const auto result = merge_sorted_lines(kFile, {"k=Datei", "k=File [auto]"});

  REQUIRE(lines_of(result) == std::vector<std::string>{"k=Datei"});
  REQUIRE(result.diagnostics.size() == 1);
  CHECK(result.diagnostics[0] == info(DiagnosticTag::kDrop, "k=File [auto]"));
}

TEST_CASE("EntryMerger prefers auto-translated over translate-me", "[domain][merger]") {
  const auto result = merge_sorted_lines(kFile, {"k=File [translate me]", "k=Datei [auto]"});

  REQUIRE(lines_of(result) == std::vector<std::string>{"k=Datei [auto]"});
  REQUIRE(result.diagnostics.size() == 1);
  CHECK(result.diagnostics[0] == info(DiagnosticTag::kDrop, "k=File [translate me]"));
}

TEST_CASE("EntryMerger keeps the first of two equal non-manual entries", "[domain][merger]") {
  const auto result = merge_sorted_lines(kFile, {"k=a [auto]", "k=b [auto]"});

  REQUIRE(lines_of(result) == std::vector<std::string>{"k=a [auto]"});
  REQUIRE(result.diagnostics.size() == 1);
  CHECK(result.diagnostics[0] == info(DiagnosticTag::kDrop, "k=b [auto]"));
}

TEST_CASE("EntryMerger quality only increases along a run", "[domain][merger]") {
  const auto result = merge_sorted_lines(
      kFile, {"k=x [translate me]", "k=y [auto]", "k=z", "k=w [auto]", "k=v [translate me]"});

  REQUIRE(result.entries.size() == 1);
  CHECK(result.entries[0].value == "z");
  CHECK(result.entries[0].quality == Quality::kManuallyTranslated);

  REQUIRE(result.diagnostics.size() == 4);
  CHECK(result.diagnostics[0] == info(DiagnosticTag::kDrop, "k=x [translate me]"));
  CHECK(result.diagnostics[1] == info(DiagnosticTag::kDrop, "k=y [auto]"));
  CHECK(result.diagnostics[2] == info(DiagnosticTag::kDrop, "k=w [auto]"));
  CHECK(result.diagnostics[3] == info(DiagnosticTag::kDrop, "k=v [translate me]"));
}

TEST_CASE("EntryMerger warns about empty translations but keeps them", "[domain][merger]") {
  const auto result = merge_sorted_lines(kFile, {"a=", "b=[auto]", "c=[translate me]"});

  REQUIRE(lines_of(result) == std::vector<std::string>{"a=", "b=[auto]", "c=[translate me]"});
  REQUIRE(result.diagnostics.size() == 3);
  CHECK(result.diagnostics[0] == warn(DiagnosticTag::kEmptyTranslation, "a="));
  CHECK(result.diagnostics[1] == warn(DiagnosticTag::kEmptyTranslation, "b=[auto]"));
  CHECK(result.diagnostics[2] == warn(DiagnosticTag::kEmptyTranslation, "c=[translate me]"));
}

TEST_CASE("EntryMerger replaces an empty value by any translation", "[domain][merger]") {
  const auto result = merge_sorted_lines(kFile, {"k=", "k=Datei"});

  REQUIRE(lines_of(result) == std::vector<std::string>{"k=Datei"});
  REQUIRE(result.diagnostics.size() == 2);
  CHECK(result.diagnostics[0] == warn(DiagnosticTag::kEmptyTranslation, "k="));
  CHECK(result.diagnostics[1] == info(DiagnosticTag::kDrop, "k="));
}

TEST_CASE("EntryMerger keeps keys that differ only in case", "[domain][merger]") {
  const auto result = merge_sorted_lines(kFile, {"Key=1", "key=2"});

  REQUIRE(lines_of(result) == std::vector<std::string>{"Key=1", "key=2"});
  CHECK(result.diagnostics.empty());
}

TEST_CASE("EntryMerger finish resets the merger", "[domain][merger]") {
  EntryMerger merger{kFile};
  merger.accept("a=1");
  merger.accept("bad line");

  const auto first = merger.finish();
  CHECK(first.entries.size() == 1);
  CHECK(first.diagnostics.size() == 1);

  const auto second = merger.finish();
  CHECK(second.entries.empty());
  CHECK(second.diagnostics.empty());
}
