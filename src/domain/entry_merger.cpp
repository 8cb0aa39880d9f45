#include "transfmt/domain/entry_merger.h"

#include "transfmt/domain/key_order.h"
#include "transfmt/domain/line_classifier.h"

#include <utility>

namespace transfmt::domain {

EntryMerger::EntryMerger(std::string file_name) : file_name_(std::move(file_name)) {}

void EntryMerger::accept(const std::string_view raw_line) {
  ClassifiedLine line = classify_line(raw_line);

  switch (line.kind) {
    case LineKind::kComment:
    case LineKind::kBlank:
      return;
    case LineKind::kMalformed:
      report(DiagnosticSeverity::kWarn, DiagnosticTag::kNoKeyValue, std::string(raw_line));
      return;
    case LineKind::kEntry:
      break;
  }

  if (is_empty_translation(line.value)) {
    report(DiagnosticSeverity::kWarn, DiagnosticTag::kEmptyTranslation, std::string(raw_line));
  }

  Entry current = make_entry(std::move(line.key), std::move(line.value));

  if (retained_.has_value() && same_key(current.key, retained_->key)) {
    merge_same_key(std::move(current));
    return;
  }

  if (retained_.has_value()) {
    result_.entries.push_back(std::move(*retained_));
  }
  retained_ = std::move(current);
}

void EntryMerger::merge_same_key(Entry current) {
  Entry& retained = *retained_;

  if (current.quality < retained.quality) {
    report(DiagnosticSeverity::kInfo, DiagnosticTag::kDrop, to_line(retained.key, current.value));
    return;
  }

  if (current.quality > retained.quality) {
    report(DiagnosticSeverity::kInfo, DiagnosticTag::kDrop, to_line(retained));
    retained = std::move(current);
    return;
  }

  // Equal quality: the first-seen entry always wins.
  if (current.value == retained.value) {
    report(DiagnosticSeverity::kInfo, DiagnosticTag::kDropDuplicate,
           to_line(retained.key, current.value));
  } else if (current.quality == Quality::kManuallyTranslated) {
    report(DiagnosticSeverity::kWarn, DiagnosticTag::kRevisitKeep, to_line(retained));
    report(DiagnosticSeverity::kWarn, DiagnosticTag::kRevisitDrop, to_line(current));
  } else {
    report(DiagnosticSeverity::kInfo, DiagnosticTag::kDrop, to_line(retained.key, current.value));
  }
}

MergeResult EntryMerger::finish() {
  if (retained_.has_value()) {
    result_.entries.push_back(std::move(*retained_));
    retained_.reset();
  }
  MergeResult out = std::move(result_);
  result_ = MergeResult{};
  return out;
}

void EntryMerger::report(const DiagnosticSeverity severity, const DiagnosticTag tag,
                         std::string detail) {
  result_.diagnostics.push_back(Diagnostic{severity, file_name_, tag, std::move(detail)});
}

MergeResult merge_sorted_lines(const std::string_view file_name,
                               const std::vector<std::string>& sorted_lines) {
  EntryMerger merger{std::string(file_name)};
  for (const auto& line : sorted_lines) {
    merger.accept(line);
  }
  return merger.finish();
}

}  // namespace transfmt::domain
