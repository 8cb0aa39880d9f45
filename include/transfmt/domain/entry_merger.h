#pragma once

#include "transfmt/domain/diagnostic.h"
#include "transfmt/domain/entry.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace transfmt::domain {

struct MergeResult {
  std::vector<Entry> entries;          // one per surviving key, in input (sorted) order
  std::vector<Diagnostic> diagnostics;  // in the order the decisions were taken
};

// EntryMerger collapses runs of same-key entries into the single best one.
//
// Lines must arrive sorted by compare_keys. Comments and blank lines are skipped
// silently; malformed lines are skipped with a "no key/val" warning. The merger keeps
// one retained entry; a new key flushes it to the output. For a repeated key
// (case-sensitive):
// - lower quality than retained: current dropped
// - higher quality: retained dropped and replaced
// - equal quality, identical value: current dropped as duplicate
// - equal quality, both manual, values differ: retained kept, two revisit warnings
// - equal quality otherwise: current dropped
// The merger never fails; every anomaly becomes a diagnostic.
class EntryMerger {
 public:
  explicit EntryMerger(std::string file_name);

  void accept(std::string_view raw_line);

  // Flushes the retained entry, returns everything collected so far and resets the
  // merger for reuse.
  [[nodiscard]] MergeResult finish();

 private:
  void merge_same_key(Entry current);
  void report(DiagnosticSeverity severity, DiagnosticTag tag, std::string detail);

  std::string file_name_;
  std::optional<Entry> retained_;
  MergeResult result_;
};

// merge_sorted_lines runs one EntryMerger over an already sorted sequence.
[[nodiscard]] MergeResult merge_sorted_lines(std::string_view file_name,
                                             const std::vector<std::string>& sorted_lines);

}  // namespace transfmt::domain
