#include "transfmt/domain/translation_normalizer.h"

#include "transfmt/domain/entry.h"
#include "transfmt/domain/entry_merger.h"
#include "transfmt/domain/formatter.h"
#include "transfmt/domain/key_order.h"
#include "transfmt/domain/line_classifier.h"

#include <algorithm>
#include <cstddef>
#include <unordered_map>

namespace transfmt::domain {

namespace {

// SortItem is one input line prepared for ordering.
//
// Entries are ordered on their parsed key ("key="), so a line is sorted where its
// serialized form will sort on the next run. group is the input position of the first
// entry with the same exact key; it keeps all lines of one key together when
// compare_keys cannot tell keys apart (case variants, whitespace inside the key).
struct SortItem {
  const std::string* raw;
  std::string sort_text;
  std::size_t group;
};

std::vector<std::string> sort_lines(const std::vector<std::string>& raw_lines) {
  std::vector<SortItem> items;
  items.reserve(raw_lines.size());
  std::unordered_map<std::string, std::size_t> first_seen;

  for (std::size_t i = 0; i < raw_lines.size(); ++i) {
    const ClassifiedLine line = classify_line(raw_lines[i]);
    if (line.kind == LineKind::kEntry) {
      const std::size_t group = first_seen.emplace(line.key, i).first->second;
      items.push_back({&raw_lines[i], to_line(line.key, ""), group});
    } else {
      items.push_back({&raw_lines[i], raw_lines[i], i});
    }
  }

  // Stable: same-key lines keep their relative order, which decides equal-quality ties.
  std::stable_sort(items.begin(), items.end(), [](const SortItem& lhs, const SortItem& rhs) {
    const int order = compare_keys(lhs.sort_text, rhs.sort_text);
    if (order != 0) {
      return order < 0;
    }
    return lhs.group < rhs.group;
  });

  std::vector<std::string> sorted;
  sorted.reserve(items.size());
  for (const auto& item : items) {
    sorted.push_back(*item.raw);
  }
  return sorted;
}

}  // namespace

NormalizedFile normalize_lines(const std::string_view file_name,
                               const std::vector<std::string>& raw_lines) {
  MergeResult merged = merge_sorted_lines(file_name, sort_lines(raw_lines));

  NormalizedFile out;
  out.lines = serialize_entries(merged.entries);
  out.diagnostics = std::move(merged.diagnostics);
  out.content_changed = lines_differ(raw_lines, out.lines);
  return out;
}

}  // namespace transfmt::domain
