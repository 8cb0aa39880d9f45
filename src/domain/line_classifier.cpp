#include "transfmt/domain/line_classifier.h"

#include "transfmt/core/normalization.h"
#include "transfmt/domain/quality.h"

namespace transfmt::domain {

namespace {

// Returns the position of the first unescaped '=' or npos.
std::size_t find_separator(const std::string_view raw) {
  std::size_t backslashes = 0;
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch == '=' && backslashes % 2 == 0) {
      return i;
    }
    backslashes = (ch == '\\') ? backslashes + 1 : 0;
  }
  return std::string_view::npos;
}

// True when raw[pos] follows an odd run of backslashes that starts at or after first.
bool is_escaped(const std::string_view raw, std::size_t pos, const std::size_t first) {
  std::size_t backslashes = 0;
  while (pos > first && raw[pos - 1] == '\\') {
    ++backslashes;
    --pos;
  }
  return backslashes % 2 == 1;
}

// Like core::trim, but whitespace escaped by a backslash belongs to the key, so that
// "key=" written back out still has its separator unescaped.
std::string trim_key(const std::string_view raw) {
  std::size_t start = 0;
  while (start < raw.size() && core::is_space(raw[start])) {
    ++start;
  }
  std::size_t end = raw.size();
  while (end > start && core::is_space(raw[end - 1]) && !is_escaped(raw, end - 1, start)) {
    --end;
  }
  return std::string{raw.substr(start, end - start)};
}

}  // namespace

ClassifiedLine classify_line(const std::string_view raw) {
  ClassifiedLine line;

  if (!raw.empty() && raw.front() == '#') {
    line.kind = LineKind::kComment;
    return line;
  }
  if (core::is_blank(raw)) {
    line.kind = LineKind::kBlank;
    return line;
  }

  const std::size_t separator = find_separator(raw);
  if (separator == std::string_view::npos) {
    line.kind = LineKind::kMalformed;
    return line;
  }

  std::string key = trim_key(raw.substr(0, separator));
  if (key.empty()) {
    line.kind = LineKind::kMalformed;
    return line;
  }

  line.kind = LineKind::kEntry;
  line.key = std::move(key);
  line.value = core::trim(raw.substr(separator + 1));
  return line;
}

bool is_empty_translation(const std::string_view value) {
  return value.empty() || value == kAutoMarker || value == kTranslateMeMarker;
}

}  // namespace transfmt::domain
