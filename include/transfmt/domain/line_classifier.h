#pragma once

#include <string>
#include <string_view>

namespace transfmt::domain {

enum class LineKind {
  kComment,    // first character is '#'
  kBlank,      // empty or whitespace only
  kEntry,      // key/value pair with a non-empty key
  kMalformed,  // no separator, or empty key
};

// ClassifiedLine is the result of looking at one raw line. key and value are only
// meaningful for kEntry; both are whitespace-trimmed, except that whitespace escaped by a
// backslash stays part of the key.
struct ClassifiedLine {
  LineKind kind{LineKind::kMalformed};
  std::string key;
  std::string value;
};

// classify_line has no side effects; the caller reports malformed lines.
//
// The separator is the first '=' that is not escaped by an odd number of backslashes,
// with any whitespace around it dropped.
[[nodiscard]] ClassifiedLine classify_line(std::string_view raw);

// is_empty_translation is true for an empty value and for a value consisting only of an
// unqualified quality marker ("[auto]" or "[translate me]"). Such entries stay valid.
[[nodiscard]] bool is_empty_translation(std::string_view value);

}  // namespace transfmt::domain
