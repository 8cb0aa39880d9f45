#pragma once

#include <string_view>

namespace transfmt::domain {

// Key ordering and key identity are deliberately two different functions.
//
// compare_keys groups lines for sorting: it is case-insensitive and looks only at the
// key prefix of a line (up to the first space, tab or unescaped '='). same_key decides whether
// two parsed keys are merged: it is an exact, case-sensitive comparison. "Key" and "key"
// therefore sort next to each other but both survive the merge.

// compare_keys returns <0, 0 or >0.
//
// Lines are scanned position by position. A space, tab or '=' terminates the key, unless
// the '=' follows an odd number of backslashes (the same rule classify_line uses):
// - both sides terminated at the same position: equal
// - only one side terminated: that side sorts first
// - otherwise characters are compared upper-cased, and if still different, lower-cased.
// When one line runs out before either key terminates, the shorter line sorts first.
[[nodiscard]] int compare_keys(std::string_view lhs, std::string_view rhs);

// KeyOrder adapts compare_keys for std::stable_sort.
struct KeyOrder {
  bool operator()(std::string_view lhs, std::string_view rhs) const {
    return compare_keys(lhs, rhs) < 0;
  }
};

[[nodiscard]] inline bool same_key(std::string_view lhs, std::string_view rhs) {
  return lhs == rhs;
}

}  // namespace transfmt::domain
