#include "transfmt/io/wildcard.h"

namespace transfmt::io {

bool WildcardPattern::matches(const std::string_view name) const {
  // Iterative matcher with single-star backtracking: linear in practice, no recursion.
  std::size_t p = 0;
  std::size_t n = 0;
  std::size_t star = std::string::npos;
  std::size_t resume = 0;

  while (n < name.size()) {
    if (p < pattern_.size() && (pattern_[p] == '?' || pattern_[p] == name[n])) {
      ++p;
      ++n;
    } else if (p < pattern_.size() && pattern_[p] == '*') {
      star = p++;
      resume = n;
    } else if (star != std::string::npos) {
      p = star + 1;
      n = ++resume;
    } else {
      return false;
    }
  }

  while (p < pattern_.size() && pattern_[p] == '*') {
    ++p;
  }
  return p == pattern_.size();
}

}  // namespace transfmt::io
