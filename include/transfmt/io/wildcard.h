#pragma once

#include <string>
#include <string_view>

namespace transfmt::io {

// WildcardPattern is a glob over a whole file name: '*' matches any run of characters
// (including none), '?' exactly one character, everything else matches itself.
// Matching is case-sensitive.
class WildcardPattern {
 public:
  explicit WildcardPattern(std::string pattern) : pattern_(std::move(pattern)) {}

  [[nodiscard]] bool matches(std::string_view name) const;
  [[nodiscard]] const std::string& pattern() const { return pattern_; }

 private:
  std::string pattern_;
};

}  // namespace transfmt::io
