#pragma once

#include <string>
#include <string_view>

namespace transfmt::core {

// Deterministic ASCII-only text helpers.
// These functions are locale-independent and produce byte-stable output
// across all platforms and compilers. Bytes outside A-Z / a-z pass through unchanged.

inline char to_upper_ascii(const char ch) {
  if (ch >= 'a' && ch <= 'z') {
    constexpr char kCaseOffset = 'a' - 'A';
    return static_cast<char>(ch - kCaseOffset);
  }
  return ch;
}

inline char to_lower_ascii(const char ch) {
  if (ch >= 'A' && ch <= 'Z') {
    constexpr char kCaseOffset = 'a' - 'A';
    return static_cast<char>(ch + kCaseOffset);
  }
  return ch;
}

inline bool is_space(const char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

// is_blank is true for the empty string and for strings made only of whitespace.
inline bool is_blank(const std::string_view input) {
  for (const char ch : input) {
    if (!is_space(ch)) {
      return false;
    }
  }
  return true;
}

// trim removes leading and trailing whitespace
inline std::string trim(const std::string_view input) {
  std::size_t start = 0;
  while (start < input.size() && is_space(input[start])) {
    ++start;
  }

  std::size_t end = input.size();
  while (end > start && is_space(input[end - 1])) {
    --end;
  }

  return std::string{input.substr(start, end - start)};
}

}  // namespace transfmt::core
