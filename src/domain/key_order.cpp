#include "transfmt/domain/key_order.h"

#include "transfmt/core/normalization.h"

namespace transfmt::domain {

namespace {

// preceding_backslashes is the length of the backslash run just before ch.
bool is_key_terminator(const char ch, const std::size_t preceding_backslashes) {
  return ch == ' ' || ch == '\t' || (ch == '=' && preceding_backslashes % 2 == 0);
}

int char_difference(const char lhs, const char rhs) {
  return static_cast<int>(static_cast<unsigned char>(lhs)) -
         static_cast<int>(static_cast<unsigned char>(rhs));
}

}  // namespace

int compare_keys(const std::string_view lhs, const std::string_view rhs) {
  const std::size_t n1 = lhs.size();
  const std::size_t n2 = rhs.size();
  std::size_t backslashes1 = 0;
  std::size_t backslashes2 = 0;

  for (std::size_t i = 0; i < n1 && i < n2; ++i) {
    char c1 = lhs[i];
    char c2 = rhs[i];
    const bool c1_terminated = is_key_terminator(c1, backslashes1);
    const bool c2_terminated = is_key_terminator(c2, backslashes2);
    if (c1_terminated && c2_terminated) {
      return 0;
    }
    if (c1_terminated) {
      return -1;
    }
    if (c2_terminated) {
      return 1;
    }
    if (c1 != c2) {
      c1 = core::to_upper_ascii(c1);
      c2 = core::to_upper_ascii(c2);
      if (c1 != c2) {
        // Second pass on the lower-cased form for mappings that are not symmetric.
        c1 = core::to_lower_ascii(c1);
        c2 = core::to_lower_ascii(c2);
        if (c1 != c2) {
          return char_difference(c1, c2);
        }
      }
    }
    backslashes1 = (lhs[i] == '\\') ? backslashes1 + 1 : 0;
    backslashes2 = (rhs[i] == '\\') ? backslashes2 + 1 : 0;
  }

  if (n1 == n2) {
    return 0;
  }
  return n1 < n2 ? -1 : 1;
}

}  // namespace transfmt::domain
