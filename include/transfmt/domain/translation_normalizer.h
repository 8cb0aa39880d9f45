#pragma once

#include "transfmt/domain/diagnostic.h"

#include <string>
#include <string_view>
#include <vector>

namespace transfmt::domain {

struct NormalizedFile {
  std::vector<std::string> lines;
  std::vector<Diagnostic> diagnostics;
  bool content_changed{false};  // lines differ from the input sequence
};

// normalize_lines runs the whole per-file algorithm: stable sort by key, merge
// duplicates, serialize survivors and compare them with the input.
//
// Comments and blank lines never reach the output. The input is not modified.
// Running this again on its own output yields the same lines and no content change.
[[nodiscard]] NormalizedFile normalize_lines(std::string_view file_name,
                                             const std::vector<std::string>& raw_lines);

}  // namespace transfmt::domain
