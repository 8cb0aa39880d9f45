#pragma once

#include "transfmt/core/result.h"
#include "transfmt/domain/formatter.h"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace transfmt::io {

// LineLayout records how the lines of a file were terminated.
struct LineLayout {
  std::optional<domain::EolStyle> style;  // set when at least one terminator was seen
  bool mixed{false};                      // more than one convention in the same file
  bool last_line_terminated{true};
};

struct LineFile {
  std::vector<std::string> lines;
  LineLayout layout;
};

// parse_lines splits content on "\r\n", "\n" or "\r". A trailing terminator does not
// start an extra empty line; empty content has no lines.
[[nodiscard]] LineFile parse_lines(std::string_view content);

[[nodiscard]] core::Result<LineFile, core::IoError> read_line_file(
    const std::filesystem::path& path);

// write_line_file replaces path with lines, each followed by terminator.
[[nodiscard]] core::Result<bool, core::IoError> write_line_file(
    const std::filesystem::path& path, const std::vector<std::string>& lines,
    std::string_view terminator);

// layout_matches is true when writing the file back with style would not change its
// terminators: a single convention equal to style, with the last line terminated.
// A file without lines always matches.
[[nodiscard]] bool layout_matches(const LineLayout& layout, domain::EolStyle style,
                                  std::size_t line_count);

}  // namespace transfmt::io
