#pragma once

#include "transfmt/core/result.h"
#include "transfmt/domain/entry.h"

#include <string>
#include <string_view>
#include <vector>

namespace transfmt::domain {

enum class EolStyle {
  kUnix,     // "\n"
  kWindows,  // "\r\n"
  kMac,      // "\r"
};

// parse_eol_style accepts any value starting with "unix", "win" or "mac" (case-insensitive).
// Anything else is a kUnknownEolStyle configuration error.
[[nodiscard]] core::Result<EolStyle, core::ConfigError> parse_eol_style(std::string_view text);

[[nodiscard]] std::string_view line_terminator(EolStyle style);
[[nodiscard]] std::string_view eol_style_name(EolStyle style);

// native_eol_style is the convention of the platform this binary was built for. It is read
// once while resolving the configuration and passed on explicitly from there.
[[nodiscard]] EolStyle native_eol_style();

[[nodiscard]] std::vector<std::string> serialize_entries(const std::vector<Entry>& entries);

// lines_differ compares element-wise; any removed, added or reordered line counts.
[[nodiscard]] bool lines_differ(const std::vector<std::string>& original,
                                const std::vector<std::string>& normalized);

// join_lines appends terminator after every line, including the last one.
[[nodiscard]] std::string join_lines(const std::vector<std::string>& lines,
                                     std::string_view terminator);

}  // namespace transfmt::domain
