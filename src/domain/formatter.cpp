#include "transfmt/domain/formatter.h"

#include "transfmt/core/normalization.h"

namespace transfmt::domain {

namespace {

bool starts_with_ignore_case(const std::string_view text, const std::string_view prefix) {
  if (text.size() < prefix.size()) {
    return false;
  }
  for (std::size_t i = 0; i < prefix.size(); ++i) {
    if (core::to_lower_ascii(text[i]) != prefix[i]) {
      return false;
    }
  }
  return true;
}

}  // namespace

core::Result<EolStyle, core::ConfigError> parse_eol_style(const std::string_view text) {
  using EolResult = core::Result<EolStyle, core::ConfigError>;

  if (starts_with_ignore_case(text, "unix")) {
    return EolResult::ok(EolStyle::kUnix);
  }
  if (starts_with_ignore_case(text, "win")) {
    return EolResult::ok(EolStyle::kWindows);
  }
  if (starts_with_ignore_case(text, "mac")) {
    return EolResult::ok(EolStyle::kMac);
  }
  return EolResult::err(core::ConfigError{core::ConfigErrorKind::kUnknownEolStyle,
                                          "unknown eolStyle '" + std::string(text) +
                                              "', known: unix|win|mac"});
}

std::string_view line_terminator(const EolStyle style) {
  switch (style) {
    case EolStyle::kUnix:
      return "\n";
    case EolStyle::kWindows:
      return "\r\n";
    case EolStyle::kMac:
      return "\r";
  }
  return "\n";
}

std::string_view eol_style_name(const EolStyle style) {
  switch (style) {
    case EolStyle::kUnix:
      return "unix";
    case EolStyle::kWindows:
      return "win";
    case EolStyle::kMac:
      return "mac";
  }
  return "unix";
}

EolStyle native_eol_style() {
#if defined(_WIN32)
  return EolStyle::kWindows;
#else
  return EolStyle::kUnix;
#endif
}

std::vector<std::string> serialize_entries(const std::vector<Entry>& entries) {
  std::vector<std::string> lines;
  lines.reserve(entries.size());
  for (const auto& entry : entries) {
    lines.push_back(to_line(entry));
  }
  return lines;
}

bool lines_differ(const std::vector<std::string>& original,
                  const std::vector<std::string>& normalized) {
  return original != normalized;
}

std::string join_lines(const std::vector<std::string>& lines, const std::string_view terminator) {
  std::string out;
  for (const auto& line : lines) {
    out += line;
    out += terminator;
  }
  return out;
}

}  // namespace transfmt::domain
