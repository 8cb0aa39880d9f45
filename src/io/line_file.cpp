#include "transfmt/io/line_file.h"

#include <fstream>
#include <sstream>

namespace transfmt::io {

namespace {

void record_terminator(LineLayout& layout, const domain::EolStyle style) {
  if (!layout.style.has_value()) {
    layout.style = style;
  } else if (*layout.style != style) {
    layout.mixed = true;
  }
}

}  // namespace

LineFile parse_lines(const std::string_view content) {
  LineFile file;
  std::string current;
  bool pending = false;  // current holds a line that has not been terminated yet

  for (std::size_t i = 0; i < content.size(); ++i) {
    const char ch = content[i];
    if (ch == '\r' || ch == '\n') {
      domain::EolStyle style = domain::EolStyle::kUnix;
      if (ch == '\r') {
        if (i + 1 < content.size() && content[i + 1] == '\n') {
          style = domain::EolStyle::kWindows;
          ++i;
        } else {
          style = domain::EolStyle::kMac;
        }
      }
      record_terminator(file.layout, style);
      file.lines.push_back(std::move(current));
      current.clear();
      pending = false;
    } else {
      current.push_back(ch);
      pending = true;
    }
  }

  if (pending) {
    file.lines.push_back(std::move(current));
    file.layout.last_line_terminated = false;
  }
  return file;
}

core::Result<LineFile, core::IoError> read_line_file(const std::filesystem::path& path) {
  using ReadResult = core::Result<LineFile, core::IoError>;

  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    return ReadResult::err(core::IoError{path.string(), "failed to open file for reading"});
  }

  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    return ReadResult::err(core::IoError{path.string(), "failed to read file"});
  }

  return ReadResult::ok(parse_lines(buffer.str()));
}

core::Result<bool, core::IoError> write_line_file(const std::filesystem::path& path,
                                                  const std::vector<std::string>& lines,
                                                  const std::string_view terminator) {
  using WriteResult = core::Result<bool, core::IoError>;

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    return WriteResult::err(core::IoError{path.string(), "failed to open file for writing"});
  }

  for (const auto& line : lines) {
    out << line << terminator;
  }
  out.flush();
  if (!out) {
    return WriteResult::err(core::IoError{path.string(), "failed to write file"});
  }
  return WriteResult::ok(true);
}

bool layout_matches(const LineLayout& layout, const domain::EolStyle style,
                    const std::size_t line_count) {
  if (line_count == 0) {
    return true;
  }
  if (layout.mixed || !layout.last_line_terminated) {
    return false;
  }
  return layout.style.has_value() && *layout.style == style;
}

}  // namespace transfmt::io
