#include "transfmt/io/file_selector.h"

#include <algorithm>
#include <system_error>

namespace transfmt::io {

bool FileSelector::accepts(const std::string_view file_name) const {
  const auto matches = [file_name](const WildcardPattern& pattern) {
    return pattern.matches(file_name);
  };

  if (std::any_of(excludes.begin(), excludes.end(), matches)) {
    return false;
  }
  return includes.empty() || std::any_of(includes.begin(), includes.end(), matches);
}

core::Result<std::vector<std::filesystem::path>, core::IoError> select_files(
    const std::filesystem::path& dir, const FileSelector& selector) {
  using SelectResult = core::Result<std::vector<std::filesystem::path>, core::IoError>;

  std::error_code ec;
  std::filesystem::directory_iterator it(dir, ec);
  if (ec) {
    return SelectResult::err(core::IoError{dir.string(), "cannot list directory: " + ec.message()});
  }

  std::vector<std::filesystem::path> files;
  for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
    if (ec) {
      return SelectResult::err(
          core::IoError{dir.string(), "cannot list directory: " + ec.message()});
    }
    std::error_code type_ec;
    if (!it->is_regular_file(type_ec) || type_ec) {
      continue;
    }
    if (selector.accepts(it->path().filename().string())) {
      files.push_back(it->path());
    }
  }
  if (ec) {
    return SelectResult::err(core::IoError{dir.string(), "cannot list directory: " + ec.message()});
  }

  std::sort(files.begin(), files.end(),
            [](const std::filesystem::path& a, const std::filesystem::path& b) {
              return a.filename().string() < b.filename().string();
            });
  return SelectResult::ok(std::move(files));
}

}  // namespace transfmt::io
