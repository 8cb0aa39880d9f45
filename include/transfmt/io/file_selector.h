#pragma once

#include "transfmt/core/result.h"
#include "transfmt/io/wildcard.h"

#include <filesystem>
#include <string_view>
#include <vector>

namespace transfmt::io {

// FileSelector decides which files of the input directory are processed.
// No includes means every regular file; excludes always win over includes.
struct FileSelector {
  std::vector<WildcardPattern> includes;
  std::vector<WildcardPattern> excludes;

  [[nodiscard]] bool accepts(std::string_view file_name) const;
};

// select_files lists the regular files directly inside dir (no recursion) that the
// selector accepts, sorted by file name.
[[nodiscard]] core::Result<std::vector<std::filesystem::path>, core::IoError> select_files(
    const std::filesystem::path& dir, const FileSelector& selector);

}  // namespace transfmt::io
