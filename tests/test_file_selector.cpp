#include "transfmt/io/file_selector.h"

#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace transfmt::io;
namespace fs = std::filesystem;

namespace {

// Scratch directory under the system temp dir, removed on destruction.
struct ScratchDir {
  fs::path path;

  explicit ScratchDir(const std::string& name)
      : path(fs::temp_directory_path() / ("transfmt_test_" + name)) {
    fs::remove_all(path);
    fs::create_directories(path);
  }
  ~ScratchDir() {
    std::error_code ec;
    fs::remove_all(path, ec);
  }
  ScratchDir(const ScratchDir&) = delete;
  ScratchDir& operator=(const ScratchDir&) = delete;

  void touch(const std::string& name) const { std::ofstream(path / name) << "a=1\n"; }
};

std::vector<std::string> names_of(const std::vector<fs::path>& paths) {
  std::vector<std::string> names;
  for (const auto& p : paths) {
    names.push_back(p.filename().string());
  }
  return names;
}

}  // namespace

TEST_CASE("FileSelector without includes accepts everything", "[io][file_selector]") {
  const FileSelector selector;
  CHECK(selector.accepts("Resources_de.properties"));
  CHECK(selector.accepts("README"));
}

TEST_CASE("FileSelector excludes override includes", "[io][file_selector]") {
  FileSelector selector;
  selector.includes.emplace_back("*.properties");
  selector.excludes.emplace_back("Resources_en*");

  CHECK(selector.accepts("Resources_de.properties"));
  CHECK_FALSE(selector.accepts("Resources_en.properties"));
  CHECK_FALSE(selector.accepts("notes.txt"));
}

TEST_CASE("select_files lists matching regular files in name order", "[io][file_selector]") {
  ScratchDir dir("select_files");
  dir.touch("Resources_fr.properties");
  dir.touch("Resources_de.properties");
  dir.touch("notes.txt");
  fs::create_directories(dir.path / "nested.properties");
  dir.touch("nested.properties/Resources_it.properties");

  FileSelector selector;
  selector.includes.emplace_back("*.properties");

  auto files = select_files(dir.path, selector);
  REQUIRE(files.has_value());
  CHECK(names_of(files.value()) ==
        std::vector<std::string>{"Resources_de.properties", "Resources_fr.properties"});
}

TEST_CASE("select_files reports a missing directory", "[io][file_selector]") {
  const fs::path missing = fs::temp_directory_path() / "transfmt_test_does_not_exist";
  fs::remove_all(missing);

  auto files = select_files(missing, FileSelector{});
  REQUIRE_FALSE(files.has_value());
  CHECK(files.error().path == missing.string());
}
