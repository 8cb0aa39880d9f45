#pragma once

#include "transfmt/core/result.h"
#include "transfmt/domain/formatter.h"
#include "transfmt/io/file_selector.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace transfmt::app {

// FormatConfig holds the options as given (config file and/or command line).
// Unset optionals mean "not configured" and receive their defaults during resolution.
struct FormatConfig {
  std::optional<std::string> dir;             // NOLINT(readability-identifier-naming)
  std::optional<std::string> output_dir;      // NOLINT(readability-identifier-naming)
  std::vector<std::string> includes;          // NOLINT(readability-identifier-naming)
  std::vector<std::string> excludes;          // NOLINT(readability-identifier-naming)
  std::optional<bool> write_if_unchanged;     // NOLINT(readability-identifier-naming)
  std::optional<std::string> eol_style;       // NOLINT(readability-identifier-naming)
  std::optional<bool> fail_on_error;          // NOLINT(readability-identifier-naming)
};

// ResolvedFormatConfig is the validated, immutable configuration handed to the pipeline.
struct ResolvedFormatConfig {
  std::filesystem::path input_dir;                           // NOLINT(readability-identifier-naming)
  std::filesystem::path output_dir;                          // NOLINT(readability-identifier-naming)
  io::FileSelector selector;                                 // NOLINT(readability-identifier-naming)
  bool write_if_unchanged{false};                            // NOLINT(readability-identifier-naming)
  domain::EolStyle eol_style{domain::EolStyle::kUnix};       // NOLINT(readability-identifier-naming)
  bool fail_on_error{true};                                  // NOLINT(readability-identifier-naming)
};

// load_format_config_file reads a JSON object with the keys dir, outputDir, includes,
// excludes, writeIfUnchanged, eolStyle and failOnError. includes/excludes accept a
// string or an array of strings. Unknown keys are ignored.
[[nodiscard]] core::Result<FormatConfig, core::ConfigError> load_format_config_file(
    const std::string& path);

// parse_format_config is load_format_config_file without the file access.
[[nodiscard]] core::Result<FormatConfig, core::ConfigError> parse_format_config(
    const std::string& json_text);

// overlay_format_config returns base with every option set in overrides replacing it.
// Non-empty include/exclude lists replace the base lists as a whole.
[[nodiscard]] FormatConfig overlay_format_config(FormatConfig base, const FormatConfig& overrides);

// resolve_format_config validates once, before any file is touched:
// - dir must be non-empty (default ".") and an existing directory
// - output dir (default: dir) is created if missing
// - eol style must be unix|win|mac (default: the platform's native style)
[[nodiscard]] core::Result<ResolvedFormatConfig, core::ConfigError> resolve_format_config(
    const FormatConfig& config);

}  // namespace transfmt::app
