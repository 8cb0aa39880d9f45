#include "transfmt/app/format_config.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <system_error>

namespace transfmt::app {

namespace {

using ConfigResult = core::Result<FormatConfig, core::ConfigError>;

core::ConfigError invalid_config(const std::string& message) {
  return core::ConfigError{core::ConfigErrorKind::kInvalidConfigFile, message};
}

std::vector<std::string> read_patterns(const nlohmann::json& node) {
  if (node.is_string()) {
    return {node.get<std::string>()};
  }
  return node.get<std::vector<std::string>>();
}

std::vector<io::WildcardPattern> compile_patterns(const std::vector<std::string>& patterns) {
  std::vector<io::WildcardPattern> compiled;
  compiled.reserve(patterns.size());
  for (const auto& pattern : patterns) {
    compiled.emplace_back(pattern);
  }
  return compiled;
}

}  // namespace

core::Result<FormatConfig, core::ConfigError> parse_format_config(const std::string& json_text) {
  const nlohmann::json j = nlohmann::json::parse(json_text, nullptr, false);
  if (j.is_discarded()) {
    return ConfigResult::err(invalid_config("config file is not valid JSON"));
  }
  if (!j.is_object()) {
    return ConfigResult::err(invalid_config("config file must contain a JSON object"));
  }

  FormatConfig config;
  try {
    if (j.contains("dir")) {
      config.dir = j.at("dir").get<std::string>();
    }
    if (j.contains("outputDir")) {
      config.output_dir = j.at("outputDir").get<std::string>();
    }
    if (j.contains("includes")) {
      config.includes = read_patterns(j.at("includes"));
    }
    if (j.contains("excludes")) {
      config.excludes = read_patterns(j.at("excludes"));
    }
    if (j.contains("writeIfUnchanged")) {
      config.write_if_unchanged = j.at("writeIfUnchanged").get<bool>();
    }
    if (j.contains("eolStyle")) {
      config.eol_style = j.at("eolStyle").get<std::string>();
    }
    if (j.contains("failOnError")) {
      config.fail_on_error = j.at("failOnError").get<bool>();
    }
  } catch (const nlohmann::json::exception& e) {
    return ConfigResult::err(invalid_config(std::string("invalid config value: ") + e.what()));
  }

  return ConfigResult::ok(std::move(config));
}

core::Result<FormatConfig, core::ConfigError> load_format_config_file(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    return ConfigResult::err(invalid_config("cannot read config file '" + path + "'"));
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();

  auto parsed = parse_format_config(buffer.str());
  if (!parsed.has_value()) {
    return ConfigResult::err(invalid_config(path + ": " + parsed.error().message));
  }
  return parsed;
}

FormatConfig overlay_format_config(FormatConfig base, const FormatConfig& overrides) {
  if (overrides.dir.has_value()) {
    base.dir = overrides.dir;
  }
  if (overrides.output_dir.has_value()) {
    base.output_dir = overrides.output_dir;
  }
  if (!overrides.includes.empty()) {
    base.includes = overrides.includes;
  }
  if (!overrides.excludes.empty()) {
    base.excludes = overrides.excludes;
  }
  if (overrides.write_if_unchanged.has_value()) {
    base.write_if_unchanged = overrides.write_if_unchanged;
  }
  if (overrides.eol_style.has_value()) {
    base.eol_style = overrides.eol_style;
  }
  if (overrides.fail_on_error.has_value()) {
    base.fail_on_error = overrides.fail_on_error;
  }
  return base;
}

core::Result<ResolvedFormatConfig, core::ConfigError> resolve_format_config(
    const FormatConfig& config) {
  using ResolveResult = core::Result<ResolvedFormatConfig, core::ConfigError>;

  const std::string dir = config.dir.value_or(".");
  if (dir.empty()) {
    return ResolveResult::err(
        core::ConfigError{core::ConfigErrorKind::kMissingInputDir, "missing attribute 'dir'"});
  }

  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) {
    return ResolveResult::err(core::ConfigError{core::ConfigErrorKind::kInputDirNotFound,
                                                "input directory '" + dir + "' does not exist"});
  }

  domain::EolStyle eol_style = domain::native_eol_style();
  if (config.eol_style.has_value()) {
    auto parsed = domain::parse_eol_style(config.eol_style.value());
    if (!parsed.has_value()) {
      return ResolveResult::err(parsed.error());
    }
    eol_style = parsed.value();
  }

  const std::string output_dir = config.output_dir.value_or(dir);
  if (!std::filesystem::is_directory(output_dir, ec)) {
    std::filesystem::create_directories(output_dir, ec);
    if (ec || !std::filesystem::is_directory(output_dir, ec)) {
      return ResolveResult::err(
          core::ConfigError{core::ConfigErrorKind::kOutputDirUncreatable,
                            "cannot create output directory '" + output_dir + "'"});
    }
  }

  ResolvedFormatConfig resolved;
  resolved.input_dir = dir;
  resolved.output_dir = output_dir;
  resolved.selector.includes = compile_patterns(config.includes);
  resolved.selector.excludes = compile_patterns(config.excludes);
  resolved.write_if_unchanged = config.write_if_unchanged.value_or(false);
  resolved.eol_style = eol_style;
  resolved.fail_on_error = config.fail_on_error.value_or(true);
  return ResolveResult::ok(std::move(resolved));
}

}  // namespace transfmt::app
