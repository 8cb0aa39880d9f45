#pragma once

#include <functional>
#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace transfmt::apps {

// Option describes a single command-line flag accepted by a subcommand.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns true on success, false on validation failure. The parser keeps going
// either way so that every problem on the command line is reported in one pass.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

// ParseOutcome carries the populated config plus whether every token was understood.
template <typename Config>
struct ParseOutcome {
  Config config;     // NOLINT(readability-identifier-naming)
  bool valid{true};  // NOLINT(readability-identifier-naming)
};

// parse_options iterates argv[start..argc-1] and dispatches each recognised flag to its
// handler. Unknown flags, stray positional tokens, missing values and handler failures are
// reported to err and mark the outcome invalid.
template <typename Config>
ParseOutcome<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                   const std::vector<Option<Config>>& options, int start = 1,
                                   std::ostream& err = std::cerr) {
  ParseOutcome<Config> outcome;

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    const std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    auto it = option_map.find(arg);
    if (it == option_map.end()) {
      if (!arg.empty() && arg[0] == '-') {
        err << "Unknown option: " << arg << "\n";
      } else {
        err << "Unexpected argument: " << arg << "\n";
      }
      outcome.valid = false;
      continue;
    }

    const Option<Config>* opt = it->second;
    if (!opt->requires_value) {
      outcome.valid = opt->handler(outcome.config, "") && outcome.valid;
      continue;
    }
    if (i + 1 >= argc) {
      err << "Option " << arg << " requires a value\n";
      outcome.valid = false;
      continue;
    }
    const std::string value = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    outcome.valid = opt->handler(outcome.config, value) && outcome.valid;
  }

  return outcome;
}

// print_options writes one usage line per option.
template <typename Config>
void print_options(const std::vector<Option<Config>>& options, std::ostream& out) {
  for (const auto& opt : options) {
    out << "  " << opt.name << (opt.requires_value ? " <value>" : "") << "\n"
        << "      " << opt.description << "\n";
  }
}

}  // namespace transfmt::apps
