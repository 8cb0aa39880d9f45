#pragma once

#include "transfmt/domain/quality.h"

#include <string>
#include <string_view>

namespace transfmt::domain {

// Entry is a parsed key/value pair. quality is derived from value once, at construction.
struct Entry {
  std::string key;
  std::string value;
  Quality quality{Quality::kEmpty};

  bool operator==(const Entry& other) const = default;
};

[[nodiscard]] inline Entry make_entry(std::string key, std::string value) {
  const Quality quality = classify_quality(value);
  return Entry{std::move(key), std::move(value), quality};
}

// to_line serializes a pair without any annotation: key + "=" + value.
[[nodiscard]] inline std::string to_line(std::string_view key, std::string_view value) {
  std::string line;
  line.reserve(key.size() + 1 + value.size());
  line.append(key);
  line.push_back('=');
  line.append(value);
  return line;
}

[[nodiscard]] inline std::string to_line(const Entry& entry) {
  return to_line(entry.key, entry.value);
}

}  // namespace transfmt::domain
