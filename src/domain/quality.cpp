#include "transfmt/domain/quality.h"

namespace transfmt::domain {

namespace {

bool contains_after_start(const std::string_view value, const std::string_view marker) {
  const std::size_t pos = value.find(marker);
  return pos != std::string_view::npos && pos > 0;
}

}  // namespace

Quality classify_quality(const std::string_view value) {
  if (value.empty()) {
    return Quality::kEmpty;
  }
  if (contains_after_start(value, kTranslateMeMarker)) {
    return Quality::kNeedsTranslation;
  }
  if (contains_after_start(value, kAutoMarker)) {
    return Quality::kAutoTranslated;
  }
  return Quality::kManuallyTranslated;
}

std::string to_string(const Quality quality) {
  switch (quality) {
    case Quality::kEmpty:
      return "empty";
    case Quality::kNeedsTranslation:
      return "needs-translation";
    case Quality::kAutoTranslated:
      return "auto-translated";
    case Quality::kManuallyTranslated:
      return "manually-translated";
  }
  return "unknown";
}

}  // namespace transfmt::domain
