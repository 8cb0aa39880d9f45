#pragma once

#include <string>
#include <string_view>

namespace transfmt::domain {

// Quality ranks how trustworthy a translation value is. Enumerators are declared in
// ascending order so the built-in comparison operators give the ranking.
enum class Quality {
  kEmpty,
  kNeedsTranslation,
  kAutoTranslated,
  kManuallyTranslated,
};

inline constexpr std::string_view kTranslateMeMarker = "[translate me]";
inline constexpr std::string_view kAutoMarker = "[auto]";

// classify_quality maps a (trimmed) value to its quality level.
//
// A marker only counts when its first occurrence is at a positive offset. A value that
// starts with "[auto]" or "[translate me]" is therefore ManuallyTranslated; the merger
// relies on this exact rule, so do not widen it to "contains anywhere".
[[nodiscard]] Quality classify_quality(std::string_view value);

[[nodiscard]] std::string to_string(Quality quality);

}  // namespace transfmt::domain
