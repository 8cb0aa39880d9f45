#pragma once

#include <string>
#include <string_view>

namespace transfmt::domain {

enum class DiagnosticSeverity {
  kInfo,
  kWarn,
};

// One tag per decision the normalizer can take on a line.
enum class DiagnosticTag {
  kNoKeyValue,        // malformed line dropped
  kEmptyTranslation,  // entry kept, but its value carries no translation
  kDropDuplicate,     // identical key and value seen before
  kDrop,              // a better (or first-seen equal) translation exists
  kRevisitKeep,       // two different manual translations: this one is kept
  kRevisitDrop,       // two different manual translations: this one is dropped
};

// Diagnostic is a typed event describing one decision. The normalizer appends these to
// an ordered list; rendering and persistence are the caller's business.
struct Diagnostic {
  DiagnosticSeverity severity{DiagnosticSeverity::kInfo};
  std::string file;
  DiagnosticTag tag{DiagnosticTag::kDrop};
  std::string detail;  // the affected line, as "key=value" or raw text

  bool operator==(const Diagnostic& other) const = default;
};

[[nodiscard]] std::string_view tag_to_string(DiagnosticTag tag);
[[nodiscard]] std::string_view severity_to_string(DiagnosticSeverity severity);

// render_diagnostic formats "<file>: <tag>: <detail>".
[[nodiscard]] std::string render_diagnostic(const Diagnostic& diagnostic);

}  // namespace transfmt::domain
