#include "transfmt/domain/diagnostic.h"

namespace transfmt::domain {

std::string_view tag_to_string(const DiagnosticTag tag) {
  switch (tag) {
    case DiagnosticTag::kNoKeyValue:
      return "no key/val";
    case DiagnosticTag::kEmptyTranslation:
      return "empty translation";
    case DiagnosticTag::kDropDuplicate:
      return "drop duplicate";
    case DiagnosticTag::kDrop:
      return "drop";
    case DiagnosticTag::kRevisitKeep:
      return "drop one of two of equal quality (revisit!):keep";
    case DiagnosticTag::kRevisitDrop:
      return "drop one of two of equal quality (revisit!):drop";
  }
  return "unknown";
}

std::string_view severity_to_string(const DiagnosticSeverity severity) {
  switch (severity) {
    case DiagnosticSeverity::kInfo:
      return "info";
    case DiagnosticSeverity::kWarn:
      return "warn";
  }
  return "unknown";
}

std::string render_diagnostic(const Diagnostic& diagnostic) {
  std::string out = diagnostic.file;
  out += ": ";
  out += tag_to_string(diagnostic.tag);
  out += ": ";
  out += diagnostic.detail;
  return out;
}

}  // namespace transfmt::domain
