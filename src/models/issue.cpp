#include "issue.hpp"

#include <fmt/core.h>

namespace models {

std::string ToString(IssueKind kind) {
  switch (kind) {
  case IssueKind::kCompilation:
    return "compilation";
  case IssueKind::kInsufficientCoverage:
    return "insufficient coverage";
  case IssueKind::kUnrealisticValues:
    return "unrealistic values";
  case IssueKind::kIsolation:
    return "isolation";
  case IssueKind::kConvention:
    return "convention";
  case IssueKind::kStructure:
    return "structure";
  case IssueKind::kConsistency:
    return "consistency";
  case IssueKind::kPrecision:
    return "precision";
  }
  return "unknown";
}

std::string ToString(Severity severity) {
  switch (severity) {
  case Severity::kNote:
    return "note";
  case Severity::kWarning:
    return "warning";
  case Severity::kBlocking:
    return "blocking";
  }
  return "unknown";
}

std::string Issue::Render() const {
  return fmt::format("[{}] {}: {}", ToString(severity), ToString(kind),
                     description);
}

} // namespace models
