#pragma once

#include <string>

namespace models {

enum class IssueKind {
  kCompilation,
  kInsufficientCoverage,
  kUnrealisticValues,
  kIsolation,
  kConvention,
  kStructure,
  kConsistency,
  kPrecision
};

enum class Severity { kNote, kWarning, kBlocking };

std::string ToString(IssueKind kind);
std::string ToString(Severity severity);

/**
 * @brief One problem found in a candidate test.
 */
struct Issue {
  IssueKind kind;
  Severity severity;
  std::string description;

  bool IsBlocking() const { return severity == Severity::kBlocking; }

  /**
   * @brief Renders the issue as "[severity] kind: description".
   */
  std::string Render() const;

  bool operator==(const Issue &other) const {
    return kind == other.kind && severity == other.severity &&
           description == other.description;
  }
};

} // namespace models
