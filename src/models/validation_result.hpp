#pragma once

#include "issue.hpp"
#include "quality_tier.hpp"

#include <string>
#include <vector>

namespace models {

struct Diagnostic {
  enum class Level { kError, kWarning, kNote };

  Level level;
  std::string text; // verbatim compiler line
};

/**
 * @brief Outcome of validating one candidate test.
 */
struct ValidationResult {
  bool compiles = false;
  std::vector<Diagnostic> diagnostics;
  std::vector<Issue> issues;
  QualityTier tier = QualityTier::kLow;

  int assertion_count = 0;
  int required_assertions = 1;
  int test_function_count = 0;

  int BlockingIssueCount() const;
  std::vector<std::string> Errors() const;
  std::vector<std::string> Warnings() const;
};

} // namespace models
