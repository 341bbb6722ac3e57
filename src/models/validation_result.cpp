#include "validation_result.hpp"

namespace models {

int ValidationResult::BlockingIssueCount() const {
  int count = 0;
  for (const auto &issue : issues) {
    if (issue.IsBlocking()) {
      ++count;
    }
  }
  return count;
}

std::vector<std::string> ValidationResult::Errors() const {
  std::vector<std::string> result;
  for (const auto &diagnostic : diagnostics) {
    if (diagnostic.level == Diagnostic::Level::kError) {
      result.push_back(diagnostic.text);
    }
  }
  return result;
}

std::vector<std::string> ValidationResult::Warnings() const {
  std::vector<std::string> result;
  for (const auto &diagnostic : diagnostics) {
    if (diagnostic.level == Diagnostic::Level::kWarning) {
      result.push_back(diagnostic.text);
    }
  }
  return result;
}

} // namespace models
