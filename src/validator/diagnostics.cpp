#include "diagnostics.hpp"

#include "../helpers/helpers.hpp"

namespace validator {

std::vector<models::Diagnostic> ParseDiagnostics(const std::string &output) {
  std::vector<models::Diagnostic> diagnostics;
  for (const auto &raw : helpers::SplitLines(output)) {
    auto line = helpers::Trim(raw);
    if (line.find("error:") != std::string::npos ||
        line.find("undefined reference") != std::string::npos) {
      diagnostics.push_back({models::Diagnostic::Level::kError, line});
    } else if (line.find("warning:") != std::string::npos) {
      diagnostics.push_back({models::Diagnostic::Level::kWarning, line});
    }
  }
  return diagnostics;
}

} // namespace validator
