#include "redactor.hpp"

namespace orchestrator {

Redactor::Redactor() {
  const auto flags = std::regex::ECMAScript | std::regex::icase;
  // URLs first: "//" inside them would otherwise read as a comment.
  patterns_.emplace_back(std::regex(R"(https?://[^\s'"]+)", flags),
                         "[URL REDACTED]");
  patterns_.emplace_back(std::regex(R"(/\*[\s\S]*?\*/)", flags),
                         "/* [COMMENT REDACTED] */");
  patterns_.emplace_back(std::regex(R"(//[^\n]*)", flags),
                         "// [COMMENT REDACTED]");
  patterns_.emplace_back(std::regex(R"("(\\.|[^"\\\n])*")", flags),
                         "\"[STRING REDACTED]\"");
  // Long base64-like runs with both letters and digits.
  patterns_.emplace_back(
      std::regex(
          R"(\b(?=[A-Za-z0-9+/=]*[0-9])(?=[A-Za-z0-9+/=]*[A-Za-z])[A-Za-z0-9+/=]{20,}\b)",
          flags),
      "[CREDENTIAL REDACTED]");
  patterns_.emplace_back(
      std::regex(R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,}\b)",
                 flags),
      "[EMAIL REDACTED]");
  patterns_.emplace_back(
      std::regex(R"(\b\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3}\b)", flags),
      "[IP REDACTED]");
}

std::string Redactor::Redact(const std::string &text) const {
  std::string result = text;
  for (const auto &[pattern, replacement] : patterns_) {
    result = std::regex_replace(result, pattern, replacement);
  }
  return result;
}

} // namespace orchestrator
