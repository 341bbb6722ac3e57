#include "errors.hpp"

#include <fmt/core.h>

namespace errors {

StructuralAnalysisError::StructuralAnalysisError(const std::string &path,
                                                 const std::string &message)
    : std::runtime_error(fmt::format("{}: {}", path, message)), path_(path) {}

std::string ToString(ProviderErrorKind kind) {
  switch (kind) {
  case ProviderErrorKind::kTimeout:
    return "timeout";
  case ProviderErrorKind::kRateLimited:
    return "rate_limited";
  case ProviderErrorKind::kMalformedResponse:
    return "malformed_response";
  }
  return "unknown";
}

ProviderError::ProviderError(ProviderErrorKind kind, const std::string &message)
    : std::runtime_error(fmt::format("{}: {}", ToString(kind), message)),
      kind_(kind) {}

ConfigurationError::ConfigurationError(const std::string &message)
    : std::runtime_error(message) {}

} // namespace errors
