#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Exception types raised by the generation pipeline.
 *
 * Only ConfigurationError is fatal to a run. StructuralAnalysisError is
 * scoped to one source file and ProviderError to one generation attempt.
 */
namespace errors {

/**
 * @brief A source file could not be structurally analyzed.
 */
class StructuralAnalysisError : public std::runtime_error {
public:
  /**
   * @brief Constructs the error.
   * @param path The file that failed to analyze.
   * @param message What was wrong with it.
   */
  StructuralAnalysisError(const std::string &path, const std::string &message);

  /**
   * @brief Returns the file that failed to analyze.
   */
  const std::string &GetPath() const { return path_; }

private:
  std::string path_;
};

/**
 * @brief Failure classes of an external call.
 */
enum class ProviderErrorKind { kTimeout, kRateLimited, kMalformedResponse };

/**
 * @brief Returns a lowercase name for the provider error kind.
 */
std::string ToString(ProviderErrorKind kind);

/**
 * @brief An external generation (or toolchain) call failed or timed out.
 */
class ProviderError : public std::runtime_error {
public:
  /**
   * @brief Constructs the error.
   * @param kind The failure class.
   * @param message Details reported by the collaborator.
   */
  ProviderError(ProviderErrorKind kind, const std::string &message);

  /**
   * @brief Returns the failure class.
   */
  ProviderErrorKind GetKind() const { return kind_; }

private:
  ProviderErrorKind kind_;
};

/**
 * @brief Invalid launch settings. Raised before any pipeline work begins.
 */
class ConfigurationError : public std::runtime_error {
public:
  explicit ConfigurationError(const std::string &message);
};

} // namespace errors
