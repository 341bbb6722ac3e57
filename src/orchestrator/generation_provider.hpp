#pragma once

#include <string>

namespace orchestrator {

/**
 * @brief The external text-generation capability.
 *
 * Implementations make exactly one external call per Generate() and report
 * failures as errors::ProviderError.
 */
class GenerationProvider {
public:
  virtual ~GenerationProvider() = default;

  /**
   * @brief Sends a prompt and returns the raw reply.
   * @throws errors::ProviderError on timeout, rate limiting or a malformed
   * reply.
   */
  virtual std::string Generate(const std::string &prompt) = 0;
};

} // namespace orchestrator
