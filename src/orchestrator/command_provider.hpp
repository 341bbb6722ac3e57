#pragma once

#include "../utils/process/process.hpp"
#include "generation_provider.hpp"

#include <string>

namespace orchestrator {

/**
 * @brief Runs a shell command with the prompt on stdin and takes its stdout
 * as the reply.
 */
class CommandProvider : public GenerationProvider {
public:
  /**
   * @param command Shell command line, run through /bin/sh.
   * @param timeout_seconds Limit for one call; 0 disables it.
   */
  CommandProvider(std::string command, unsigned timeout_seconds);

  std::string Generate(const std::string &prompt) override;

  /**
   * @brief Maps a finished command to a reply or a ProviderError.
   * @param result The captured command result.
   * @return The reply text.
   */
  static std::string Interpret(const utils::process::RunResult &result);

private:
  std::string command_;
  unsigned timeout_seconds_;
};

} // namespace orchestrator
