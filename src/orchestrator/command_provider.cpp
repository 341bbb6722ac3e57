#include "command_provider.hpp"

#include "../errors/errors.hpp"
#include "../fatal/fatal.hpp"
#include "../helpers/helpers.hpp"

#include <array>
#include <fmt/core.h>
#include <string_view>
#include <utility>

namespace orchestrator {
namespace {
constexpr std::array<std::string_view, 6> kRateLimitMarkers{
    "429", "rate limit", "rate-limit", "ratelimit", "quota",
    "resource exhausted"};

bool LooksRateLimited(const std::string &output) {
  auto lowered = helpers::ToLower(output);
  for (auto marker : kRateLimitMarkers) {
    if (lowered.find(marker) != std::string::npos) {
      return true;
    }
  }
  return lowered.find("resource_exhausted") != std::string::npos;
}

std::string Excerpt(const std::string &output) {
  auto trimmed = helpers::Trim(output);
  if (trimmed.size() > 200) {
    trimmed = trimmed.substr(0, 200) + "...";
  }
  return trimmed;
}
} // namespace

CommandProvider::CommandProvider(std::string command, unsigned timeout_seconds)
    : command_(std::move(command)), timeout_seconds_(timeout_seconds) {}

std::string CommandProvider::Generate(const std::string &prompt) {
  utils::process::ScopedTempFile prompt_file("ctestgen_prompt", ".txt", prompt);
  if (!prompt_file.IsValid()) {
    throw errors::ProviderError(errors::ProviderErrorKind::kMalformedResponse,
                                "cannot write prompt file");
  }
  utils::process::RunOptions options;
  options.stdin_path = prompt_file.GetPath();
  options.timeout_seconds = timeout_seconds_;
  options.merge_stderr = false;

  loger::info(fmt::format("running provider: {}", command_));
  return Interpret(utils::process::RunCommand(command_, options));
}

std::string CommandProvider::Interpret(const utils::process::RunResult &result) {
  if (result.timed_out) {
    throw errors::ProviderError(errors::ProviderErrorKind::kTimeout,
                                "provider command timed out");
  }
  if (result.exit_code != 0) {
    if (LooksRateLimited(result.out)) {
      throw errors::ProviderError(errors::ProviderErrorKind::kRateLimited,
                                  Excerpt(result.out));
    }
    throw errors::ProviderError(
        errors::ProviderErrorKind::kMalformedResponse,
        fmt::format("provider exited with status {}: {}", result.exit_code,
                    Excerpt(result.out)));
  }
  if (helpers::Trim(result.out).empty()) {
    throw errors::ProviderError(errors::ProviderErrorKind::kMalformedResponse,
                                "provider returned an empty reply");
  }
  return result.out;
}

} // namespace orchestrator
