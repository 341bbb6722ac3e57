#include "gcc_toolchain.hpp"

#include "../errors/errors.hpp"
#include "../utils/process/process.hpp"

#include <fmt/core.h>
#include <utility>

namespace validator {
namespace {
// Diagnostics name the unit by a stable name, not the temporary path.
constexpr const char *kUnitName = "candidate_unit.c";

std::string ReplaceAll(std::string text, const std::string &from,
                       const std::string &to) {
  if (from.empty()) {
    return text;
  }
  std::size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
  return text;
}
} // namespace

GccToolchain::GccToolchain(GccSettings settings)
    : settings_(std::move(settings)) {}

std::vector<std::string>
GccToolchain::CommandLine(const std::string &path) const {
  std::vector<std::string> argv{settings_.compiler,
                                "-std=c99",
                                "-c",
                                "-o",
                                "/dev/null",
                                "-Wall",
                                "-Werror=implicit-function-declaration"};
  if (!settings_.unity_dir.empty()) {
    argv.push_back("-I" + settings_.unity_dir);
  }
  for (const auto &dir : settings_.include_dirs) {
    argv.push_back("-I" + dir);
  }
  argv.push_back(path);
  return argv;
}

CompileResult GccToolchain::Compile(const std::string &unit) {
  utils::process::ScopedTempFile file("ctestgen_unit", ".c", unit);
  if (!file.IsValid()) {
    return CompileResult{false, "error: cannot write the candidate unit"};
  }
  utils::process::RunOptions options;
  options.timeout_seconds = settings_.timeout_seconds;
  auto result =
      utils::process::RunProcess(CommandLine(file.GetPath()), options);
  if (result.timed_out) {
    throw errors::ProviderError(
        errors::ProviderErrorKind::kTimeout,
        fmt::format("{} exceeded {} s", settings_.compiler,
                    settings_.timeout_seconds));
  }
  return CompileResult{result.exit_code == 0,
                       ReplaceAll(result.out, file.GetPath(), kUnitName)};
}

} // namespace validator
