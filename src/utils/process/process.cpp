#include "process.hpp"

#include <atomic>
#include <cstdio>
#include <filesystem>
#include <fmt/core.h>
#include <fstream>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>

namespace utils::process {
namespace {
std::atomic<unsigned long> temp_counter{0};

RunResult RunShell(const std::string &command_line) {
  RunResult result;
  FILE *pipe = popen(command_line.c_str(), "r");
  if (pipe == nullptr) {
    result.exit_code = -1;
    result.out = "failed to popen";
    return result;
  }

  char buffer[4096];
  size_t n;
  while ((n = fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
    result.out.append(buffer, n);
  }

  const int status = pclose(pipe);
  if (status == -1) {
    result.exit_code = -1;
  } else if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else {
    result.exit_code = status;
  }
  return result;
}

std::string Decorate(const std::string &body, const RunOptions &options) {
  std::string command_line;
  if (options.timeout_seconds > 0) {
    command_line = fmt::format("timeout {} ", options.timeout_seconds);
  }
  command_line += body;
  if (options.stdin_path.has_value()) {
    command_line += fmt::format(" < {}", QuoteArgument(*options.stdin_path));
  } else {
    command_line += " < /dev/null";
  }
  if (options.merge_stderr) {
    command_line += " 2>&1";
  }
  return command_line;
}

RunResult Finish(RunResult result, const RunOptions &options) {
  if (options.timeout_seconds > 0 && result.exit_code == kTimeoutExitCode) {
    result.timed_out = true;
  }
  return result;
}
} // namespace

std::string QuoteArgument(const std::string &arg) {
  std::string quoted = "'";
  for (char ch : arg) {
    if (ch == '\'') {
      quoted += "'\\''";
    } else {
      quoted.push_back(ch);
    }
  }
  quoted.push_back('\'');
  return quoted;
}

RunResult RunCommand(const std::string &command, const RunOptions &options) {
  std::string body = fmt::format("sh -c {}", QuoteArgument(command));
  return Finish(RunShell(Decorate(body, options)), options);
}

RunResult RunProcess(const std::vector<std::string> &argv,
                     const RunOptions &options) {
  if (argv.empty()) {
    return RunResult{-1, "empty command", false};
  }
  std::string body;
  for (size_t i = 0; i < argv.size(); ++i) {
    if (i != 0) {
      body += ' ';
    }
    body += QuoteArgument(argv[i]);
  }
  return Finish(RunShell(Decorate(body, options)), options);
}

ScopedTempFile::ScopedTempFile(const std::string &prefix,
                               const std::string &suffix,
                               const std::string &content)
    : valid_(false) {
  std::error_code ec;
  auto dir = std::filesystem::temp_directory_path(ec);
  if (ec) {
    dir = "/tmp";
  }
  path_ = (dir / fmt::format("{}_{}_{}{}", prefix, getpid(),
                             temp_counter.fetch_add(1), suffix))
              .string();
  std::ofstream out(path_, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    return;
  }
  out << content;
  out.close();
  valid_ = !out.fail();
}

ScopedTempFile::~ScopedTempFile() {
  std::error_code ec;
  std::filesystem::remove(path_, ec);
}

} // namespace utils::process
