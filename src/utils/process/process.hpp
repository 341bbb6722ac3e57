#pragma once

#include <optional>
#include <string>
#include <vector>

namespace utils::process {

/**
 * @brief Result of running a subprocess.
 */
struct RunResult {
  int exit_code = 0;      ///< Exit status, or -1 when the process could not start.
  std::string out;        ///< Captured output (stderr merged when requested).
  bool timed_out = false; ///< True when the time limit killed the process.
};

/**
 * @brief How a subprocess is launched.
 */
struct RunOptions {
  std::optional<std::string> stdin_path; ///< File fed to standard input.
  unsigned timeout_seconds = 0;          ///< 0 disables the time limit.
  bool merge_stderr = true;              ///< Capture stderr together with stdout.
};

/**
 * @brief Exit status reported by timeout(1) when the limit expires.
 */
constexpr int kTimeoutExitCode = 124;

/**
 * @brief Quotes an argument for the POSIX shell.
 * @param arg The raw argument.
 * @return The argument wrapped in single quotes.
 */
std::string QuoteArgument(const std::string &arg);

/**
 * @brief Runs a shell command line and captures its output.
 * @param command The command line, interpreted by /bin/sh.
 * @param options Launch options.
 * @return The captured result.
 */
RunResult RunCommand(const std::string &command, const RunOptions &options);

/**
 * @brief Runs an argument vector and captures its output.
 * @param argv The executable followed by its arguments.
 * @param options Launch options.
 * @return The captured result.
 */
RunResult RunProcess(const std::vector<std::string> &argv,
                     const RunOptions &options);

/**
 * @brief A uniquely named temporary file removed on destruction.
 */
class ScopedTempFile {
public:
  /**
   * @brief Creates the file with the given content.
   * @param prefix Leading part of the file name.
   * @param suffix Trailing part of the file name, e.g. ".c".
   * @param content Text written to the file.
   */
  ScopedTempFile(const std::string &prefix, const std::string &suffix,
                 const std::string &content);
  ~ScopedTempFile();

  ScopedTempFile(const ScopedTempFile &) = delete;
  ScopedTempFile &operator=(const ScopedTempFile &) = delete;

  const std::string &GetPath() const { return path_; }

  /**
   * @brief True if the content was written completely.
   */
  bool IsValid() const { return valid_; }

private:
  std::string path_;
  bool valid_;
};

} // namespace utils::process
