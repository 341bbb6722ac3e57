#pragma once

#include "toolchain.hpp"

#include <string>
#include <vector>

namespace validator {

struct GccSettings {
  std::string compiler = "gcc";
  std::string unity_dir;
  std::vector<std::string> include_dirs;
  unsigned timeout_seconds = 60;
};

/**
 * @brief Compiles (without linking) with a GCC-compatible driver in C99
 * mode. Implicit function declarations are errors.
 */
class GccToolchain : public Toolchain {
public:
  explicit GccToolchain(GccSettings settings);

  CompileResult Compile(const std::string &unit) override;

  /**
   * @brief The command line used for a unit stored at the given path.
   */
  std::vector<std::string> CommandLine(const std::string &path) const;

private:
  GccSettings settings_;
};

} // namespace validator
