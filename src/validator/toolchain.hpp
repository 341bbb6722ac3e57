#pragma once

#include <string>

namespace validator {

struct CompileResult {
  bool success = false;
  std::string output; ///< compiler output, stderr included
};

/**
 * @brief Compiles one C translation unit.
 */
class Toolchain {
public:
  virtual ~Toolchain() = default;

  /**
   * @brief Compiles the given source text.
   * @throws errors::ProviderError when the compiler exceeds its time limit.
   */
  virtual CompileResult Compile(const std::string &unit) = 0;
};

} // namespace validator
