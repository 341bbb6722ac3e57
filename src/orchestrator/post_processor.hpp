#pragma once

#include <string>
#include <vector>

namespace orchestrator {

/**
 * @brief Repairs common defects of generated Unity tests.
 */
class PostProcessor {
public:
  /**
   * @brief Strips markdown fences, corrects misspelled Unity macros, adds the
   * unity.h include and, when missing, a runner main.
   */
  std::string Process(const std::string &candidate) const;

  /**
   * @brief Removes markdown code fence lines.
   */
  static std::string StripFences(const std::string &text);

  /**
   * @brief Names of the void test_*() functions defined in the text, in
   * order of appearance.
   */
  static std::vector<std::string> TestFunctions(const std::string &text);

  static bool HasMain(const std::string &text);
};

} // namespace orchestrator
