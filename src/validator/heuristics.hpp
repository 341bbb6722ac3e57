#pragma once

#include "../models/function_signature.hpp"
#include "../models/issue.hpp"

#include <string>
#include <vector>

namespace validator {

struct HeuristicSettings {
  int min_assertions = 1;
};

/**
 * @brief What the checks may know about the target beyond its signature.
 */
struct TargetEnvironment {
  std::vector<std::string> stub_names; ///< functions replaced by stubs
  std::string unit_text;               ///< the unit defining the target
};

/**
 * @brief Findings of the text checks on one candidate.
 */
struct HeuristicReport {
  std::vector<models::Issue> issues;
  int assertion_count = 0;
  int required_assertions = 1;
  int test_function_count = 0;
};

/**
 * @brief Assertions a test of the target must contain: the configured
 * minimum or one per branch path, whichever is larger.
 */
int RequiredAssertions(const models::FunctionSignature &target,
                       int min_assertions);

/**
 * @brief Removes comments and blanks out string literal contents.
 */
std::string StripCommentsAndStrings(const std::string &text);

/**
 * @brief Argument texts of every invocation of a function-like name.
 * Prototypes such as "extern int f(int v);" are not invocations.
 * @param text C source, comments already stripped.
 * @param name The callee.
 * @return One entry per call, each holding the whitespace-collapsed
 * arguments.
 */
std::vector<std::vector<std::string>> CallArguments(const std::string &text,
                                                    const std::string &name);

/**
 * @brief Runs the heuristic checks on candidate test source.
 * @param target The function under test.
 * @param candidate The post-processed candidate.
 * @param has_external_state True if the target uses stubs or globals.
 * @param settings Thresholds.
 * @param environment Stubs and unit text, for the isolation and embedded
 * hardware checks.
 */
HeuristicReport RunHeuristics(const models::FunctionSignature &target,
                              const std::string &candidate,
                              bool has_external_state,
                              const HeuristicSettings &settings,
                              const TargetEnvironment &environment = {});

} // namespace validator
