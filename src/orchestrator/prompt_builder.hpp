#pragma once

#include "../models/function_signature.hpp"
#include "../models/issue.hpp"
#include "../models/stub_spec.hpp"

#include <optional>
#include <string>
#include <vector>

namespace orchestrator {

/**
 * @brief Everything a generation request says about one target.
 */
struct GenerationContext {
  models::FunctionSignature target;
  std::string source_path;
  std::string source_text; ///< possibly redacted
  std::vector<models::FunctionSignature> internal_callees;
  std::vector<models::StubSpec> stubs;
  std::vector<std::string> not_stubbed;
  int required_assertions = 1;
};

/**
 * @brief Issues of a previous attempt, fed into the next prompt.
 */
struct FeedbackBundle {
  int attempt_number = 0;
  std::vector<models::Issue> issues;
};

/**
 * @brief Builds generation prompts.
 *
 * The output depends only on its arguments. With feedback, every prior
 * issue is listed verbatim followed by fix hints for recognised patterns.
 */
class PromptBuilder {
public:
  std::string Build(const GenerationContext &context,
                    const std::optional<FeedbackBundle> &feedback) const;

  /**
   * @brief Targeted instructions for the given issues, without duplicates.
   */
  static std::vector<std::string>
  FixHints(const std::vector<models::Issue> &issues);
};

} // namespace orchestrator
