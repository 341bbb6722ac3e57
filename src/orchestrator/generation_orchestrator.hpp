#pragma once

#include "../analyzer/codebase.hpp"
#include "../models/stub_spec.hpp"
#include "generation_provider.hpp"
#include "post_processor.hpp"
#include "prompt_builder.hpp"
#include "redactor.hpp"

#include <optional>
#include <string>
#include <vector>

namespace orchestrator {

/**
 * @brief Turns a target plus optional feedback into candidate test source.
 *
 * One Generate() call makes exactly one provider call; retries belong to
 * the regeneration controller.
 */
class GenerationOrchestrator {
public:
  /**
   * @param provider The external generation capability. Not owned.
   * @param redact_sensitive Redact the source text before it is sent.
   */
  GenerationOrchestrator(GenerationProvider &provider, bool redact_sensitive);

  /**
   * @brief Gathers the generation context of a target.
   * @param codebase The analyzed codebase.
   * @param target The function to test.
   * @param dependencies Its external dependencies.
   * @param stubs Stubs synthesized for them.
   * @param required_assertions Assertion count the validator will demand.
   */
  GenerationContext
  PrepareContext(const analyzer::Codebase &codebase,
                 const models::FunctionSignature &target,
                 const analyzer::ExternalDependencies &dependencies,
                 const std::vector<models::StubSpec> &stubs,
                 int required_assertions) const;

  std::string BuildPrompt(const GenerationContext &context,
                          const std::optional<FeedbackBundle> &feedback) const;

  /**
   * @brief Sends the prompt and post-processes the reply.
   * @return Candidate test source.
   * @throws errors::ProviderError when the provider fails or the reply holds
   * no code.
   */
  std::string Generate(const std::string &prompt);

private:
  GenerationProvider &provider_;
  bool redact_sensitive_;
  Redactor redactor_;
  PromptBuilder prompt_builder_;
  PostProcessor post_processor_;
};

} // namespace orchestrator
