#include "generation_orchestrator.hpp"

#include "../errors/errors.hpp"
#include "../fatal/fatal.hpp"
#include "../helpers/helpers.hpp"
#include "../utils/verbose/verbose.hpp"

#include <fmt/core.h>

namespace orchestrator {

GenerationOrchestrator::GenerationOrchestrator(GenerationProvider &provider,
                                               bool redact_sensitive)
    : provider_(provider), redact_sensitive_(redact_sensitive) {}

GenerationContext GenerationOrchestrator::PrepareContext(
    const analyzer::Codebase &codebase, const models::FunctionSignature &target,
    const analyzer::ExternalDependencies &dependencies,
    const std::vector<models::StubSpec> &stubs, int required_assertions) const {
  GenerationContext context;
  context.target = target;
  context.source_path = target.unit_path;
  auto unit = codebase.FindUnit(target.unit_path);
  if (unit != nullptr) {
    context.source_text =
        redact_sensitive_ ? redactor_.Redact(unit->text) : unit->text;
  }
  context.internal_callees = dependencies.internal;
  context.stubs = stubs;
  context.not_stubbed = dependencies.not_stubbed;
  context.required_assertions = required_assertions;
  return context;
}

std::string GenerationOrchestrator::BuildPrompt(
    const GenerationContext &context,
    const std::optional<FeedbackBundle> &feedback) const {
  return prompt_builder_.Build(context, feedback);
}

std::string GenerationOrchestrator::Generate(const std::string &prompt) {
  if (utils::verbose::Flags::getInstance().NeedToPrintPrompts()) {
    loger::notice(fmt::format("prompt:\n{}", prompt));
  }
  auto reply = provider_.Generate(prompt);
  if (helpers::Trim(PostProcessor::StripFences(reply)).empty()) {
    throw errors::ProviderError(errors::ProviderErrorKind::kMalformedResponse,
                                "reply contains no code");
  }
  return post_processor_.Process(reply);
}

} // namespace orchestrator
