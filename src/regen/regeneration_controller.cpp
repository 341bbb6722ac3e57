#include "regeneration_controller.hpp"

#include "../errors/errors.hpp"
#include "../fatal/fatal.hpp"

#include <fmt/core.h>
#include <algorithm>
#include <stdexcept>
#include <thread>
#include <utility>

namespace regen {

using models::TargetState;

const models::GenerationAttempt *TargetOutcome::Best() const {
  if (!best_index.has_value() || *best_index >= attempts.size()) {
    return nullptr;
  }
  return &attempts[*best_index];
}

bool TargetOutcome::IsAccepted() const {
  return state == TargetState::kAccepted ||
         state == TargetState::kExhaustedWarn;
}

int TargetOutcome::Regenerations() const {
  return attempts.empty() ? 0 : static_cast<int>(attempts.size()) - 1;
}

bool TargetOutcome::ImprovedByRegeneration() const {
  auto best = Best();
  if (best == nullptr || best->number == 1) {
    return false;
  }
  for (const auto &attempt : attempts) {
    if (attempt.WasEvaluated()) {
      return &attempt != best && best->validation->tier > attempt.validation->tier;
    }
  }
  return false;
}

RegenerationController::RegenerationController(
    orchestrator::GenerationOrchestrator &orchestrator,
    validator::Validator &validator, RegenerationSettings settings,
    const std::atomic<bool> *abort_flag)
    : orchestrator_(orchestrator), validator_(validator),
      settings_(std::move(settings)), abort_flag_(abort_flag),
      state_(TargetState::kPending) {}

bool RegenerationController::IsBetter(const models::GenerationAttempt &a,
                                      const models::GenerationAttempt &b) {
  if (a.validation->tier != b.validation->tier) {
    return a.validation->tier > b.validation->tier;
  }
  int a_blocking = a.validation->BlockingIssueCount();
  int b_blocking = b.validation->BlockingIssueCount();
  if (a_blocking != b_blocking) {
    return a_blocking < b_blocking;
  }
  return a.number < b.number;
}

bool RegenerationController::IsAllowed(TargetState from, TargetState to) {
  if (models::IsTerminal(from)) {
    return false;
  }
  switch (from) {
  case TargetState::kPending:
    return to == TargetState::kAttempting;
  case TargetState::kAttempting:
    return to == TargetState::kEvaluating || to == TargetState::kAttempting ||
           to == TargetState::kExhaustedWarn ||
           to == TargetState::kExhaustedFail;
  case TargetState::kEvaluating:
    return to == TargetState::kAccepted || to == TargetState::kAttempting ||
           to == TargetState::kExhaustedWarn ||
           to == TargetState::kExhaustedFail;
  default:
    return false;
  }
}

void RegenerationController::Transition(TargetState next) {
  if (!IsAllowed(state_, next)) {
    throw std::logic_error(fmt::format("invalid transition {} -> {}",
                                       models::ToString(state_),
                                       models::ToString(next)));
  }
  state_ = next;
}

bool RegenerationController::Aborted() const {
  return abort_flag_ != nullptr && abort_flag_->load();
}

void RegenerationController::Backoff(int failures) const {
  auto wait = settings_.backoff_unit *
              ((1 << std::min(failures, kMaxBackoffExponent)) + 1);
  auto deadline = std::chrono::steady_clock::now() + wait;
  loger::info(fmt::format("rate limited, waiting {} ms", wait.count()));
  while (std::chrono::steady_clock::now() < deadline && !Aborted()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(50) < wait
                                    ? std::chrono::milliseconds(50)
                                    : wait);
  }
}

TargetOutcome RegenerationController::Finish(TargetOutcome outcome,
                                             TargetState state) {
  Transition(state);
  outcome.state = state;
  return outcome;
}

TargetOutcome
RegenerationController::Run(const orchestrator::GenerationContext &context,
                            const validator::ValidationTarget &target) {
  state_ = TargetState::kPending;
  TargetOutcome outcome;
  const auto &name = context.target.name;
  const int budget = settings_.regenerate_on_low_quality
                         ? settings_.max_regeneration_attempts + 1
                         : 1;

  std::optional<orchestrator::FeedbackBundle> feedback;
  int rate_limited = 0;

  for (int number = 1; number <= budget; ++number) {
    Transition(TargetState::kAttempting);
    if (Aborted()) {
      outcome.cancelled = true;
      return Finish(std::move(outcome), TargetState::kExhaustedFail);
    }
    models::GenerationAttempt attempt;
    attempt.number = number;
    attempt.prompt = orchestrator_.BuildPrompt(context, feedback);
    loger::info(fmt::format("{}: attempt {}/{}", name, number, budget));

    try {
      attempt.candidate = orchestrator_.Generate(attempt.prompt);
      if (Aborted()) {
        outcome.cancelled = true;
        return Finish(std::move(outcome), TargetState::kExhaustedFail);
      }
      Transition(TargetState::kEvaluating);
      attempt.validation = validator_.Validate(target, attempt.candidate);
      if (Aborted()) {
        outcome.cancelled = true;
        return Finish(std::move(outcome), TargetState::kExhaustedFail);
      }
    } catch (const errors::ProviderError &e) {
      attempt.outcome = models::AttemptOutcome::kFailed;
      attempt.provider_error = e.what();
      outcome.attempts.push_back(std::move(attempt));
      loger::warning(fmt::format("{}: attempt {} failed", name, number),
                     std::string(e.what()));
      if (Aborted()) {
        outcome.cancelled = true;
        return Finish(std::move(outcome), TargetState::kExhaustedFail);
      }
      if (e.GetKind() == errors::ProviderErrorKind::kRateLimited &&
          number < budget) {
        Backoff(rate_limited++);
      }
      continue;
    }

    const auto &validation = *attempt.validation;
    attempt.outcome = validation.compiles ? models::AttemptOutcome::kCompiled
                                          : models::AttemptOutcome::kFailed;
    loger::info(fmt::format("{}: attempt {} rated {} ({} issues)", name,
                            number, models::ToString(validation.tier),
                            validation.issues.size()));
    outcome.attempts.push_back(std::move(attempt));
    const auto &latest = outcome.attempts.back();
    auto best = outcome.Best();
    if (best == nullptr || IsBetter(latest, *best)) {
      outcome.best_index = outcome.attempts.size() - 1;
    }

    if (latest.validation->tier >= settings_.quality_threshold) {
      outcome.best_index = outcome.attempts.size() - 1;
      return Finish(std::move(outcome), TargetState::kAccepted);
    }
    if (!settings_.regenerate_on_low_quality) {
      return Finish(std::move(outcome), TargetState::kExhaustedFail);
    }
    feedback = orchestrator::FeedbackBundle{number, latest.validation->issues};
  }

  if (outcome.Best() != nullptr) {
    loger::warning(fmt::format(
        "{}: no attempt reached {}; keeping attempt {} rated {}", name,
        models::ToString(settings_.quality_threshold), outcome.Best()->number,
        models::ToString(outcome.Best()->validation->tier)));
    return Finish(std::move(outcome), TargetState::kExhaustedWarn);
  }
  return Finish(std::move(outcome), TargetState::kExhaustedFail);
}

} // namespace regen
