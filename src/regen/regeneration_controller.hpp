#pragma once

#include "../models/generation_attempt.hpp"
#include "../models/pipeline_report.hpp"
#include "../models/quality_tier.hpp"
#include "../orchestrator/generation_orchestrator.hpp"
#include "../validator/validator.hpp"

#include <atomic>
#include <chrono>
#include <optional>
#include <vector>

namespace regen {

/// Rate-limit waits stop growing after this many doublings.
constexpr int kMaxBackoffExponent = 6;

struct RegenerationSettings {
  models::QualityTier quality_threshold = models::QualityTier::kHigh;
  bool regenerate_on_low_quality = false;
  int max_regeneration_attempts = 2;
  std::chrono::milliseconds backoff_unit{1000};
};

/**
 * @brief Everything the loop produced for one target.
 */
struct TargetOutcome {
  models::TargetState state = models::TargetState::kPending;
  std::vector<models::GenerationAttempt> attempts;
  std::optional<std::size_t> best_index; ///< into attempts
  bool cancelled = false;

  const models::GenerationAttempt *Best() const;
  bool IsAccepted() const;

  /**
   * @brief Attempts made after the first one.
   */
  int Regenerations() const;

  /**
   * @brief True if a later attempt beat the first evaluated one.
   */
  bool ImprovedByRegeneration() const;
};

/**
 * @brief Bounded generate-validate loop for one target.
 *
 * States: Pending -> Attempting -> Evaluating -> {Accepted, Attempting,
 * ExhaustedWarn, ExhaustedFail}. At most max_regeneration_attempts + 1
 * attempts are made; with regeneration disabled exactly one.
 */
class RegenerationController {
public:
  /**
   * @param orchestrator Produces candidates. Not owned.
   * @param validator Scores candidates. Not owned.
   * @param settings Loop policy.
   * @param abort_flag Run-level cancellation, checked after every external
   * call. May be null.
   */
  RegenerationController(orchestrator::GenerationOrchestrator &orchestrator,
                         validator::Validator &validator,
                         RegenerationSettings settings,
                         const std::atomic<bool> *abort_flag = nullptr);

  /**
   * @brief Drives one target to a terminal state.
   */
  TargetOutcome Run(const orchestrator::GenerationContext &context,
                    const validator::ValidationTarget &target);

  models::TargetState GetState() const { return state_; }

  /**
   * @brief Ordering used to pick the best attempt: higher tier, then fewer
   * blocking issues, then the earlier attempt.
   * @return True if a ranks before b. Both must have been evaluated.
   */
  static bool IsBetter(const models::GenerationAttempt &a,
                       const models::GenerationAttempt &b);

  static bool IsAllowed(models::TargetState from, models::TargetState to);

private:
  void Transition(models::TargetState next);
  bool Aborted() const;
  void Backoff(int failures) const;
  TargetOutcome Finish(TargetOutcome outcome, models::TargetState state);

  orchestrator::GenerationOrchestrator &orchestrator_;
  validator::Validator &validator_;
  RegenerationSettings settings_;
  const std::atomic<bool> *abort_flag_;
  models::TargetState state_;
};

} // namespace regen
