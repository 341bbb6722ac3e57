#pragma once

#include "function_signature.hpp"
#include "generation_attempt.hpp"
#include "quality_tier.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace models {

/**
 * @brief States of the per-target regeneration loop.
 */
enum class TargetState {
  kPending,
  kAttempting,
  kEvaluating,
  kAccepted,
  kExhaustedWarn,
  kExhaustedFail
};

std::string ToString(TargetState state);
bool IsTerminal(TargetState state);

/**
 * @brief Final verdict for one target function.
 */
struct ReportEntry {
  FunctionId id;
  std::string output_name;
  TargetState state = TargetState::kPending;
  std::optional<QualityTier> tier;
  int attempts = 0;
  bool accepted = false;
  int regenerations = 0;
  bool improved_by_regeneration = false;

  std::optional<GenerationAttempt> best; // accepted or best-seen attempt
  std::string stub_code;
  std::vector<std::string> history; // one line per attempt
  std::string failure;              // reason when nothing was evaluated
};

/**
 * @brief Run-wide accumulator. Workers add terminal results concurrently.
 */
class PipelineReport {
public:
  void Add(ReportEntry entry);

  /**
   * @brief Returns the entries sorted by file and function name.
   */
  std::vector<ReportEntry> Entries() const;

  size_t Size() const;
  int AcceptedCount() const;
  int RejectedCount() const;
  int RegenerationCount() const;
  int SuccessfulRegenerationCount() const;

  /**
   * @brief True when any target was accepted only after exhausting its budget.
   */
  bool IsDegraded() const;

  bool HasFailures() const;

private:
  mutable std::mutex mutex_;
  std::vector<ReportEntry> entries_;
};

} // namespace models
