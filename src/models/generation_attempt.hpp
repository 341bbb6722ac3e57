#pragma once

#include "validation_result.hpp"

#include <optional>
#include <string>

namespace models {

enum class AttemptOutcome { kPending, kCompiled, kFailed };

std::string ToString(AttemptOutcome outcome);

/**
 * @brief One generation try for a target, numbered from 1.
 */
struct GenerationAttempt {
  int number = 1;
  std::string prompt;
  std::string candidate;
  AttemptOutcome outcome = AttemptOutcome::kPending;
  std::optional<ValidationResult> validation;
  std::optional<std::string> provider_error;

  bool WasEvaluated() const { return validation.has_value(); }
};

} // namespace models
