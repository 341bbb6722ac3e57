#include "generation_attempt.hpp"

namespace models {

std::string ToString(AttemptOutcome outcome) {
  switch (outcome) {
  case AttemptOutcome::kPending:
    return "pending";
  case AttemptOutcome::kCompiled:
    return "compiled";
  case AttemptOutcome::kFailed:
    return "failed";
  }
  return "pending";
}

} // namespace models
