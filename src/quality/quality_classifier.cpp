#include "quality_classifier.hpp"

namespace quality {

QualityClassifier::QualityClassifier(double comprehensive_ratio)
    : comprehensive_ratio_(comprehensive_ratio) {}

models::QualityTier
QualityClassifier::Classify(const models::ValidationResult &result) const {
  if (!result.compiles) {
    return models::QualityTier::kLow;
  }
  if (result.BlockingIssueCount() > 0) {
    return models::QualityTier::kLow;
  }
  int required = result.required_assertions > 0 ? result.required_assertions : 1;
  double density = static_cast<double>(result.assertion_count) / required;
  if (result.issues.empty() && density >= comprehensive_ratio_) {
    return models::QualityTier::kHigh;
  }
  return models::QualityTier::kMedium;
}

} // namespace quality
