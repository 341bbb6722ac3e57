#pragma once

#include "../models/quality_tier.hpp"
#include "../models/validation_result.hpp"

namespace quality {

/**
 * @brief Maps a ValidationResult to a QualityTier.
 *
 * Rules, first match wins:
 *  1. compile failure -> low
 *  2. any blocking issue -> low
 *  3. no issues and assertions / required >= comprehensive ratio -> high
 *  4. otherwise -> medium
 */
class QualityClassifier {
public:
  explicit QualityClassifier(double comprehensive_ratio = 1.0);

  models::QualityTier Classify(const models::ValidationResult &result) const;

  double GetComprehensiveRatio() const { return comprehensive_ratio_; }

private:
  double comprehensive_ratio_;
};

} // namespace quality
