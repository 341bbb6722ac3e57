#include "quality_tier.hpp"

#include "../helpers/helpers.hpp"

namespace models {

std::string ToString(QualityTier tier) {
  switch (tier) {
  case QualityTier::kLow:
    return "low";
  case QualityTier::kMedium:
    return "medium";
  case QualityTier::kHigh:
    return "high";
  }
  return "low";
}

std::optional<QualityTier> ParseQualityTier(const std::string &value) {
  auto lowered = helpers::ToLower(value);
  if (lowered == "low") {
    return QualityTier::kLow;
  }
  if (lowered == "medium") {
    return QualityTier::kMedium;
  }
  if (lowered == "high") {
    return QualityTier::kHigh;
  }
  return std::nullopt;
}

} // namespace models
