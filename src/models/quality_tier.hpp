#pragma once

#include <optional>
#include <string>

namespace models {

/**
 * @brief Discrete classification of a generated test. Totally ordered:
 * kHigh > kMedium > kLow.
 */
enum class QualityTier { kLow = 0, kMedium = 1, kHigh = 2 };

/**
 * @brief Returns "low", "medium" or "high".
 */
std::string ToString(QualityTier tier);

/**
 * @brief Parses a tier name, ignoring case.
 * @param value The text to parse.
 * @return The tier, or std::nullopt for an unknown name.
 */
std::optional<QualityTier> ParseQualityTier(const std::string &value);

} // namespace models
