#pragma once

#include "../models/source_unit.hpp"
#include "../models/stub_spec.hpp"
#include "../models/validation_result.hpp"
#include "../quality/quality_classifier.hpp"
#include "heuristics.hpp"
#include "toolchain.hpp"

#include <string>
#include <vector>

namespace validator {

/**
 * @brief What the validator needs to know about one target besides the
 * candidate itself. Fixed for all attempts of the target.
 */
struct ValidationTarget {
  const models::SourceUnit *unit = nullptr;
  models::FunctionSignature target;
  std::vector<models::StubSpec> stubs;
  std::vector<std::string> forward_declarations; ///< prototypes, no ';'
};

struct ValidatorSettings {
  int min_assertions = 1;
  double comprehensive_ratio = 1.0;
};

/**
 * @brief Compiles a candidate together with the unit under test and its
 * stubs, runs the heuristic checks and classifies the result.
 */
class Validator {
public:
  /**
   * @param toolchain The compiler to use. Not owned.
   * @param settings Thresholds.
   */
  Validator(Toolchain &toolchain, ValidatorSettings settings);

  /**
   * @brief Builds the translation unit that is compiled.
   *
   * Layout: forward declarations, the unit under test (its main renamed),
   * stubs, candidate.
   */
  static std::string AssembleUnit(const ValidationTarget &target,
                                  const std::string &candidate);

  /**
   * @brief Validates one candidate.
   * @throws errors::ProviderError when the toolchain times out.
   */
  models::ValidationResult Validate(const ValidationTarget &target,
                                    const std::string &candidate);

private:
  Toolchain &toolchain_;
  ValidatorSettings settings_;
  quality::QualityClassifier classifier_;
};

} // namespace validator
