#pragma once

#include "../models/validation_result.hpp"

#include <string>
#include <vector>

namespace validator {

/**
 * @brief Picks error and warning lines out of compiler output.
 *
 * Lines are kept verbatim. "error:" and linker "undefined reference" lines
 * are errors, "warning:" lines are warnings; everything else is dropped.
 */
std::vector<models::Diagnostic> ParseDiagnostics(const std::string &output);

} // namespace validator
