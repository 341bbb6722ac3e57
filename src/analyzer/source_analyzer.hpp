#pragma once

#include "../models/source_unit.hpp"

#include <string>

namespace analyzer {

/**
 * @brief Lightweight structural analysis of C source.
 *
 * Recognises top-level function prototypes and definitions, global variables,
 * includes and function-like macros. Bodies are scanned for call sites,
 * decision points and global references. This is not a C parser: anything
 * the analyzer cannot take apart is kept as an opaque signature.
 */
class SourceAnalyzer {
public:
  /**
   * @brief Analyzes source text.
   * @param path The path recorded in the unit.
   * @param text The source text.
   * @return The analyzed unit.
   * @throws errors::StructuralAnalysisError on unterminated comments or
   * literals and on unbalanced braces or parentheses.
   */
  models::SourceUnit Parse(const std::string &path,
                           const std::string &text) const;

  /**
   * @brief Analyzes source text, turning structural errors into an error
   * unit with no signatures.
   */
  models::SourceUnit AnalyzeText(const std::string &path,
                                 const std::string &text) const;

  /**
   * @brief Reads and analyzes a file. An unreadable file yields an error unit.
   */
  models::SourceUnit Analyze(const std::string &path) const;
};

} // namespace analyzer
