#pragma once

#include "../models/pipeline_report.hpp"

#include <string>

namespace pipeline {

/**
 * @brief Writes the artifacts of a finished run.
 *
 * Layout under the output directory:
 *  - test_<function>.c for every accepted target
 *  - stubs/test_<function>_stubs.c when the target needed stubs
 *  - compilation_report/test_<function>_compiles_{yes,no}.txt per target
 *  - pipeline_report.txt
 */
class ReportWriter {
public:
  explicit ReportWriter(std::string output_dir);

  /**
   * @brief Writes every artifact. The old compilation_report directory is
   * removed first.
   * @throws std::runtime_error if a file cannot be written.
   */
  void Write(const models::PipelineReport &report) const;

  static std::string RenderSummary(const models::PipelineReport &report);
  static std::string RenderValidationReport(const models::ReportEntry &entry);

  /**
   * @brief File name of an entry's validation report.
   */
  static std::string ValidationReportName(const models::ReportEntry &entry);

private:
  void WriteFile(const std::string &relative, const std::string &content) const;

  std::string output_dir_;
};

} // namespace pipeline
