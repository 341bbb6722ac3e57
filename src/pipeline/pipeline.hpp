#pragma once

#include "../analyzer/codebase.hpp"
#include "../models/pipeline_report.hpp"
#include "../orchestrator/generation_provider.hpp"
#include "../regen/regeneration_controller.hpp"
#include "../stubs/stub_synthesizer.hpp"
#include "../validator/toolchain.hpp"
#include "../validator/validator.hpp"

#include <atomic>
#include <string>
#include <vector>

namespace pipeline {

struct PipelineSettings {
  std::vector<std::string> functions; ///< empty selects every function
  unsigned jobs = 1;
  bool redact_sensitive = false;
  stubs::StubSettings stub_settings;
  validator::ValidatorSettings validator_settings;
  regen::RegenerationSettings regen_settings;
};

struct PlannedTarget {
  models::FunctionSignature signature;
  std::string output_name; ///< e.g. "test_clamp.c"
};

/**
 * @brief Runs the regeneration loop for every selected target on a bounded
 * worker pool and collects the verdicts.
 *
 * The codebase, provider and toolchain are shared read-only between
 * workers; everything else is created per target.
 */
class Pipeline {
public:
  Pipeline(const analyzer::Codebase &codebase,
           orchestrator::GenerationProvider &provider,
           validator::Toolchain &toolchain, PipelineSettings settings,
           const std::atomic<bool> *abort_flag = nullptr);

  /**
   * @brief Function definitions of analyzed .c files, except main,
   * optionally narrowed by name. Output names get the file stem when two
   * targets share a function name.
   */
  std::vector<PlannedTarget> SelectTargets() const;

  /**
   * @brief Drives one target to its terminal state.
   */
  models::ReportEntry ProcessTarget(const PlannedTarget &target) const;

  /**
   * @brief Processes every target, adding one entry per target to the
   * report.
   */
  void Run(const std::vector<PlannedTarget> &targets,
           models::PipelineReport &report) const;

private:
  const analyzer::Codebase &codebase_;
  orchestrator::GenerationProvider &provider_;
  validator::Toolchain &toolchain_;
  PipelineSettings settings_;
  const std::atomic<bool> *abort_flag_;
};

} // namespace pipeline
