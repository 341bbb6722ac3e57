#pragma once

#include "../models/quality_tier.hpp"
#include "../pipeline/pipeline.hpp"
#include "../validator/gcc_toolchain.hpp"

#include <map>
#include <string>
#include <vector>

struct LaunchSettings {
  std::string repo_path = ".";
  std::string source_dir = "src";
  std::vector<std::string> files; // explicit file set, overrides scanning
  std::string output_dir = "tests";
  std::vector<std::string> functions;

  models::QualityTier quality_threshold = models::QualityTier::kHigh;
  bool regenerate_on_low_quality = false;
  int max_regeneration_attempts = 2;

  std::string provider_cmd;
  int provider_timeout = 120;
  std::string compiler = "gcc";
  int compile_timeout = 60;
  std::string unity_dir; // empty: <repo_path>/unity/src
  std::vector<std::string> include_dirs;

  std::map<std::string, std::string> stub_returns;
  std::string pointer_sentinel = "NULL";

  int min_assertions = 1;
  double comprehensive_ratio = 1.0;
  int jobs = 1;
  bool redact_sensitive = false;
  int rate_limit_backoff_ms = 1000;

  bool need_to_print_help_and_stop = false;
  bool need_to_print_version_and_stop = false;
  std::string unknown_option;

  /**
   * @brief Checks every value.
   * @throws errors::ConfigurationError on the first invalid value.
   */
  void Validate() const;

  /**
   * @brief The files to analyze: the explicit set, or every .c and .h file
   * under the source directory, sorted.
   */
  std::vector<std::string> ResolveSourceFiles() const;

  std::string UnityDir() const;

  pipeline::PipelineSettings ToPipelineSettings() const;

  /**
   * @brief Compiler settings; the directories of the analyzed files are
   * added to the include path.
   */
  validator::GccSettings
  ToGccSettings(const std::vector<std::string> &files) const;
};
