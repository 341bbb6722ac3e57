#include "launch_settings.hpp"

#include "../errors/errors.hpp"

#include <algorithm>
#include <filesystem>
#include <fmt/core.h>
#include <set>

namespace fs = std::filesystem;

void LaunchSettings::Validate() const {
  if (provider_cmd.empty()) {
    throw errors::ConfigurationError(
        "no generation command: use --provider-cmd or set "
        "CTESTGEN_PROVIDER_CMD");
  }
  if (max_regeneration_attempts < 0) {
    throw errors::ConfigurationError(
        "--max-regeneration-attempts must be at least 0");
  }
  if (min_assertions < 1) {
    throw errors::ConfigurationError("--min-assertions must be at least 1");
  }
  if (!(comprehensive_ratio > 0.0)) {
    throw errors::ConfigurationError("--comprehensive-ratio must be positive");
  }
  if (jobs < 1) {
    throw errors::ConfigurationError("--jobs must be at least 1");
  }
  if (provider_timeout < 0 || compile_timeout < 0) {
    throw errors::ConfigurationError("timeouts cannot be negative");
  }
  if (rate_limit_backoff_ms < 0) {
    throw errors::ConfigurationError("--rate-limit-backoff cannot be negative");
  }
  std::error_code ec;
  if (!fs::is_directory(repo_path, ec)) {
    throw errors::ConfigurationError(
        fmt::format("repository path {} is not a directory", repo_path));
  }
  if (fs::exists(output_dir, ec) && !fs::is_directory(output_dir, ec)) {
    throw errors::ConfigurationError(
        fmt::format("output path {} is not a directory", output_dir));
  }
  if (files.empty() &&
      !fs::is_directory(fs::path(repo_path) / source_dir, ec)) {
    throw errors::ConfigurationError(fmt::format(
        "source directory {} does not exist",
        (fs::path(repo_path) / source_dir).string()));
  }
}

std::vector<std::string> LaunchSettings::ResolveSourceFiles() const {
  if (!files.empty()) {
    return files;
  }
  std::vector<std::string> result;
  std::error_code ec;
  auto root = fs::path(repo_path) / source_dir;
  for (fs::recursive_directory_iterator it(root, ec), end; !ec && it != end;
       it.increment(ec)) {
    if (!it->is_regular_file()) {
      continue;
    }
    auto extension = it->path().extension().string();
    if (extension == ".c" || extension == ".h") {
      result.push_back(it->path().lexically_normal().string());
    }
  }
  std::sort(result.begin(), result.end());
  return result;
}

std::string LaunchSettings::UnityDir() const {
  if (!unity_dir.empty()) {
    return unity_dir;
  }
  return (fs::path(repo_path) / "unity" / "src").string();
}

pipeline::PipelineSettings LaunchSettings::ToPipelineSettings() const {
  pipeline::PipelineSettings settings;
  settings.functions = functions;
  settings.jobs = static_cast<unsigned>(jobs);
  settings.redact_sensitive = redact_sensitive;
  settings.stub_settings.pointer_sentinel = pointer_sentinel;
  settings.stub_settings.return_overrides = stub_returns;
  settings.validator_settings.min_assertions = min_assertions;
  settings.validator_settings.comprehensive_ratio = comprehensive_ratio;
  settings.regen_settings.quality_threshold = quality_threshold;
  settings.regen_settings.regenerate_on_low_quality = regenerate_on_low_quality;
  settings.regen_settings.max_regeneration_attempts = max_regeneration_attempts;
  settings.regen_settings.backoff_unit =
      std::chrono::milliseconds(rate_limit_backoff_ms);
  return settings;
}

validator::GccSettings
LaunchSettings::ToGccSettings(const std::vector<std::string> &files) const {
  validator::GccSettings settings;
  settings.compiler = compiler;
  settings.unity_dir = UnityDir();
  settings.timeout_seconds = static_cast<unsigned>(compile_timeout);
  std::set<std::string> seen;
  for (const auto &dir : include_dirs) {
    if (seen.insert(dir).second) {
      settings.include_dirs.push_back(dir);
    }
  }
  for (const auto &file : files) {
    auto dir = fs::path(file).parent_path().string();
    if (dir.empty()) {
      dir = ".";
    }
    if (seen.insert(dir).second) {
      settings.include_dirs.push_back(dir);
    }
  }
  return settings;
}
