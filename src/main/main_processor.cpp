#include "main_processor.hpp"

#include "../analyzer/codebase.hpp"
#include "../analyzer/source_analyzer.hpp"
#include "../errors/errors.hpp"
#include "../fatal/fatal.hpp"
#include "../orchestrator/command_provider.hpp"
#include "../pipeline/pipeline.hpp"
#include "../pipeline/report_writer.hpp"
#include "../validator/gcc_toolchain.hpp"
#include "arguments_parser.hpp"
#include "help.hpp"

#include <csignal>
#include <fmt/core.h>
#include <stdexcept>
#include <utility>

namespace {
void OnInterrupt(int) { MainProcessor::AbortFlag().store(true); }
} // namespace

std::atomic<bool> &MainProcessor::AbortFlag() {
  static std::atomic<bool> flag{false};
  return flag;
}

void MainProcessor::InstallSignalHandler() {
  std::signal(SIGINT, OnInterrupt);
}

int MainProcessor::main(int argc, char *argv[]) {
  LaunchSettings settings;
  try {
    ArgumentsParser parser;
    settings = parser.Parse(argc, argv);
  } catch (const errors::ConfigurationError &e) {
    loger::non_fatal(e.what());
    return 1;
  }

  if (settings.need_to_print_help_and_stop) {
    if (!settings.unknown_option.empty()) {
      loger::non_fatal(
          fmt::format("unknown option '{}'", settings.unknown_option));
    }
    PrintHelp();
    return settings.unknown_option.empty() ? 0 : 1;
  }
  if (settings.need_to_print_version_and_stop) {
    PrintVersion();
    return 0;
  }

  try {
    settings.Validate();
  } catch (const errors::ConfigurationError &e) {
    loger::non_fatal(e.what());
    return 1;
  }

  InstallSignalHandler();
  return Process(settings);
}

int MainProcessor::Process(const LaunchSettings &settings) {
  auto files = settings.ResolveSourceFiles();
  if (files.empty()) {
    loger::non_fatal("no C source files found");
    return 1;
  }

  analyzer::SourceAnalyzer source_analyzer;
  std::vector<models::SourceUnit> units;
  units.reserve(files.size());
  for (const auto &file : files) {
    units.push_back(source_analyzer.Analyze(file));
  }
  auto codebase = analyzer::Codebase::Build(std::move(units));

  orchestrator::CommandProvider provider(
      settings.provider_cmd, static_cast<unsigned>(settings.provider_timeout));
  validator::GccToolchain toolchain(settings.ToGccSettings(files));
  pipeline::Pipeline runner(codebase, provider, toolchain,
                              settings.ToPipelineSettings(), &AbortFlag());

  auto targets = runner.SelectTargets();
  if (targets.empty()) {
    loger::non_fatal("no functions to generate tests for");
    return 1;
  }
  loger::notice(fmt::format("generating tests for {} function(s) with {} job(s)",
                            targets.size(), settings.jobs));

  models::PipelineReport report;
  runner.Run(targets, report);

  try {
    pipeline::ReportWriter writer(settings.output_dir);
    writer.Write(report);
  } catch (const std::runtime_error &e) {
    loger::non_fatal("cannot write reports", std::string(e.what()));
    return 1;
  }

  loger::notice(fmt::format(
      "{} accepted, {} rejected, {} regeneration(s), {} successful",
      report.AcceptedCount(), report.RejectedCount(),
      report.RegenerationCount(), report.SuccessfulRegenerationCount()));
  if (AbortFlag().load()) {
    loger::warning("interrupted; unfinished targets were rejected");
  }
  if (report.IsDegraded()) {
    loger::warning("some tests are below the quality threshold",
                   std::string("see compilation_report/"));
  }
  return report.HasFailures() ? 1 : 0;
}
