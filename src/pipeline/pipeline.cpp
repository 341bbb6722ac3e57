#include "pipeline.hpp"

#include "../fatal/fatal.hpp"
#include "../helpers/helpers.hpp"
#include "../orchestrator/generation_orchestrator.hpp"
#include "../validator/heuristics.hpp"

#include <algorithm>
#include <filesystem>
#include <fmt/core.h>
#include <map>
#include <thread>
#include <utility>

namespace pipeline {
namespace {
std::string Stem(const std::string &path) {
  return std::filesystem::path(path).stem().string();
}

std::string DescribeAttempt(const models::GenerationAttempt &attempt) {
  if (attempt.provider_error.has_value()) {
    return fmt::format("attempt {}: provider error: {}", attempt.number,
                       *attempt.provider_error);
  }
  if (!attempt.validation.has_value()) {
    return fmt::format("attempt {}: {}", attempt.number,
                       models::ToString(attempt.outcome));
  }
  const auto &validation = *attempt.validation;
  return fmt::format("attempt {}: {}, tier {}, {} issues ({} blocking)",
                     attempt.number, models::ToString(attempt.outcome),
                     models::ToString(validation.tier),
                     validation.issues.size(),
                     validation.BlockingIssueCount());
}
} // namespace

Pipeline::Pipeline(const analyzer::Codebase &codebase,
                   orchestrator::GenerationProvider &provider,
                   validator::Toolchain &toolchain, PipelineSettings settings,
                   const std::atomic<bool> *abort_flag)
    : codebase_(codebase), provider_(provider), toolchain_(toolchain),
      settings_(std::move(settings)), abort_flag_(abort_flag) {}

std::vector<PlannedTarget> Pipeline::SelectTargets() const {
  std::vector<PlannedTarget> targets;
  std::map<std::string, int> name_counts;

  for (const auto &unit : codebase_.GetUnits()) {
    if (unit.is_header || unit.structural_error) {
      continue;
    }
    for (const auto &function : unit.functions) {
      if (!function.is_definition || function.name == "main") {
        continue;
      }
      if (!settings_.functions.empty() &&
          std::find(settings_.functions.begin(), settings_.functions.end(),
                    function.name) == settings_.functions.end()) {
        continue;
      }
      targets.push_back(PlannedTarget{function, ""});
      name_counts[function.name]++;
    }
  }

  for (const auto &requested : settings_.functions) {
    if (name_counts.count(requested) == 0) {
      loger::warning(fmt::format("function {} not found", requested));
    }
  }

  for (auto &target : targets) {
    const auto &signature = target.signature;
    target.output_name =
        name_counts[signature.name] > 1
            ? fmt::format("test_{}_{}.c", Stem(signature.unit_path),
                          signature.name)
            : fmt::format("test_{}.c", signature.name);
  }
  return targets;
}

models::ReportEntry Pipeline::ProcessTarget(const PlannedTarget &planned) const {
  const auto &target = planned.signature;
  models::ReportEntry entry;
  entry.id = target.GetId();
  entry.output_name = planned.output_name;

  auto dependencies = codebase_.CollectExternalDependencies(entry.id);
  std::vector<std::string> unsupported = dependencies.not_stubbed;
  stubs::StubSynthesizer synthesizer(settings_.stub_settings);
  auto stubs = synthesizer.SynthesizeAll(dependencies.to_stub, unsupported);
  dependencies.not_stubbed = unsupported;

  validator::ValidationTarget validation_target;
  validation_target.unit = codebase_.FindUnit(target.unit_path);
  validation_target.target = target;
  validation_target.stubs = stubs;
  for (const auto &stub : stubs) {
    if (!codebase_.IsDeclaredFor(target.unit_path, stub.signature.name)) {
      validation_target.forward_declarations.push_back(
          stub.signature.Prototype());
    }
  }
  entry.stub_code = stubs::RenderStubs(stubs);

  orchestrator::GenerationOrchestrator orchestrator(provider_,
                                                    settings_.redact_sensitive);
  validator::Validator checker(toolchain_, settings_.validator_settings);
  int required = validator::RequiredAssertions(
      target, settings_.validator_settings.min_assertions);
  auto context = orchestrator.PrepareContext(codebase_, target, dependencies,
                                             stubs, required);

  loger::info(fmt::format("{}: {} stubs, {} assertions required", target.name,
                          stubs.size(), required));
  regen::RegenerationController controller(
      orchestrator, checker, settings_.regen_settings, abort_flag_);
  auto outcome = controller.Run(context, validation_target);

  entry.state = outcome.state;
  entry.attempts = static_cast<int>(outcome.attempts.size());
  entry.accepted = outcome.IsAccepted();
  entry.regenerations = outcome.Regenerations();
  entry.improved_by_regeneration = outcome.ImprovedByRegeneration();
  for (const auto &attempt : outcome.attempts) {
    entry.history.push_back(DescribeAttempt(attempt));
  }
  if (auto best = outcome.Best(); best != nullptr) {
    entry.best = *best;
    entry.tier = best->validation->tier;
  }
  if (outcome.cancelled) {
    entry.failure = "cancelled";
  } else if (!entry.best.has_value()) {
    entry.failure = outcome.attempts.empty() ||
                            !outcome.attempts.back().provider_error.has_value()
                        ? "no candidate was evaluated"
                        : *outcome.attempts.back().provider_error;
  }
  return entry;
}

void Pipeline::Run(const std::vector<PlannedTarget> &targets,
                   models::PipelineReport &report) const {
  std::atomic<std::size_t> next_target{0};
  auto worker = [&]() {
    while (true) {
      std::size_t index = next_target.fetch_add(1);
      if (index >= targets.size()) {
        return;
      }
      const auto &target = targets[index];
      models::ReportEntry entry;
      if (abort_flag_ != nullptr && abort_flag_->load()) {
        entry.id = target.signature.GetId();
        entry.output_name = target.output_name;
        entry.state = models::TargetState::kExhaustedFail;
        entry.failure = "cancelled";
        report.Add(std::move(entry));
        continue;
      }
      try {
        entry = ProcessTarget(target);
      } catch (const std::exception &e) {
        loger::non_fatal(fmt::format("{}: {}", target.signature.name, e.what()));
        entry = models::ReportEntry{};
        entry.id = target.signature.GetId();
        entry.output_name = target.output_name;
        entry.state = models::TargetState::kExhaustedFail;
        entry.failure = e.what();
      }
      loger::notice(fmt::format(
          "{}: {}{}", target.signature.name, models::ToString(entry.state),
          entry.tier.has_value()
              ? fmt::format(" ({})", models::ToString(*entry.tier))
              : std::string()));
      report.Add(std::move(entry));
    }
  };

  unsigned jobs = std::max(1u, settings_.jobs);
  jobs = std::min<unsigned>(jobs, static_cast<unsigned>(std::max<std::size_t>(
                                      targets.size(), 1)));
  if (jobs == 1) {
    worker();
    return;
  }
  std::vector<std::thread> workers;
  workers.reserve(jobs);
  for (unsigned i = 0; i < jobs; ++i) {
    workers.emplace_back(worker);
  }
  for (auto &thread : workers) {
    thread.join();
  }
}

} // namespace pipeline
