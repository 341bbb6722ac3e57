#include "validator.hpp"

#include "../fatal/fatal.hpp"
#include "../helpers/helpers.hpp"
#include "../stubs/stub_synthesizer.hpp"
#include "../utils/verbose/verbose.hpp"
#include "diagnostics.hpp"

#include <fmt/core.h>
#include <utility>

namespace validator {
namespace {
constexpr const char *kRenamedMain = "ctestgen_unit_main";
} // namespace

Validator::Validator(Toolchain &toolchain, ValidatorSettings settings)
    : toolchain_(toolchain), settings_(settings),
      classifier_(settings.comprehensive_ratio) {}

std::string Validator::AssembleUnit(const ValidationTarget &target,
                                    const std::string &candidate) {
  std::string unit;
  if (!target.forward_declarations.empty()) {
    for (const auto &declaration : target.forward_declarations) {
      unit += declaration + ";\n";
    }
    unit += '\n';
  }

  bool rename_main = target.unit != nullptr && target.unit->DefinesMain();
  if (rename_main) {
    unit += fmt::format("#define main {}\n", kRenamedMain);
  }
  if (target.unit != nullptr) {
    unit += fmt::format("/* ==== unit under test: {} ==== */\n",
                        target.unit->path);
    unit += target.unit->text;
    if (!helpers::EndsWith(target.unit->text, "\n")) {
      unit += '\n';
    }
  }
  if (rename_main) {
    unit += "#undef main\n";
  }

  auto stub_code = stubs::RenderStubs(target.stubs);
  if (!stub_code.empty()) {
    unit += "\n/* ==== stubs ==== */\n";
    unit += stub_code;
  }
  unit += "\n/* ==== candidate ==== */\n";
  unit += candidate;
  if (!helpers::EndsWith(candidate, "\n")) {
    unit += '\n';
  }
  return unit;
}

models::ValidationResult Validator::Validate(const ValidationTarget &target,
                                             const std::string &candidate) {
  models::ValidationResult result;

  auto compiled = toolchain_.Compile(AssembleUnit(target, candidate));
  result.compiles = compiled.success;
  result.diagnostics = ParseDiagnostics(compiled.output);
  if (!compiled.success && result.Errors().empty()) {
    auto text = helpers::Trim(compiled.output);
    result.diagnostics.push_back(
        {models::Diagnostic::Level::kError,
         text.empty() ? "error: compiler failed without diagnostics" : text});
  }
  if (utils::verbose::Flags::getInstance().NeedToPrintDiagnostics() &&
      !compiled.output.empty()) {
    loger::notice(fmt::format("{} diagnostics:\n{}", target.target.name,
                              compiled.output));
  }

  for (const auto &error : result.Errors()) {
    result.issues.push_back(
        {models::IssueKind::kCompilation, models::Severity::kBlocking, error});
  }

  bool has_external_state =
      !target.stubs.empty() || !target.target.globals_used.empty();
  TargetEnvironment environment;
  for (const auto &stub : target.stubs) {
    environment.stub_names.push_back(stub.signature.name);
  }
  if (target.unit != nullptr) {
    environment.unit_text = target.unit->text;
  }
  auto report = RunHeuristics(target.target, candidate, has_external_state,
                              HeuristicSettings{settings_.min_assertions},
                              environment);
  result.assertion_count = report.assertion_count;
  result.required_assertions = report.required_assertions;
  result.test_function_count = report.test_function_count;
  for (auto &issue : report.issues) {
    result.issues.push_back(std::move(issue));
  }

  result.tier = classifier_.Classify(result);
  return result;
}

} // namespace validator
