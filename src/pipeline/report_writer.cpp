#include "report_writer.hpp"

#include "../fatal/fatal.hpp"

#include <filesystem>
#include <fmt/core.h>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace pipeline {
namespace fs = std::filesystem;

namespace {
constexpr const char *kCompilationReportDir = "compilation_report";
constexpr const char *kStubsDir = "stubs";

std::string BaseName(const std::string &output_name) {
  return fs::path(output_name).stem().string();
}

bool Compiles(const models::ReportEntry &entry) {
  return entry.best.has_value() && entry.best->validation.has_value() &&
         entry.best->validation->compiles;
}
} // namespace

ReportWriter::ReportWriter(std::string output_dir)
    : output_dir_(std::move(output_dir)) {}

std::string ReportWriter::ValidationReportName(const models::ReportEntry &entry) {
  return fmt::format("{}_compiles_{}.txt", BaseName(entry.output_name),
                     Compiles(entry) ? "yes" : "no");
}

std::string
ReportWriter::RenderValidationReport(const models::ReportEntry &entry) {
  std::string text;
  text += fmt::format("Function: {} ({})\n", entry.id.name, entry.id.unit_path);
  text += fmt::format("State: {}\n", models::ToString(entry.state));
  text += fmt::format("Tier: {}\n", entry.tier.has_value()
                                        ? models::ToString(*entry.tier)
                                        : std::string("none"));
  text += fmt::format("Attempts: {}\n", entry.attempts);
  text += fmt::format("Compiles: {}\n", Compiles(entry) ? "yes" : "no");
  if (!entry.failure.empty()) {
    text += fmt::format("Failure: {}\n", entry.failure);
  }

  if (entry.best.has_value() && entry.best->validation.has_value()) {
    const auto &validation = *entry.best->validation;
    text += fmt::format("Assertions: {} of {} required\n",
                        validation.assertion_count,
                        validation.required_assertions);
    text += fmt::format("Test functions: {}\n", validation.test_function_count);
    text += fmt::format("Reported attempt: {}\n", entry.best->number);

    text += "\nIssues:\n";
    if (validation.issues.empty()) {
      text += "- none\n";
    }
    for (const auto &issue : validation.issues) {
      text += fmt::format("- {}\n", issue.Render());
    }
    auto warnings = validation.Warnings();
    if (!warnings.empty()) {
      text += "\nCompiler warnings:\n";
      for (const auto &warning : warnings) {
        text += fmt::format("  {}\n", warning);
      }
    }
  }

  text += "\nHistory:\n";
  for (const auto &line : entry.history) {
    text += fmt::format("- {}\n", line);
  }
  return text;
}

std::string ReportWriter::RenderSummary(const models::PipelineReport &report) {
  auto entries = report.Entries();
  std::string text = "ctestgen pipeline report\n\n";
  text += fmt::format("targets: {}\n", entries.size());
  text += fmt::format("accepted: {}\n", report.AcceptedCount());
  text += fmt::format("rejected: {}\n", report.RejectedCount());
  text += fmt::format("regenerations: {} ({} improved the result)\n",
                      report.RegenerationCount(),
                      report.SuccessfulRegenerationCount());
  text += fmt::format("degraded: {}\n\n", report.IsDegraded() ? "yes" : "no");

  for (const auto &entry : entries) {
    text += fmt::format(
        "{}:{} -> {}: {}, tier {}, {} attempt(s), {}\n", entry.id.unit_path,
        entry.id.name, entry.output_name, models::ToString(entry.state),
        entry.tier.has_value() ? models::ToString(*entry.tier)
                               : std::string("none"),
        entry.attempts, entry.accepted ? "accepted" : "rejected");
  }
  return text;
}

void ReportWriter::WriteFile(const std::string &relative,
                             const std::string &content) const {
  auto path = fs::path(output_dir_) / relative;
  std::error_code ec;
  fs::create_directories(path.parent_path(), ec);
  if (ec) {
    throw std::runtime_error(fmt::format("cannot create {}: {}",
                                         path.parent_path().string(),
                                         ec.message()));
  }
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    throw std::runtime_error(fmt::format("cannot write {}", path.string()));
  }
  out << content;
  out.close();
  if (out.fail()) {
    throw std::runtime_error(fmt::format("cannot write {}", path.string()));
  }
}

void ReportWriter::Write(const models::PipelineReport &report) const {
  std::error_code ec;
  fs::remove_all(fs::path(output_dir_) / kCompilationReportDir, ec);
  if (ec) {
    throw std::runtime_error(fmt::format("cannot clean {}: {}",
                                         kCompilationReportDir, ec.message()));
  }

  for (const auto &entry : report.Entries()) {
    if (entry.accepted && entry.best.has_value()) {
      WriteFile(entry.output_name, entry.best->candidate);
      if (!entry.stub_code.empty()) {
        WriteFile(fmt::format("{}/{}_stubs.c", kStubsDir,
                              BaseName(entry.output_name)),
                  entry.stub_code);
      }
      loger::info(fmt::format("wrote {}", entry.output_name));
    }
    WriteFile(fmt::format("{}/{}", kCompilationReportDir,
                          ValidationReportName(entry)),
              RenderValidationReport(entry));
  }
  WriteFile("pipeline_report.txt", RenderSummary(report));
}

} // namespace pipeline
