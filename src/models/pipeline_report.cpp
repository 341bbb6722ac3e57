#include "pipeline_report.hpp"

#include <algorithm>
#include <utility>

namespace models {

std::string ToString(TargetState state) {
  switch (state) {
  case TargetState::kPending:
    return "pending";
  case TargetState::kAttempting:
    return "attempting";
  case TargetState::kEvaluating:
    return "evaluating";
  case TargetState::kAccepted:
    return "accepted";
  case TargetState::kExhaustedWarn:
    return "exhausted_warn";
  case TargetState::kExhaustedFail:
    return "exhausted_fail";
  }
  return "pending";
}

bool IsTerminal(TargetState state) {
  return state == TargetState::kAccepted ||
         state == TargetState::kExhaustedWarn ||
         state == TargetState::kExhaustedFail;
}

void PipelineReport::Add(ReportEntry entry) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.push_back(std::move(entry));
}

std::vector<ReportEntry> PipelineReport::Entries() const {
  std::vector<ReportEntry> copy;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    copy = entries_;
  }
  std::sort(copy.begin(), copy.end(),
            [](const ReportEntry &a, const ReportEntry &b) { return a.id < b.id; });
  return copy;
}

size_t PipelineReport::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

int PipelineReport::AcceptedCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<int>(
      std::count_if(entries_.begin(), entries_.end(),
                    [](const ReportEntry &e) { return e.accepted; }));
}

int PipelineReport::RejectedCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<int>(
      std::count_if(entries_.begin(), entries_.end(),
                    [](const ReportEntry &e) { return !e.accepted; }));
}

int PipelineReport::RegenerationCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  int total = 0;
  for (const auto &entry : entries_) {
    total += entry.regenerations;
  }
  return total;
}

int PipelineReport::SuccessfulRegenerationCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<int>(std::count_if(
      entries_.begin(), entries_.end(),
      [](const ReportEntry &e) { return e.improved_by_regeneration; }));
}

bool PipelineReport::IsDegraded() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::any_of(entries_.begin(), entries_.end(), [](const ReportEntry &e) {
    return e.state == TargetState::kExhaustedWarn;
  });
}

bool PipelineReport::HasFailures() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::any_of(entries_.begin(), entries_.end(), [](const ReportEntry &e) {
    return e.state == TargetState::kExhaustedFail;
  });
}

} // namespace models
