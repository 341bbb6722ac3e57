#include "verbose.hpp"

namespace utils::verbose {

Flags::Flags() { Reset(); }

bool Flags::NeedToPrintVerbose() const {
  return need_to_print_verbose_;
}

bool Flags::NeedToPrintPrompts() const {
  return need_to_print_prompts_;
}

bool Flags::NeedToPrintDiagnostics() const {
  return need_to_print_diagnostics_;
}

void Flags::Reset() {
  need_to_print_verbose_ = false;
  need_to_print_prompts_ = false;
  need_to_print_diagnostics_ = false;
}

void Flags::SetNeedToPrintVerbose() { need_to_print_verbose_ = true; }

void Flags::SetNeedToPrintPrompts() { need_to_print_prompts_ = true; }

void Flags::SetNeedToPrintDiagnostics() { need_to_print_diagnostics_ = true; }

} // namespace utils::verbose
