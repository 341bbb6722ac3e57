#include "source_unit.hpp"

namespace models {

const FunctionSignature *SourceUnit::Find(const std::string &name) const {
  for (const auto &function : functions) {
    if (function.name == name) {
      return &function;
    }
  }
  return nullptr;
}

bool SourceUnit::HasGlobal(const std::string &name) const {
  for (const auto &global : globals) {
    if (global.name == name) {
      return true;
    }
  }
  return false;
}

bool SourceUnit::DefinesMain() const {
  auto main_function = Find("main");
  return main_function != nullptr && main_function->is_definition;
}

} // namespace models
