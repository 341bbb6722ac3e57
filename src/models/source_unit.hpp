#pragma once

#include "function_signature.hpp"

#include <set>
#include <string>
#include <vector>

namespace models {

struct GlobalVariable {
  std::string name;
  std::string declaration;
  bool is_extern = false;
};

/**
 * @brief One analyzed C file. Built once and read-only afterwards.
 */
struct SourceUnit {
  std::string path;
  std::string text;
  std::vector<FunctionSignature> functions;
  std::vector<std::string> includes;
  std::vector<GlobalVariable> globals;
  std::set<std::string> macros;

  bool is_header = false;
  bool structural_error = false;
  std::string error_message;

  /**
   * @brief Looks up a function by name.
   * @return The signature, or nullptr if the unit has none with that name.
   */
  const FunctionSignature *Find(const std::string &name) const;

  bool HasGlobal(const std::string &name) const;
  bool DefinesMain() const;
};

} // namespace models
