#pragma once

#include <set>
#include <string>
#include <vector>

namespace models {

struct Parameter {
  std::string name;
  std::string type;
  std::string declaration; // verbatim, e.g. "int (*cmp)(const void *, const void *)"
};

/**
 * @brief Identifies a function by its defining file and name.
 */
struct FunctionId {
  std::string unit_path;
  std::string name;

  bool operator<(const FunctionId &other) const;
  bool operator==(const FunctionId &other) const;
  bool operator!=(const FunctionId &other) const { return !(*this == other); }
};

/**
 * @brief The callable shape of one C function, as found in a SourceUnit.
 */
struct FunctionSignature {
  std::string name;
  std::string return_type;
  std::vector<Parameter> parameters;
  std::string unit_path;
  std::set<std::string> calls;

  bool is_definition = false;
  bool is_static = false;
  bool is_variadic = false;
  bool is_opaque = false;
  bool is_implicit = false;

  std::string declaration;
  std::string body;
  int decision_points = 0;
  std::set<std::string> globals_used;
  int line = 0;

  FunctionId GetId() const { return FunctionId{unit_path, name}; }

  bool ReturnsVoid() const;
  bool ReturnsPointer() const;

  /**
   * @brief Builds a prototype without storage class or trailing semicolon.
   *
   * For opaque signatures the declaration text is returned unchanged.
   * @return Text such as "int clamp(int v, int lo, int hi)".
   */
  std::string Prototype() const;
};

} // namespace models
