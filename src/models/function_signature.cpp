#include "function_signature.hpp"

#include "../helpers/helpers.hpp"

#include <tuple>

namespace models {

bool FunctionId::operator<(const FunctionId &other) const {
  return std::tie(unit_path, name) < std::tie(other.unit_path, other.name);
}

bool FunctionId::operator==(const FunctionId &other) const {
  return unit_path == other.unit_path && name == other.name;
}

bool FunctionSignature::ReturnsVoid() const {
  return helpers::CollapseWhitespace(return_type) == "void";
}

bool FunctionSignature::ReturnsPointer() const {
  return helpers::EndsWith(helpers::Trim(return_type), "*");
}

std::string FunctionSignature::Prototype() const {
  if (is_opaque) {
    return declaration;
  }
  std::string result = helpers::Trim(return_type);
  if (!helpers::EndsWith(result, "*")) {
    result += ' ';
  }
  result += name;
  result += '(';
  if (parameters.empty()) {
    if (!is_implicit && !is_variadic) {
      result += "void";
    }
  } else {
    for (size_t i = 0; i < parameters.size(); ++i) {
      if (i != 0) {
        result += ", ";
      }
      result += parameters[i].declaration;
    }
  }
  if (is_variadic) {
    result += parameters.empty() ? "..." : ", ...";
  }
  result += ')';
  return result;
}

} // namespace models
