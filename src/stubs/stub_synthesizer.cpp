#include "stub_synthesizer.hpp"

#include "../analyzer/names.hpp"
#include "../helpers/helpers.hpp"

#include <fmt/core.h>
#include <sstream>
#include <utility>

namespace stubs {

StubSynthesizer::StubSynthesizer(StubSettings settings)
    : settings_(std::move(settings)) {}

std::string
StubSynthesizer::ControlType(const models::FunctionSignature &signature) {
  if (signature.ReturnsPointer()) {
    return helpers::Trim(signature.return_type);
  }
  // Drop qualifiers so tests can assign the control variable.
  std::istringstream words(signature.return_type);
  std::string word;
  std::string result;
  while (words >> word) {
    if (word == "const" || word == "volatile") {
      continue;
    }
    if (!result.empty()) {
      result += ' ';
    }
    result += word;
  }
  return result;
}

std::string
StubSynthesizer::DefaultReturn(const models::FunctionSignature &signature) const {
  if (signature.ReturnsVoid()) {
    return "";
  }
  auto override_it = settings_.return_overrides.find(signature.name);
  if (override_it != settings_.return_overrides.end()) {
    return override_it->second;
  }
  if (signature.ReturnsPointer()) {
    return settings_.pointer_sentinel;
  }
  if (analyzer::IsScalarType(ControlType(signature))) {
    return "0";
  }
  return "{0}";
}

std::optional<models::StubSpec>
StubSynthesizer::Synthesize(const models::FunctionSignature &signature) const {
  if (signature.is_opaque) {
    return std::nullopt;
  }

  models::StubSpec stub;
  stub.signature = signature;
  stub.return_expression = DefaultReturn(signature);

  const auto &name = signature.name;
  std::string code = fmt::format("/* stub: {} */\n", name);
  code += fmt::format("unsigned {}_stub_call_count = 0;\n", name);
  if (!signature.ReturnsVoid()) {
    auto type = ControlType(signature);
    code += fmt::format("{}{}{}_stub_return = {};\n", type,
                        helpers::EndsWith(type, "*") ? "" : " ", name,
                        stub.return_expression);
  }
  code += signature.Prototype() + " {\n";
  code += fmt::format("  {}_stub_call_count++;\n", name);
  for (const auto &parameter : signature.parameters) {
    code += fmt::format("  (void){};\n", parameter.name);
  }
  if (!signature.ReturnsVoid()) {
    code += fmt::format("  return {}_stub_return;\n", name);
  }
  code += "}\n";
  stub.code = std::move(code);
  return stub;
}

std::vector<models::StubSpec> StubSynthesizer::SynthesizeAll(
    const std::vector<models::FunctionSignature> &signatures,
    std::vector<std::string> &unsupported) const {
  std::vector<models::StubSpec> result;
  for (const auto &signature : signatures) {
    auto stub = Synthesize(signature);
    if (stub.has_value()) {
      result.push_back(std::move(*stub));
    } else {
      unsupported.push_back(signature.name);
    }
  }
  return result;
}

std::string RenderStubs(const std::vector<models::StubSpec> &stubs) {
  if (stubs.empty()) {
    return "";
  }
  std::string result = "#include <stddef.h>\n\n";
  for (const auto &stub : stubs) {
    result += stub.code;
    result += '\n';
  }
  return result;
}

} // namespace stubs
