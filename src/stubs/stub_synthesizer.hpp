#pragma once

#include "../models/function_signature.hpp"
#include "../models/stub_spec.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stubs {

struct StubSettings {
  std::string pointer_sentinel = "NULL";
  std::map<std::string, std::string> return_overrides; ///< name -> C expression
};

/**
 * @brief Derives compilable stand-ins for external functions.
 *
 * Output depends only on the signature and the settings, so the same
 * signature always yields a byte-identical stub.
 */
class StubSynthesizer {
public:
  explicit StubSynthesizer(StubSettings settings);

  /**
   * @brief Synthesizes one stub.
   * @param signature The function to stand in for.
   * @return The stub, or std::nullopt for opaque signatures.
   */
  std::optional<models::StubSpec>
  Synthesize(const models::FunctionSignature &signature) const;

  /**
   * @brief Synthesizes stubs for every signature that supports it.
   * @param signatures The functions to stub.
   * @param unsupported Receives the names of opaque signatures.
   */
  std::vector<models::StubSpec>
  SynthesizeAll(const std::vector<models::FunctionSignature> &signatures,
                std::vector<std::string> &unsupported) const;

  /**
   * @brief The value a stub returns before a test overrides it.
   * @return A C expression; empty for void functions.
   */
  std::string DefaultReturn(const models::FunctionSignature &signature) const;

  /**
   * @brief The declared type of the <name>_stub_return control variable.
   */
  static std::string ControlType(const models::FunctionSignature &signature);

private:
  StubSettings settings_;
};

/**
 * @brief Concatenates stub code behind the includes stubs depend on.
 */
std::string RenderStubs(const std::vector<models::StubSpec> &stubs);

} // namespace stubs
