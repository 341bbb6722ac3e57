#pragma once

#include "../models/source_unit.hpp"
#include "dependency_graph.hpp"

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace analyzer {

/**
 * @brief Functions a target needs that the test translation unit does not
 * define.
 */
struct ExternalDependencies {
  std::vector<models::FunctionSignature> to_stub; ///< sorted by name
  std::vector<std::string> not_stubbed;           ///< opaque shapes
  std::vector<models::FunctionSignature> internal; ///< same-unit and included-header callees
};

/**
 * @brief Every analyzed SourceUnit plus the DependencyGraph over them.
 * Built once, read-only afterwards, safe to share between workers.
 */
class Codebase {
public:
  /**
   * @brief Builds the codebase; units are ordered by path.
   */
  static Codebase Build(std::vector<models::SourceUnit> units);

  const std::vector<models::SourceUnit> &GetUnits() const { return units_; }
  const DependencyGraph &GetGraph() const { return graph_; }

  const models::SourceUnit *FindUnit(const std::string &path) const;
  const models::FunctionSignature *
  FindFunction(const models::FunctionId &id) const;

  /**
   * @brief Resolves a call made from a unit.
   *
   * A definition in the calling unit wins, then a definition (static
   * inline helpers included) in a header the calling unit includes,
   * otherwise the first non-static definition in another unit, in path
   * order.
   * @return The callee, or std::nullopt if the call is unresolved.
   */
  std::optional<models::FunctionId> Resolve(const std::string &unit_path,
                                            const std::string &name) const;

  /**
   * @brief Shape used to stub an unresolved name: a prototype from the
   * calling unit, then from any unit in path order, else an implicit
   * "int name()".
   */
  models::FunctionSignature ShapeOf(const std::string &unit_path,
                                    const std::string &name) const;

  /**
   * @brief Checks whether a header of the codebase, or the unit itself,
   * declares the name.
   */
  bool IsDeclaredFor(const std::string &unit_path,
                     const std::string &name) const;

  /**
   * @brief Checks whether the unit has an #include naming the header,
   * matched on whole path components.
   */
  bool Includes(const std::string &unit_path,
                const models::SourceUnit &header) const;

  /**
   * @brief Collects what must be stubbed to compile a target's unit alone.
   *
   * Walks same-unit callees transitively (visited set) and gathers calls
   * that leave the unit. Functions defined in headers the unit includes
   * compile with it and are walked like same-unit callees. Standard
   * library functions and macros are skipped.
   */
  ExternalDependencies
  CollectExternalDependencies(const models::FunctionId &target) const;

  bool IsMacro(const std::string &name) const {
    return macros_.count(name) != 0;
  }

private:
  std::vector<models::SourceUnit> units_;
  std::set<std::string> macros_;
  DependencyGraph graph_;
};

} // namespace analyzer
