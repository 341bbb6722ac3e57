#pragma once

#include "../models/function_signature.hpp"

#include <map>
#include <set>
#include <string>

namespace analyzer {

/**
 * @brief Direct call edges between analyzed functions.
 *
 * Only direct calls are stored. Transitive queries walk the adjacency map
 * with a visited set, so cycles (including recursion) terminate.
 */
class DependencyGraph {
public:
  void AddFunction(const models::FunctionId &id);
  void AddEdge(const models::FunctionId &from, const models::FunctionId &to);
  void AddUnresolved(const models::FunctionId &from, const std::string &name);

  bool Contains(const models::FunctionId &id) const;
  std::size_t Size() const { return edges_.size(); }

  /**
   * @brief Functions called directly by the given function.
   */
  const std::set<models::FunctionId> &
  DirectDependencies(const models::FunctionId &id) const;

  /**
   * @brief Every function reachable from the given one, excluding itself
   * unless it lies on a cycle.
   */
  std::set<models::FunctionId>
  TransitiveDependencies(const models::FunctionId &id) const;

  /**
   * @brief Call names that did not resolve to any analyzed definition.
   */
  const std::set<std::string> &
  UnresolvedCalls(const models::FunctionId &id) const;

private:
  std::map<models::FunctionId, std::set<models::FunctionId>> edges_;
  std::map<models::FunctionId, std::set<std::string>> unresolved_;
};

} // namespace analyzer
