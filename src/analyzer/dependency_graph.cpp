#include "dependency_graph.hpp"

#include <deque>

namespace analyzer {
namespace {
const std::set<models::FunctionId> kNoDependencies;
const std::set<std::string> kNoNames;
} // namespace

void DependencyGraph::AddFunction(const models::FunctionId &id) {
  edges_[id];
  unresolved_[id];
}

void DependencyGraph::AddEdge(const models::FunctionId &from,
                              const models::FunctionId &to) {
  edges_[from].insert(to);
  edges_[to];
}

void DependencyGraph::AddUnresolved(const models::FunctionId &from,
                                    const std::string &name) {
  edges_[from];
  unresolved_[from].insert(name);
}

bool DependencyGraph::Contains(const models::FunctionId &id) const {
  return edges_.count(id) != 0;
}

const std::set<models::FunctionId> &
DependencyGraph::DirectDependencies(const models::FunctionId &id) const {
  auto it = edges_.find(id);
  if (it == edges_.end()) {
    return kNoDependencies;
  }
  return it->second;
}

std::set<models::FunctionId>
DependencyGraph::TransitiveDependencies(const models::FunctionId &id) const {
  std::set<models::FunctionId> visited;
  std::deque<models::FunctionId> queue(DirectDependencies(id).begin(),
                                       DirectDependencies(id).end());
  while (!queue.empty()) {
    auto current = queue.front();
    queue.pop_front();
    if (!visited.insert(current).second) {
      continue;
    }
    for (const auto &next : DirectDependencies(current)) {
      if (visited.count(next) == 0) {
        queue.push_back(next);
      }
    }
  }
  return visited;
}

const std::set<std::string> &
DependencyGraph::UnresolvedCalls(const models::FunctionId &id) const {
  auto it = unresolved_.find(id);
  if (it == unresolved_.end()) {
    return kNoNames;
  }
  return it->second;
}

} // namespace analyzer
