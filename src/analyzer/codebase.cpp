#include "codebase.hpp"

#include "names.hpp"
#include "../helpers/helpers.hpp"

#include <algorithm>
#include <deque>
#include <map>
#include <utility>

namespace analyzer {

Codebase Codebase::Build(std::vector<models::SourceUnit> units) {
  Codebase codebase;
  codebase.units_ = std::move(units);
  std::stable_sort(codebase.units_.begin(), codebase.units_.end(),
                   [](const models::SourceUnit &a, const models::SourceUnit &b) {
                     return a.path < b.path;
                   });

  for (const auto &unit : codebase.units_) {
    codebase.macros_.insert(unit.macros.begin(), unit.macros.end());
  }

  for (const auto &unit : codebase.units_) {
    for (const auto &function : unit.functions) {
      if (!function.is_definition) {
        continue;
      }
      auto id = function.GetId();
      codebase.graph_.AddFunction(id);
      for (const auto &call : function.calls) {
        if (codebase.IsMacro(call)) {
          continue;
        }
        auto callee = codebase.Resolve(unit.path, call);
        if (callee.has_value()) {
          codebase.graph_.AddEdge(id, *callee);
        } else {
          codebase.graph_.AddUnresolved(id, call);
        }
      }
    }
  }
  return codebase;
}

const models::SourceUnit *Codebase::FindUnit(const std::string &path) const {
  for (const auto &unit : units_) {
    if (unit.path == path) {
      return &unit;
    }
  }
  return nullptr;
}

const models::FunctionSignature *
Codebase::FindFunction(const models::FunctionId &id) const {
  auto unit = FindUnit(id.unit_path);
  if (unit == nullptr) {
    return nullptr;
  }
  return unit->Find(id.name);
}

std::optional<models::FunctionId>
Codebase::Resolve(const std::string &unit_path, const std::string &name) const {
  auto own = FindUnit(unit_path);
  if (own != nullptr) {
    auto function = own->Find(name);
    if (function != nullptr && function->is_definition) {
      return function->GetId();
    }
  }
  for (const auto &unit : units_) {
    if (!unit.is_header || !Includes(unit_path, unit)) {
      continue;
    }
    auto function = unit.Find(name);
    if (function != nullptr && function->is_definition) {
      return function->GetId();
    }
  }
  for (const auto &unit : units_) {
    if (unit.path == unit_path) {
      continue;
    }
    auto function = unit.Find(name);
    if (function != nullptr && function->is_definition &&
        !function->is_static) {
      return function->GetId();
    }
  }
  return std::nullopt;
}

models::FunctionSignature Codebase::ShapeOf(const std::string &unit_path,
                                            const std::string &name) const {
  auto own = FindUnit(unit_path);
  if (own != nullptr) {
    auto function = own->Find(name);
    if (function != nullptr) {
      return *function;
    }
  }
  for (const auto &unit : units_) {
    auto function = unit.Find(name);
    if (function != nullptr && !function->is_definition) {
      return *function;
    }
  }
  models::FunctionSignature implicit;
  implicit.name = name;
  implicit.return_type = "int";
  implicit.is_implicit = true;
  implicit.declaration = "int " + name + "()";
  return implicit;
}

bool Codebase::IsDeclaredFor(const std::string &unit_path,
                             const std::string &name) const {
  for (const auto &unit : units_) {
    if (unit.path != unit_path && !unit.is_header) {
      continue;
    }
    if (unit.Find(name) != nullptr) {
      return true;
    }
  }
  return false;
}

bool Codebase::Includes(const std::string &unit_path,
                        const models::SourceUnit &header) const {
  auto unit = FindUnit(unit_path);
  if (unit == nullptr) {
    return false;
  }
  for (const auto &include : unit->includes) {
    if (include.size() < 3) {
      continue;
    }
    auto name = include.substr(1, include.size() - 2);
    if (header.path == name || helpers::EndsWith(header.path, "/" + name)) {
      return true;
    }
  }
  return false;
}

ExternalDependencies
Codebase::CollectExternalDependencies(const models::FunctionId &target) const {
  ExternalDependencies result;
  std::map<std::string, models::FunctionSignature> stubs;
  std::set<std::string> not_stubbed;
  std::set<models::FunctionId> visited;
  std::deque<models::FunctionId> queue{target};

  while (!queue.empty()) {
    auto current = queue.front();
    queue.pop_front();
    if (!visited.insert(current).second) {
      continue;
    }
    if (current != target) {
      auto function = FindFunction(current);
      if (function != nullptr) {
        result.internal.push_back(*function);
      }
    }

    for (const auto &callee : graph_.DirectDependencies(current)) {
      auto function = FindFunction(callee);
      auto home = FindUnit(callee.unit_path);
      if (callee.unit_path == target.unit_path ||
          (home != nullptr && home->is_header &&
           Includes(target.unit_path, *home))) {
        queue.push_back(callee);
        continue;
      }
      if (function == nullptr) {
        continue;
      }
      if (function->is_opaque) {
        not_stubbed.insert(function->name);
      } else {
        stubs.emplace(function->name, *function);
      }
    }

    for (const auto &name : graph_.UnresolvedCalls(current)) {
      if (IsStandardLibraryFunction(name) || IsMacro(name)) {
        continue;
      }
      auto shape = ShapeOf(target.unit_path, name);
      if (shape.is_opaque) {
        not_stubbed.insert(name);
      } else {
        stubs.emplace(name, std::move(shape));
      }
    }
  }

  for (auto &[name, signature] : stubs) {
    result.to_stub.push_back(std::move(signature));
  }
  result.not_stubbed.assign(not_stubbed.begin(), not_stubbed.end());
  return result;
}

} // namespace analyzer
