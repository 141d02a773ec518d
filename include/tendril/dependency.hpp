#pragma once
#include "errors.hpp"
#include "unit.hpp"

#include <algorithm>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace tendril {

// unit -> units it depends on
using DepGraph = std::unordered_map<std::string, std::vector<std::string>>;

// Throws DependencyError on an unknown or self dependency.
inline DepGraph build_dep_graph(const std::vector<UnitInstance> &units) {
  std::unordered_set<std::string> known;
  for (const auto &u : units)
    known.insert(u.name);

  DepGraph g;
  for (const auto &u : units) {
    auto &deps = g[u.name];
    for (const auto &d : u.dependencies) {
      if (d == u.name)
        throw DependencyError(u.name, "depends on itself");
      if (!known.count(d))
        throw DependencyError(u.name, "unknown dependency '" + d + "'");
      if (std::find(deps.begin(), deps.end(), d) == deps.end())
        deps.push_back(d);
    }
  }
  return g;
}

// Kahn; among ready units the lower priority goes first, then declaration
// order. Without dependencies this is a stable sort by priority.
inline std::vector<std::string> topo_sort(const std::vector<UnitInstance> &units) {
  const auto g = build_dep_graph(units);

  std::unordered_map<std::string, size_t> index;
  for (size_t i = 0; i < units.size(); ++i)
    index.emplace(units[i].name, i);

  std::vector<int> indeg(units.size(), 0);
  std::vector<std::vector<size_t>> dependents(units.size());
  for (size_t i = 0; i < units.size(); ++i) {
    for (const auto &d : g.at(units[i].name)) {
      indeg[i]++;
      dependents[index.at(d)].push_back(i);
    }
  }

  std::set<std::pair<int, size_t>> ready;
  for (size_t i = 0; i < units.size(); ++i)
    if (indeg[i] == 0)
      ready.emplace(units[i].priority, i);

  std::vector<std::string> out;
  out.reserve(units.size());
  while (!ready.empty()) {
    auto i = ready.begin()->second;
    ready.erase(ready.begin());
    out.push_back(units[i].name);
    for (auto j : dependents[i]) {
      if (--indeg[j] == 0)
        ready.emplace(units[j].priority, j);
    }
  }

  if (out.size() != units.size()) {
    std::string stuck;
    for (size_t i = 0; i < units.size(); ++i) {
      if (indeg[i] == 0)
        continue;
      if (!stuck.empty())
        stuck += ", ";
      stuck += units[i].name;
    }
    auto first = std::find_if(indeg.begin(), indeg.end(),
                              [](int d) { return d > 0; });
    throw DependencyError(units[first - indeg.begin()].name,
                          "dependency cycle detected among: " + stuck);
  }
  return out;
}

} // namespace tendril
