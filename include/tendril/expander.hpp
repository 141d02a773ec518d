#pragma once
#include "unit.hpp"
#include <string>
#include <vector>

namespace tendril {

struct UnitFailure {
  std::string name;
  std::string reason;
};

struct Expansion {
  std::vector<UnitInstance> instances; // declaration order
  std::vector<UnitFailure> failures;
};

// Throws InvalidTemplate.
std::vector<UnitInstance> expand(const UnitDefinition &def);

// Per-unit InvalidTemplate goes to failures; throws DuplicateName.
Expansion expand_all(const std::vector<UnitDefinition> &defs);

bool has_placeholder(const std::string &s);
std::string substitute(const std::string &s, const std::string &id);

} // namespace tendril
