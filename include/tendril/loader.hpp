#pragma once
#include "expander.hpp"
#include "unit.hpp"
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace tendril {

struct LoadResult {
  std::vector<UnitDefinition> units; // filename order
  std::vector<UnitFailure> failures;
};

// Throws UnitFileError.
UnitDefinition parse_unit(const std::string &content,
                          const std::filesystem::path &source = {});
UnitDefinition load_unit_file(const std::filesystem::path &p);

// Reads every *.unit file; broken files are logged and skipped.
LoadResult load_directory(const std::filesystem::path &dir);

RestartPolicy parse_restart(std::string v);
std::chrono::milliseconds parse_duration(const std::string &v);

} // namespace tendril
