#pragma once
#include <stdexcept>
#include <string>

namespace tendril {

class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Malformed placeholder or instance list; fatal for one unit.
class InvalidTemplate : public Error {
public:
  InvalidTemplate(const std::string &unit, const std::string &why)
      : Error("invalid template '" + unit + "': " + why), unit_(unit) {}
  const std::string &unit() const { return unit_; }

private:
  std::string unit_;
};

// Two instances resolved to the same name; fatal for the whole set.
class DuplicateName : public Error {
public:
  explicit DuplicateName(const std::string &name)
      : Error("duplicate unit name: " + name), name_(name) {}
  const std::string &name() const { return name_; }

private:
  std::string name_;
};

class SpawnFailed : public Error {
public:
  SpawnFailed(const std::string &unit, const std::string &why)
      : Error("spawn failed for '" + unit + "': " + why) {}
};

// Unknown dependency or a cycle; fatal for the whole set.
class DependencyError : public Error {
public:
  DependencyError(const std::string &unit, const std::string &why)
      : Error("unit '" + unit + "': " + why), unit_(unit) {}
  const std::string &unit() const { return unit_; }

private:
  std::string unit_;
};

class UnitFileError : public Error {
public:
  using Error::Error;
};

} // namespace tendril
