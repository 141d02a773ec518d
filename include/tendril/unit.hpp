#pragma once
#include <chrono>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace tendril {

enum class RestartPolicy { Never, OnFailure, Always };

enum class SupervisedState { Stopped, Starting, Running, Stopping, Restarting, Failed };

const char *to_string(RestartPolicy p);
const char *to_string(SupervisedState s);

// Declared service; may be a template over `instances`.
struct UnitDefinition {
  std::string name;
  std::string description;
  std::string command;
  std::vector<std::string> args;

  RestartPolicy restart = RestartPolicy::Never;
  std::chrono::milliseconds restart_delay{0};
  int priority = 0;
  std::set<std::string> tags;
  std::vector<std::string> instances;

  std::vector<std::string> env; // KEY=VALUE
  std::string working_dir;
  std::string user;
  std::string stdout_log;
  std::string stderr_log;
  std::chrono::milliseconds stop_timeout{std::chrono::seconds(5)};
  std::optional<int> max_restarts; // пусто = без ограничения

  std::vector<std::string> dependencies; // started before this unit
  std::string pre_cmd;  // sh -c before every spawn; failure aborts the spawn
  std::string post_cmd; // sh -c after a successful spawn
  std::string stop_cmd; // replaces SIGTERM on explicit stop; $MAINPID is set

  std::filesystem::path source;
};

// Concrete, fully substituted realization of a definition.
struct UnitInstance {
  std::string name;
  std::string description;
  std::string command;
  std::vector<std::string> args;
  std::string instance_id;

  RestartPolicy restart = RestartPolicy::Never;
  std::chrono::milliseconds restart_delay{0};
  int priority = 0;
  std::set<std::string> tags;

  std::vector<std::string> env;
  std::string working_dir;
  std::string user;
  std::string stdout_log;
  std::string stderr_log;
  std::chrono::milliseconds stop_timeout{std::chrono::seconds(5)};
  std::optional<int> max_restarts;

  std::vector<std::string> dependencies;
  std::string pre_cmd;
  std::string post_cmd;
  std::string stop_cmd;

  bool has_tag(const std::string &tag) const { return tags.count(tag) != 0; }
};

bool operator==(const UnitInstance &a, const UnitInstance &b);
inline bool operator!=(const UnitInstance &a, const UnitInstance &b) {
  return !(a == b);
}

} // namespace tendril
