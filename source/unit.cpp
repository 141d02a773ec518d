#include <tendril/unit.hpp>

namespace tendril {

const char *to_string(RestartPolicy p) {
  switch (p) {
  case RestartPolicy::Never:
    return "never";
  case RestartPolicy::OnFailure:
    return "on-failure";
  case RestartPolicy::Always:
    return "always";
  }
  return "never";
}

const char *to_string(SupervisedState s) {
  switch (s) {
  case SupervisedState::Stopped:
    return "stopped";
  case SupervisedState::Starting:
    return "starting";
  case SupervisedState::Running:
    return "running";
  case SupervisedState::Stopping:
    return "stopping";
  case SupervisedState::Restarting:
    return "restarting";
  case SupervisedState::Failed:
    return "failed";
  }
  return "unknown";
}

bool operator==(const UnitInstance &a, const UnitInstance &b) {
  return a.name == b.name && a.description == b.description &&
         a.command == b.command && a.args == b.args &&
         a.instance_id == b.instance_id && a.restart == b.restart &&
         a.restart_delay == b.restart_delay && a.priority == b.priority &&
         a.tags == b.tags && a.env == b.env &&
         a.working_dir == b.working_dir && a.user == b.user &&
         a.stdout_log == b.stdout_log && a.stderr_log == b.stderr_log &&
         a.stop_timeout == b.stop_timeout && a.max_restarts == b.max_restarts &&
         a.dependencies == b.dependencies && a.pre_cmd == b.pre_cmd &&
         a.post_cmd == b.post_cmd && a.stop_cmd == b.stop_cmd;
}

} // namespace tendril
