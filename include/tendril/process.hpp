#pragma once
#include "unit.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

namespace tendril {

struct ExitStatus {
  int code{0};
  int signal{0}; // != 0 when killed by a signal

  bool success() const { return signal == 0 && code == 0; }
  int as_code() const { return signal ? 128 + signal : code; }
  std::string describe() const;
};

// Where child stdout/stderr go when the unit names no log file.
struct LogPolicy {
  std::filesystem::path dir{"logs"};
  std::uintmax_t max_bytes{5 * 1024 * 1024};
  int backups{3};
};

class ProcessRunner {
public:
  // fork + exec in a new process group; throws SpawnFailed.
  static pid_t spawn(const UnitInstance &u, const LogPolicy &logs);

  // `sh -c cmd` with the unit's user, cwd, env and log files; waits up to
  // `timeout`, then SIGKILLs it. Throws SpawnFailed.
  static ExitStatus run_hook(const UnitInstance &u, const std::string &cmd,
                             const LogPolicy &logs,
                             std::chrono::milliseconds timeout,
                             const std::vector<std::string> &extra_env = {});

  static std::optional<ExitStatus> try_reap(pid_t pid);
  static ExitStatus reap(pid_t pid);

  static bool signal_group(pid_t pid, int sig);
  static bool alive(pid_t pid);

  static std::filesystem::path stdout_path(const UnitInstance &u,
                                           const LogPolicy &logs);
  static std::filesystem::path stderr_path(const UnitInstance &u,
                                           const LogPolicy &logs);
};

} // namespace tendril
