#pragma once
#include <tendril/channel.hpp>
#include <tendril/process.hpp>
#include <tendril/unit.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace tendril {

struct StateEvent {
  std::string name;
  std::uint64_t generation = 0;
  SupervisedState state = SupervisedState::Stopped;
  int pid = -1;
  int restart_count = 0;
  std::optional<ExitStatus> last_exit;
  std::string reason;
  bool final = false; // supervisor thread is done
};

struct ExitDecision {
  SupervisedState next;
  bool restart;
};

// Running -> Stopped / Failed / Restarting once the process exited on its own.
ExitDecision decide_after_exit(RestartPolicy policy, const ExitStatus &st);

// Owns the lifecycle of one UnitInstance on its own thread.
class ProcessSupervisor {
public:
  ProcessSupervisor(UnitInstance unit, std::uint64_t generation,
                    LogPolicy logs, Channel<StateEvent> &events);
  ~ProcessSupervisor();

  ProcessSupervisor(const ProcessSupervisor &) = delete;
  ProcessSupervisor &operator=(const ProcessSupervisor &) = delete;

  void start();
  void request_stop();
  void request_kill();
  bool wait_finished(std::chrono::milliseconds timeout);
  bool finished() const;

  const UnitInstance &unit() const { return unit_; }
  std::uint64_t generation() const { return generation_; }
  SupervisedState state() const;
  int restart_count() const;

  static constexpr std::chrono::milliseconds kPollInterval{50};
  // floor for the restart delay after a failed spawn
  static constexpr std::chrono::milliseconds kSpawnRetryDelay{1000};
  static constexpr std::chrono::milliseconds kHookTimeout{30000};

private:
  void run();
  void emit(SupervisedState s, std::string reason = {}, bool final = false);
  bool wait_stop_requested(std::chrono::milliseconds d);
  bool kill_requested() const;
  bool schedule_restart(const std::string &why,
                        std::chrono::milliseconds delay);
  pid_t launch();
  std::optional<ExitStatus> wait_exit(pid_t pid,
                                      std::chrono::milliseconds timeout);
  ExitStatus terminate(pid_t pid);

  const UnitInstance unit_;
  const std::uint64_t generation_;
  const LogPolicy logs_;
  Channel<StateEvent> &events_;

  mutable std::mutex m_;
  std::condition_variable cv_;
  bool stop_requested_ = false;
  bool kill_requested_ = false;
  bool finished_ = false;

  SupervisedState state_ = SupervisedState::Stopped;
  pid_t pid_ = -1;
  int restart_count_ = 0;
  std::optional<ExitStatus> last_exit_;

  std::thread thread_;
};

} // namespace tendril
