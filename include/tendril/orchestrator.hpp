#pragma once
#include <tendril/channel.hpp>
#include <tendril/expander.hpp>
#include <tendril/process.hpp>
#include <tendril/supervisor.hpp>
#include <tendril/unit.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace tendril {

struct UnitStatus {
  std::string name;
  SupervisedState state = SupervisedState::Stopped;
  int pid = -1;
  int restart_count = 0;
  std::optional<ExitStatus> last_exit;
  std::string reason;
  int priority = 0;
  std::set<std::string> tags;
};

// Dependencies first, then priority; equal priorities keep declaration
// order. Throws DependencyError.
void sort_for_start(std::vector<UnitInstance> &units);

class Orchestrator {
public:
  explicit Orchestrator(LogPolicy logs = {});
  ~Orchestrator();

  Orchestrator(const Orchestrator &) = delete;
  Orchestrator &operator=(const Orchestrator &) = delete;

  // Throws DuplicateName or DependencyError (nothing loaded), Error if
  // units are running. `file_failures` are unit files that did not parse;
  // they show up as Failed like broken templates.
  void load(const std::vector<UnitDefinition> &defs,
            const std::vector<UnitFailure> &file_failures = {});

  std::vector<std::string> start_all();
  bool start(const std::string &name);
  bool stop(const std::string &name);
  bool restart(const std::string &name);

  std::optional<UnitStatus> status(const std::string &name) const;
  std::vector<std::string> list() const;
  std::vector<std::string> list(const std::string &tag) const;
  std::vector<UnitFailure> failures() const;

  bool wait_for(const std::string &name,
                const std::function<bool(const UnitStatus &)> &pred,
                std::chrono::milliseconds timeout) const;

  // Reverse start order; each unit gets `timeout` before SIGKILL.
  void shutdown(std::chrono::milliseconds timeout = std::chrono::seconds(10));

private:
  struct Entry {
    std::optional<UnitInstance> unit; // empty: definition failed to expand
    UnitStatus status;
    std::shared_ptr<ProcessSupervisor> proc;
  };

  void pump();
  void apply(StateEvent ev);
  bool stop_supervisor(const std::shared_ptr<ProcessSupervisor> &sup,
                       std::chrono::milliseconds grace);

  LogPolicy logs_;
  Channel<StateEvent> events_;

  mutable std::mutex m_;
  mutable std::condition_variable changed_;
  std::unordered_map<std::string, Entry> entries_;
  std::vector<std::string> order_;
  std::vector<UnitFailure> failures_;
  std::uint64_t next_generation_ = 1;
  bool shutting_down_ = false;

  std::thread pump_thread_;
};

} // namespace tendril
