#include <tendril/errors.hpp>
#include <tendril/supervisor.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <string>

#include <signal.h>
#include <sys/types.h>

using namespace std::chrono_literals;

namespace tendril {

ExitDecision decide_after_exit(RestartPolicy policy, const ExitStatus &st) {
  if (st.success()) {
    if (policy == RestartPolicy::Always)
      return {SupervisedState::Restarting, true};
    return {SupervisedState::Stopped, false};
  }
  return {SupervisedState::Failed, policy != RestartPolicy::Never};
}

// ------------------------ Конструирование ------------------------

ProcessSupervisor::ProcessSupervisor(UnitInstance unit,
                                     std::uint64_t generation, LogPolicy logs,
                                     Channel<StateEvent> &events)
    : unit_(std::move(unit)), generation_(generation), logs_(std::move(logs)),
      events_(events) {}

ProcessSupervisor::~ProcessSupervisor() {
  request_kill();
  if (thread_.joinable())
    thread_.join();
}

void ProcessSupervisor::start() {
  thread_ = std::thread([this]() { run(); });
}

void ProcessSupervisor::request_stop() {
  {
    std::lock_guard<std::mutex> lk(m_);
    stop_requested_ = true;
  }
  cv_.notify_all();
}

void ProcessSupervisor::request_kill() {
  {
    std::lock_guard<std::mutex> lk(m_);
    stop_requested_ = true;
    kill_requested_ = true;
  }
  cv_.notify_all();
}

bool ProcessSupervisor::wait_finished(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lk(m_);
  return cv_.wait_for(lk, timeout, [&] { return finished_; });
}

bool ProcessSupervisor::finished() const {
  std::lock_guard<std::mutex> lk(m_);
  return finished_;
}

SupervisedState ProcessSupervisor::state() const {
  std::lock_guard<std::mutex> lk(m_);
  return state_;
}

int ProcessSupervisor::restart_count() const {
  std::lock_guard<std::mutex> lk(m_);
  return restart_count_;
}

// ------------------------ Машина состояний ------------------------

void ProcessSupervisor::emit(SupervisedState s, std::string reason,
                             bool final) {
  StateEvent ev;
  {
    std::lock_guard<std::mutex> lk(m_);
    if (state_ != s)
      spdlog::debug("[unit={}] {} -> {}", unit_.name, to_string(state_),
                    to_string(s));
    state_ = s;
    ev.pid = pid_;
    ev.restart_count = restart_count_;
    ev.last_exit = last_exit_;
  }
  ev.name = unit_.name;
  ev.generation = generation_;
  ev.state = s;
  ev.reason = std::move(reason);
  ev.final = final;
  events_.push(std::move(ev));
}

bool ProcessSupervisor::wait_stop_requested(std::chrono::milliseconds d) {
  std::unique_lock<std::mutex> lk(m_);
  cv_.wait_for(lk, d, [&] { return stop_requested_; });
  return stop_requested_;
}

// false: no respawn, final state already emitted
bool ProcessSupervisor::schedule_restart(const std::string &why,
                                         std::chrono::milliseconds delay) {
  int count = restart_count();
  if (unit_.max_restarts && count >= *unit_.max_restarts) {
    spdlog::error("[unit={}] restart limit {} reached; giving up",
                  unit_.name, *unit_.max_restarts);
    emit(SupervisedState::Failed, "restart limit reached: " + why, true);
    return false;
  }

  emit(SupervisedState::Restarting, why);
  if (delay.count() > 0)
    spdlog::info("[unit={}] restarting in {}ms", unit_.name, delay.count());
  if (wait_stop_requested(delay)) {
    emit(SupervisedState::Stopped, "stopped", true);
    return false;
  }
  {
    std::lock_guard<std::mutex> lk(m_);
    ++restart_count_;
  }
  return true;
}

// pre-cmd, the unit itself, post-cmd; throws SpawnFailed
pid_t ProcessSupervisor::launch() {
  if (!unit_.pre_cmd.empty()) {
    spdlog::info("[unit={}] pre-cmd: {}", unit_.name, unit_.pre_cmd);
    auto st = ProcessRunner::run_hook(unit_, unit_.pre_cmd, logs_, kHookTimeout);
    if (!st.success())
      throw SpawnFailed(unit_.name, "pre-cmd failed: " + st.describe());
  }

  pid_t pid = ProcessRunner::spawn(unit_, logs_);

  if (!unit_.post_cmd.empty()) {
    spdlog::info("[unit={}] post-cmd: {}", unit_.name, unit_.post_cmd);
    try {
      auto st = ProcessRunner::run_hook(unit_, unit_.post_cmd, logs_,
                                        kHookTimeout,
                                        {"MAINPID=" + std::to_string(pid)});
      // сервис уже запущен, не падаем
      if (!st.success())
        spdlog::warn("[unit={}] post-cmd failed ({})", unit_.name,
                     st.describe());
    } catch (const SpawnFailed &e) {
      spdlog::warn("[unit={}] post-cmd: {}", unit_.name, e.what());
    }
  }
  return pid;
}

bool ProcessSupervisor::kill_requested() const {
  std::lock_guard<std::mutex> lk(m_);
  return kill_requested_;
}

// nullopt: still running after `timeout`, or a kill was requested
std::optional<ExitStatus>
ProcessSupervisor::wait_exit(pid_t pid, std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  for (;;) {
    if (auto st = ProcessRunner::try_reap(pid))
      return st;
    if (std::chrono::steady_clock::now() >= deadline)
      return std::nullopt;
    std::unique_lock<std::mutex> lk(m_);
    if (cv_.wait_for(lk, kPollInterval, [&] { return kill_requested_; }))
      return std::nullopt;
  }
}

ExitStatus ProcessSupervisor::terminate(pid_t pid) {
  if (!kill_requested() && !unit_.stop_cmd.empty()) {
    spdlog::info("[unit={}] stop-cmd: {}", unit_.name, unit_.stop_cmd);
    try {
      auto rc = ProcessRunner::run_hook(unit_, unit_.stop_cmd, logs_,
                                        unit_.stop_timeout,
                                        {"MAINPID=" + std::to_string(pid)});
      if (rc.success()) {
        if (auto st = wait_exit(pid, unit_.stop_timeout))
          return *st;
      } else {
        spdlog::warn("[unit={}] stop-cmd failed ({})", unit_.name,
                     rc.describe());
      }
    } catch (const SpawnFailed &e) {
      spdlog::warn("[unit={}] stop-cmd: {}", unit_.name, e.what());
    }
  }

  if (!kill_requested()) {
    spdlog::info("[unit={}] stopping pid={} (SIGTERM, timeout={}ms)",
                 unit_.name, pid, unit_.stop_timeout.count());
    ProcessRunner::signal_group(pid, SIGTERM);
    if (auto st = wait_exit(pid, unit_.stop_timeout))
      return *st;
  }

  spdlog::warn("[unit={}] force kill pid={}", unit_.name, pid);
  ProcessRunner::signal_group(pid, SIGKILL);
  return ProcessRunner::reap(pid);
}

void ProcessSupervisor::run() {
  int spawn_failures = 0;
  for (;;) {
    if (wait_stop_requested(0ms)) {
      emit(SupervisedState::Stopped, "stopped", true);
      break;
    }

    emit(SupervisedState::Starting);
    pid_t pid = -1;
    try {
      pid = launch();
      spawn_failures = 0;
    } catch (const SpawnFailed &e) {
      // повторы одной и той же ошибки не засоряют лог
      if (spawn_failures++ == 0)
        spdlog::error("[unit={}] {}", unit_.name, e.what());
      else
        spdlog::debug("[unit={}] {} (attempt {})", unit_.name, e.what(),
                      spawn_failures);
      if (unit_.restart == RestartPolicy::Never) {
        emit(SupervisedState::Failed, e.what(), true);
        break;
      }
      emit(SupervisedState::Failed, e.what());
      if (!schedule_restart(e.what(),
                            std::max(unit_.restart_delay, kSpawnRetryDelay)))
        break;
      continue;
    }

    {
      std::lock_guard<std::mutex> lk(m_);
      pid_ = pid;
    }
    emit(SupervisedState::Running);

    std::optional<ExitStatus> st;
    bool stopping = false;
    while (!st) {
      if (wait_stop_requested(kPollInterval)) {
        emit(SupervisedState::Stopping);
        st = terminate(pid);
        stopping = true;
        break;
      }
      st = ProcessRunner::try_reap(pid);
    }

    {
      std::lock_guard<std::mutex> lk(m_);
      pid_ = -1;
      last_exit_ = st;
    }

    if (stopping) {
      spdlog::info("[unit={}] stopped ({})", unit_.name, st->describe());
      emit(SupervisedState::Stopped, "stopped", true);
      break;
    }

    const auto why = st->describe();
    auto d = decide_after_exit(unit_.restart, *st);
    if (st->success())
      spdlog::info("[unit={}] exited ({})", unit_.name, why);
    else
      spdlog::warn("[unit={}] exited ({})", unit_.name, why);

    if (!d.restart) {
      emit(d.next, d.next == SupervisedState::Failed ? why : std::string{},
           true);
      break;
    }
    if (d.next == SupervisedState::Failed)
      emit(SupervisedState::Failed, why);
    if (!schedule_restart(why, unit_.restart_delay))
      break;
  }

  {
    std::lock_guard<std::mutex> lk(m_);
    finished_ = true;
  }
  cv_.notify_all();
}

} // namespace tendril
