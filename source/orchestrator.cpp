#include <tendril/dependency.hpp>
#include <tendril/errors.hpp>
#include <tendril/orchestrator.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>

using namespace std::chrono_literals;

namespace tendril {

void sort_for_start(std::vector<UnitInstance> &units) {
  auto order = topo_sort(units);
  std::unordered_map<std::string, size_t> pos;
  for (size_t i = 0; i < order.size(); ++i)
    pos.emplace(order[i], i);
  std::sort(units.begin(), units.end(),
            [&](const UnitInstance &a, const UnitInstance &b) {
              return pos.at(a.name) < pos.at(b.name);
            });
}

// ------------------------ Конструирование ------------------------

Orchestrator::Orchestrator(LogPolicy logs) : logs_(std::move(logs)) {
  pump_thread_ = std::thread([this]() { pump(); });
}

Orchestrator::~Orchestrator() { shutdown(); }

void Orchestrator::load(const std::vector<UnitDefinition> &defs,
                        const std::vector<UnitFailure> &file_failures) {
  Expansion ex = expand_all(defs);
  sort_for_start(ex.instances);
  ex.failures.insert(ex.failures.end(), file_failures.begin(),
                     file_failures.end());

  std::lock_guard<std::mutex> lk(m_);
  if (shutting_down_)
    throw Error("orchestrator is shutting down");
  for (const auto &[name, e] : entries_) {
    if (e.proc)
      throw Error("cannot load units while '" + name + "' is supervised");
  }

  entries_.clear();
  order_.clear();
  failures_ = ex.failures;

  for (auto &u : ex.instances) {
    Entry e;
    e.status.name = u.name;
    e.status.priority = u.priority;
    e.status.tags = u.tags;
    order_.push_back(u.name);
    auto name = u.name;
    e.unit = std::move(u);
    entries_.emplace(std::move(name), std::move(e));
  }

  // сломанные шаблоны видны в status/list под исходным именем
  for (const auto &f : ex.failures) {
    if (entries_.count(f.name)) {
      spdlog::warn("[unit={}] failed unit hidden by an instance of the same "
                   "name",
                   f.name);
      continue;
    }
    Entry e;
    e.status.name = f.name;
    e.status.state = SupervisedState::Failed;
    e.status.reason = f.reason;
    auto def = std::find_if(defs.begin(), defs.end(),
                            [&](const UnitDefinition &d) { return d.name == f.name; });
    if (def != defs.end()) {
      e.status.priority = def->priority;
      e.status.tags = def->tags;
    }
    order_.push_back(f.name);
    entries_.emplace(f.name, std::move(e));
  }

  spdlog::info("loaded {} instance(s) from {} unit(s), {} failed",
               ex.instances.size(), defs.size() + file_failures.size(),
               ex.failures.size());
}

// ------------------------ Управление ------------------------

std::vector<std::string> Orchestrator::start_all() {
  std::vector<std::string> names;
  {
    std::lock_guard<std::mutex> lk(m_);
    for (const auto &n : order_) {
      if (entries_.at(n).unit)
        names.push_back(n);
    }
  }
  spdlog::info("starting {} unit(s)", names.size());

  std::vector<std::string> started;
  for (const auto &n : names) {
    if (start(n))
      started.push_back(n);
  }
  return started;
}

bool Orchestrator::start(const std::string &name) {
  std::shared_ptr<ProcessSupervisor> sup, old;
  {
    std::lock_guard<std::mutex> lk(m_);
    if (shutting_down_) {
      spdlog::warn("[unit={}] not started: shutting down", name);
      return false;
    }
    auto it = entries_.find(name);
    if (it == entries_.end()) {
      spdlog::error("[unit={}] unknown unit", name);
      return false;
    }
    auto &e = it->second;
    if (!e.unit) {
      spdlog::error("[unit={}] cannot start: {}", name, e.status.reason);
      return false;
    }
    if (e.proc) {
      if (!e.proc->finished()) {
        spdlog::info("[unit={}] already supervised", name);
        return true;
      }
      old = std::move(e.proc);
    }

    sup = std::make_shared<ProcessSupervisor>(*e.unit, next_generation_++,
                                              logs_, events_);
    e.proc = sup;
    e.status.state = SupervisedState::Starting;
    e.status.pid = -1;
    e.status.restart_count = 0;
    e.status.reason.clear();
  }
  changed_.notify_all();
  old.reset();
  sup->start();
  return true;
}

bool Orchestrator::stop_supervisor(const std::shared_ptr<ProcessSupervisor> &sup,
                                   std::chrono::milliseconds grace) {
  const auto &name = sup->unit().name;
  sup->request_stop();
  if (sup->wait_finished(grace))
    return true;

  spdlog::warn("[unit={}] did not stop within {}ms; killing", name,
               grace.count());
  sup->request_kill();
  if (sup->wait_finished(5s))
    return true;
  spdlog::error("[unit={}] supervisor did not finish after SIGKILL", name);
  return false;
}

bool Orchestrator::stop(const std::string &name) {
  std::shared_ptr<ProcessSupervisor> sup;
  {
    std::lock_guard<std::mutex> lk(m_);
    auto it = entries_.find(name);
    if (it == entries_.end()) {
      spdlog::error("[unit={}] unknown unit", name);
      return false;
    }
    sup = it->second.proc;
  }
  if (!sup) {
    spdlog::info("[unit={}] not running", name);
    return true;
  }

  // stop-cmd, then SIGTERM, each may take up to stop_timeout
  const auto &u = sup->unit();
  auto grace = u.stop_timeout * (u.stop_cmd.empty() ? 1 : 3) + 1s;
  bool ok = stop_supervisor(sup, grace);

  // дождёмся, пока pump применит финальное событие
  std::unique_lock<std::mutex> lk(m_);
  changed_.wait_for(lk, 2s, [&] {
    auto it = entries_.find(name);
    return it == entries_.end() || it->second.proc != sup;
  });
  return ok;
}

bool Orchestrator::restart(const std::string &name) {
  if (!stop(name))
    return false;
  return start(name);
}

// ------------------------ Состояние ------------------------

std::optional<UnitStatus> Orchestrator::status(const std::string &name) const {
  std::lock_guard<std::mutex> lk(m_);
  auto it = entries_.find(name);
  if (it == entries_.end())
    return std::nullopt;
  return it->second.status;
}

std::vector<std::string> Orchestrator::list() const {
  std::lock_guard<std::mutex> lk(m_);
  return order_;
}

std::vector<std::string> Orchestrator::list(const std::string &tag) const {
  std::lock_guard<std::mutex> lk(m_);
  std::vector<std::string> out;
  for (const auto &n : order_) {
    if (entries_.at(n).status.tags.count(tag))
      out.push_back(n);
  }
  return out;
}

std::vector<UnitFailure> Orchestrator::failures() const {
  std::lock_guard<std::mutex> lk(m_);
  return failures_;
}

bool Orchestrator::wait_for(const std::string &name,
                            const std::function<bool(const UnitStatus &)> &pred,
                            std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lk(m_);
  return changed_.wait_for(lk, timeout, [&] {
    auto it = entries_.find(name);
    return it != entries_.end() && pred(it->second.status);
  });
}

// ------------------------ События ------------------------

void Orchestrator::pump() {
  while (auto ev = events_.pop())
    apply(std::move(*ev));
}

void Orchestrator::apply(StateEvent ev) {
  std::shared_ptr<ProcessSupervisor> released;
  {
    std::lock_guard<std::mutex> lk(m_);
    auto it = entries_.find(ev.name);
    if (it == entries_.end())
      return;
    auto &e = it->second;
    // событие от предыдущего запуска
    if (!e.proc || e.proc->generation() != ev.generation)
      return;

    auto &s = e.status;
    s.state = ev.state;
    s.pid = ev.pid;
    s.restart_count = ev.restart_count;
    s.last_exit = ev.last_exit;
    if (!ev.reason.empty())
      s.reason = std::move(ev.reason);
    if (ev.final)
      released = std::move(e.proc);
  }
  changed_.notify_all();
}

void Orchestrator::shutdown(std::chrono::milliseconds timeout) {
  std::vector<std::shared_ptr<ProcessSupervisor>> live;
  {
    std::lock_guard<std::mutex> lk(m_);
    if (shutting_down_)
      return;
    shutting_down_ = true;
    for (auto it = order_.rbegin(); it != order_.rend(); ++it) {
      auto &e = entries_.at(*it);
      if (e.proc)
        live.push_back(e.proc);
    }
  }

  const bool had_live = !live.empty();
  if (had_live)
    spdlog::info("shutting down {} unit(s)", live.size());
  for (const auto &sup : live) {
    spdlog::info("[unit={}] stopping", sup->unit().name);
    (void)stop_supervisor(sup, timeout);
  }
  live.clear();

  events_.close();
  if (pump_thread_.joinable())
    pump_thread_.join();

  std::vector<std::shared_ptr<ProcessSupervisor>> rest;
  {
    std::lock_guard<std::mutex> lk(m_);
    for (auto &[name, e] : entries_) {
      if (!e.proc)
        continue;
      e.status.state = e.proc->state();
      rest.push_back(std::move(e.proc));
    }
  }
  changed_.notify_all();
  rest.clear();
  if (had_live)
    spdlog::info("shutdown complete");
}

} // namespace tendril
