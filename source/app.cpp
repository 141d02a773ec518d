#include <tendril/app.hpp>
#include <tendril/cli.hpp>
#include <tendril/errors.hpp>
#include <tendril/expander.hpp>
#include <tendril/loader.hpp>
#include <tendril/logging.hpp>
#include <tendril/orchestrator.hpp>
#include <tendril/settings.hpp>
#include <tendril/signals.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <type_traits>
#include <string>
#include <vector>

#ifndef TENDRIL_VERSION
#define TENDRIL_VERSION "unknown"
#endif
#ifndef TENDRIL_BUILD_TIME
#define TENDRIL_BUILD_TIME "unknown"
#endif

namespace fs = std::filesystem;

namespace tendril {

static void print_help() {
  std::cout <<
      R"(tendrild - service supervisor

Usage:
  tendrild run   [--units DIR] [--log-dir DIR] [--log-file PATH]
                 [--shutdown-timeout SEC] [--verbose]
  tendrild check [--units DIR]
  tendrild list  [--units DIR] [--tag TAG]
  tendrild help | version

Environment:
  TENDRIL_UNITS_DIR, TENDRIL_LOG_DIR, TENDRIL_LOG_FILE,
  TENDRIL_LOG_MAX_MB, TENDRIL_SHUTDOWN_TIMEOUT_SEC
)";
}

static Settings make_settings(const CommonOpts &o) {
  Settings s = Settings::from_env();
  if (o.units_dir)
    s.units_dir = *o.units_dir;
  if (o.log_dir)
    s.log_dir = *o.log_dir;
  if (o.log_file)
    s.log_file = fs::path(*o.log_file);
  s.verbose = o.verbose;
  return s;
}

// load + expand + order without starting anything
struct Plan {
  std::vector<UnitInstance> instances;
  std::vector<UnitFailure> failures;
};

static Plan make_plan(const Settings &s) {
  auto loaded = load_directory(s.units_dir);
  Expansion ex = expand_all(loaded.units);
  sort_for_start(ex.instances);
  Plan p;
  p.instances = std::move(ex.instances);
  p.failures = std::move(loaded.failures);
  for (auto &f : ex.failures)
    p.failures.push_back(std::move(f));
  return p;
}

static int cmd_check(const Settings &s) {
  Plan p;
  try {
    p = make_plan(s);
  } catch (const DuplicateName &e) {
    spdlog::error("{}", e.what());
    return 2;
  } catch (const DependencyError &e) {
    spdlog::error("{}", e.what());
    return 2;
  }
  for (const auto &u : p.instances) {
    fmt::print("{:>5}  {:<24} restart={} cmd={}", u.priority, u.name,
               to_string(u.restart), u.command);
    for (const auto &a : u.args)
      fmt::print(" {}", a);
    fmt::print("\n");
  }
  for (const auto &f : p.failures)
    fmt::print("FAILED {}: {}\n", f.name, f.reason);
  return p.failures.empty() ? 0 : 1;
}

// same view as a running daemon: instances in start order, then failures
static int cmd_list(const Settings &s, const std::optional<std::string> &tag) {
  auto loaded = load_directory(s.units_dir);
  Orchestrator orch(s.child_logs());
  try {
    orch.load(loaded.units, loaded.failures);
  } catch (const DuplicateName &e) {
    spdlog::error("{}", e.what());
    return 2;
  } catch (const DependencyError &e) {
    spdlog::error("{}", e.what());
    return 2;
  }
  for (const auto &name : tag ? orch.list(*tag) : orch.list()) {
    auto st = orch.status(name);
    if (st && st->state == SupervisedState::Failed)
      fmt::print("{} (failed: {})\n", name, st->reason);
    else
      fmt::print("{}\n", name);
  }
  return 0;
}

static int cmd_run(const Settings &s) {
  // до запуска любых потоков
  ShutdownSignals signals;

  auto loaded = load_directory(s.units_dir);
  Orchestrator orch(s.child_logs());
  try {
    orch.load(loaded.units, loaded.failures);
  } catch (const DuplicateName &e) {
    spdlog::critical("aborting startup: {}", e.what());
    return 2;
  } catch (const DependencyError &e) {
    spdlog::critical("aborting startup: {}", e.what());
    return 2;
  }

  auto started = orch.start_all();
  spdlog::info("tendrild {} running; {} unit(s) supervised, units_dir={}",
               TENDRIL_VERSION, started.size(), s.units_dir.string());

  int sig = signals.wait();
  spdlog::info("received signal {}; shutting down", sig);
  orch.shutdown(s.shutdown_timeout);

  for (const auto &name : orch.list()) {
    auto st = orch.status(name);
    if (st && st->state == SupervisedState::Failed)
      spdlog::warn("[unit={}] failed: {}", name, st->reason);
  }
  return 0;
}

int App::run(int argc, char **argv) {
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

  auto pr = parse_cli(argc, argv);
  if (!pr.cmd) {
    if (!pr.error.empty())
      spdlog::error("{}", pr.error);
    print_help();
    return pr.error.empty() ? 0 : 2;
  }

  return std::visit(
      [&](auto &&c) -> int {
        using T = std::decay_t<decltype(c)>;

        if constexpr (std::is_same_v<T, CmdHelp>) {
          print_help();
          return 0;

        } else if constexpr (std::is_same_v<T, CmdVersion>) {
          std::cout << fmt::format("tendrild {} (built {})\n", TENDRIL_VERSION,
                                   TENDRIL_BUILD_TIME);
          return 0;

        } else if constexpr (std::is_same_v<T, CmdRun>) {
          Settings s = make_settings(c.opts);
          if (c.shutdown_timeout_sec)
            s.shutdown_timeout = std::chrono::seconds(*c.shutdown_timeout_sec);
          setup_logging(s.log_file, s.verbose);
          return cmd_run(s);

        } else if constexpr (std::is_same_v<T, CmdCheck>) {
          Settings s = make_settings(c.opts);
          setup_logging(s.log_file, s.verbose);
          return cmd_check(s);

        } else {
          Settings s = make_settings(c.opts);
          setup_logging(s.log_file, s.verbose);
          return cmd_list(s, c.tag);
        }
      },
      *pr.cmd);
}

} // namespace tendril
