#include <catch2/catch_all.hpp>
#include <tendril/errors.hpp>
#include <tendril/process.hpp>
#include <tendril/unit.hpp>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <thread>
#include <chrono>

#include <signal.h>
#include <unistd.h>

using namespace tendril;
namespace fs = std::filesystem;
using namespace std::chrono_literals;

static fs::path mkd(const char* name){
  auto d = fs::temp_directory_path() / (std::string("tendril_proc_")+name);
  fs::remove_all(d);
  fs::create_directories(d);
  return d;
}

static std::string slurp(const fs::path& p){
  std::ifstream in(p);
  return std::string(std::istreambuf_iterator<char>(in), {});
}

static UnitInstance make_unit(const std::string& name, const std::string& cmd,
                              std::vector<std::string> args = {}){
  UnitInstance u;
  u.name = name;
  u.command = cmd;
  u.args = std::move(args);
  return u;
}

TEST_CASE("spawn sleep, then stop it via its process group") {
  auto dir = mkd("sleep");
  LogPolicy logs; logs.dir = dir / "logs";

  auto u = make_unit("sleeper", "/bin/sleep", {"30"});
  pid_t pid = ProcessRunner::spawn(u, logs);
  REQUIRE(pid > 0);
  CHECK(ProcessRunner::alive(pid));
  CHECK_FALSE(ProcessRunner::try_reap(pid).has_value());

  // потомок живёт в собственной группе процессов
  CHECK(::getpgid(pid) == pid);

  REQUIRE(ProcessRunner::signal_group(pid, SIGTERM));
  auto st = ProcessRunner::reap(pid);
  CHECK(st.signal == SIGTERM);
  CHECK_FALSE(st.success());
  CHECK(st.as_code() == 128 + SIGTERM);
}

TEST_CASE("exit code is captured") {
  auto dir = mkd("exit");
  LogPolicy logs; logs.dir = dir / "logs";

  auto u = make_unit("exit3", "/bin/sh", {"-c", "exit 3"});
  pid_t pid = ProcessRunner::spawn(u, logs);
  auto st = ProcessRunner::reap(pid);
  CHECK(st.code == 3);
  CHECK(st.signal == 0);
  CHECK(st.describe() == "exit code 3");

  auto ok = make_unit("true", "/bin/true");
  CHECK(ProcessRunner::reap(ProcessRunner::spawn(ok, logs)).success());
}

TEST_CASE("missing executable is a spawn failure") {
  auto dir = mkd("missing");
  LogPolicy logs; logs.dir = dir / "logs";

  auto u = make_unit("ghost", "/nonexistent/tendril-ghost");
  CHECK_THROWS_AS(ProcessRunner::spawn(u, logs), SpawnFailed);

  auto empty = make_unit("empty", "");
  CHECK_THROWS_AS(ProcessRunner::spawn(empty, logs), SpawnFailed);

  auto badcwd = make_unit("badcwd", "/bin/true");
  badcwd.working_dir = "/nonexistent/tendril-dir";
  CHECK_THROWS_AS(ProcessRunner::spawn(badcwd, logs), SpawnFailed);
}

TEST_CASE("stdout and stderr go to per-unit log files") {
  auto dir = mkd("logs");
  LogPolicy logs; logs.dir = dir / "logs";

  auto u = make_unit("echo", "/bin/sh", {"-c", "echo out; echo err 1>&2"});
  auto st = ProcessRunner::reap(ProcessRunner::spawn(u, logs));
  REQUIRE(st.success());

  CHECK(ProcessRunner::stdout_path(u, logs) == logs.dir / "echo.out");
  CHECK(ProcessRunner::stderr_path(u, logs) == logs.dir / "echo.err");
  CHECK(slurp(logs.dir / "echo.out") == "out\n");
  CHECK(slurp(logs.dir / "echo.err") == "err\n");

  // повторный запуск дописывает в конец
  ProcessRunner::reap(ProcessRunner::spawn(u, logs));
  CHECK(slurp(logs.dir / "echo.out") == "out\nout\n");
}

TEST_CASE("explicit log path is shared by both streams") {
  auto dir = mkd("shared");
  LogPolicy logs; logs.dir = dir / "logs";

  auto u = make_unit("both", "/bin/sh", {"-c", "echo a; echo b 1>&2"});
  u.stdout_log = (dir / "both.log").string();
  u.stderr_log = u.stdout_log;
  ProcessRunner::reap(ProcessRunner::spawn(u, logs));

  auto text = slurp(dir / "both.log");
  CHECK(text.find("a\n") != std::string::npos);
  CHECK(text.find("b\n") != std::string::npos);
}

TEST_CASE("working directory and environment are applied") {
  auto dir = mkd("env");
  LogPolicy logs; logs.dir = dir / "logs";

  auto u = make_unit("env", "/bin/sh", {"-c", "pwd; echo $GREETING"});
  u.working_dir = dir.string();
  u.env = {"GREETING=hello", "broken"};
  auto st = ProcessRunner::reap(ProcessRunner::spawn(u, logs));
  REQUIRE(st.success());

  auto out = slurp(logs.dir / "env.out");
  CHECK(out == fs::canonical(dir).string() + "\nhello\n");
}

TEST_CASE("unknown user is a spawn failure") {
  auto dir = mkd("user");
  LogPolicy logs; logs.dir = dir / "logs";

  auto u = make_unit("who", "/bin/true");
  u.user = "tendril-no-such-user";
  CHECK_THROWS_AS(ProcessRunner::spawn(u, logs), SpawnFailed);
}

TEST_CASE("hooks run through sh with the unit's env and logs") {
  auto dir = mkd("hook");
  LogPolicy logs; logs.dir = dir / "logs";

  auto u = make_unit("hooked", "/bin/true");
  u.env = {"STAGE=pre"};
  auto st = ProcessRunner::run_hook(u, "echo $STAGE $MAINPID; exit 5", logs, 5s,
                                    {"MAINPID=42"});
  CHECK(st.code == 5);
  CHECK(slurp(logs.dir / "hooked.out") == "pre 42\n");
}

TEST_CASE("hook that outlives its timeout is killed") {
  auto dir = mkd("hooktimeout");
  LogPolicy logs; logs.dir = dir / "logs";

  auto u = make_unit("slowhook", "/bin/true");
  auto t0 = std::chrono::steady_clock::now();
  auto st = ProcessRunner::run_hook(u, "sleep 30", logs, 300ms);
  CHECK(st.signal == SIGKILL);
  CHECK(std::chrono::steady_clock::now() - t0 < 5s);
}
