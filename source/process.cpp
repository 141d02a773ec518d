#include <tendril/caps.hpp>
#include <tendril/errors.hpp>
#include <tendril/io.hpp>
#include <tendril/process.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <thread>
#include <vector>

extern char **environ;

namespace fs = std::filesystem;

namespace tendril {

namespace {

// Что сломалось в дочернем процессе до exec.
enum class ChildStage : int { Chdir = 1, Privileges, Exec };

struct ChildError {
  ChildStage stage;
  int err;
};

const char *stage_name(ChildStage s) {
  switch (s) {
  case ChildStage::Chdir:
    return "chdir";
  case ChildStage::Privileges:
    return "drop privileges";
  case ChildStage::Exec:
    return "exec";
  }
  return "?";
}

int make_cloexec_pipe(int pfd[2]) {
#ifdef __linux__
  if (::pipe2(pfd, O_CLOEXEC) == 0)
    return 0;
#endif
  if (::pipe(pfd) != 0)
    return -1;
  ::fcntl(pfd[0], F_SETFD, ::fcntl(pfd[0], F_GETFD) | FD_CLOEXEC);
  ::fcntl(pfd[1], F_SETFD, ::fcntl(pfd[1], F_GETFD) | FD_CLOEXEC);
  return 0;
}

// parent environment with the unit's KEY=VALUE entries applied on top,
// then `extra` (hook variables such as MAINPID)
std::vector<std::string> build_env(const UnitInstance &u,
                                   const std::vector<std::string> &extra) {
  std::vector<std::string> out;
  for (char **e = environ; e && *e; ++e)
    out.emplace_back(*e);
  auto apply = [&](const std::string &kv) {
    auto eq = kv.find('=');
    if (eq == std::string::npos || eq == 0) {
      spdlog::warn("[unit={}] ignoring malformed env entry '{}'", u.name, kv);
      return;
    }
    auto prefix = kv.substr(0, eq + 1);
    for (auto &cur : out) {
      if (cur.compare(0, prefix.size(), prefix) == 0) {
        cur = kv;
        return;
      }
    }
    out.push_back(kv);
  };
  for (const auto &kv : u.env)
    apply(kv);
  for (const auto &kv : extra)
    apply(kv);
  return out;
}

void close_quiet(int fd) {
  if (fd >= 0)
    ::close(fd);
}

[[noreturn]] void child_fail(int fd, ChildStage stage) {
  ChildError ce{stage, errno};
  (void)!::write(fd, &ce, sizeof(ce));
  _exit(127);
}

// fork + exec of `args` under the unit's user, cwd, env and log files
pid_t launch(const UnitInstance &u, const std::vector<std::string> &args,
             const std::vector<std::string> &extra_env, const LogPolicy &logs,
             bool rotate) {
  const auto &name = u.name;

  std::optional<Credentials> cred;
  if (!u.user.empty()) {
    cred = lookup_user(u.user);
    if (!cred)
      throw SpawnFailed(name, "unknown user '" + u.user + "'");
  }

  const auto outp = ProcessRunner::stdout_path(u, logs);
  const auto errp = ProcessRunner::stderr_path(u, logs);

  int outfd = -1, errfd = -1, nullfd = -1;
  try {
    if (rotate) {
      io::rotate_logs(outp, logs.max_bytes, logs.backups);
      if (errp != outp)
        io::rotate_logs(errp, logs.max_bytes, logs.backups);
    }
    outfd = io::open_log(outp);
    errfd = errp == outp ? io::dup_cloexec(outfd) : io::open_log(errp);
  } catch (const std::exception &e) {
    close_quiet(outfd);
    close_quiet(errfd);
    throw SpawnFailed(name, fmt::format("log open failed: {}", e.what()));
  }
  nullfd = ::open("/dev/null", O_RDONLY | O_CLOEXEC);

  // всё, что нужно потомку, готовим до fork: после него malloc нельзя
  std::vector<std::string> envs = build_env(u, extra_env);
  std::vector<char *> envp;
  envp.reserve(envs.size() + 1);
  for (auto &s : envs)
    envp.push_back(const_cast<char *>(s.c_str()));
  envp.push_back(nullptr);

  std::vector<char *> argv;
  argv.reserve(args.size() + 1);
  for (auto &s : args)
    argv.push_back(const_cast<char *>(s.c_str()));
  argv.push_back(nullptr);

  int pfd[2];
  if (make_cloexec_pipe(pfd) != 0) {
    int err = errno;
    close_quiet(outfd);
    close_quiet(errfd);
    close_quiet(nullfd);
    throw SpawnFailed(name, fmt::format("pipe failed: {}", strerror(err)));
  }

  pid_t pid = ::fork();
  if (pid < 0) {
    int err = errno;
    close_quiet(outfd);
    close_quiet(errfd);
    close_quiet(nullfd);
    ::close(pfd[0]);
    ::close(pfd[1]);
    throw SpawnFailed(name, fmt::format("fork failed: {}", strerror(err)));
  }

  if (pid == 0) {
    ::close(pfd[0]);
    ::setpgid(0, 0);

    sigset_t none;
    sigemptyset(&none);
    ::sigprocmask(SIG_SETMASK, &none, nullptr);
    for (int sig : {SIGINT, SIGTERM, SIGHUP, SIGPIPE, SIGCHLD})
      ::signal(sig, SIG_DFL);

    if (!u.working_dir.empty() && ::chdir(u.working_dir.c_str()) != 0)
      child_fail(pfd[1], ChildStage::Chdir);
    if (cred && !drop_privileges(*cred))
      child_fail(pfd[1], ChildStage::Privileges);

    if (nullfd >= 0)
      ::dup2(nullfd, STDIN_FILENO);
    ::dup2(outfd, STDOUT_FILENO);
    ::dup2(errfd, STDERR_FILENO);

    ::execvpe(argv[0], argv.data(), envp.data());
    child_fail(pfd[1], ChildStage::Exec);
  }

  ::setpgid(pid, pid);
  close_quiet(outfd);
  close_quiet(errfd);
  close_quiet(nullfd);
  ::close(pfd[1]);

  ChildError ce{};
  ssize_t n;
  do {
    n = ::read(pfd[0], &ce, sizeof(ce));
  } while (n < 0 && errno == EINTR);
  ::close(pfd[0]);

  if (n > 0) {
    (void)ProcessRunner::reap(pid);
    throw SpawnFailed(name, fmt::format("{} failed: {}", stage_name(ce.stage),
                                        strerror(ce.err)));
  }
  return pid;
}

} // namespace


std::string ExitStatus::describe() const {
  if (signal)
    return fmt::format("killed by signal {} ({})", signal, ::strsignal(signal));
  return fmt::format("exit code {}", code);
}

fs::path ProcessRunner::stdout_path(const UnitInstance &u,
                                    const LogPolicy &logs) {
  if (!u.stdout_log.empty())
    return u.stdout_log;
  return logs.dir / (u.name + ".out");
}

fs::path ProcessRunner::stderr_path(const UnitInstance &u,
                                    const LogPolicy &logs) {
  if (!u.stderr_log.empty())
    return u.stderr_log;
  return logs.dir / (u.name + ".err");
}

pid_t ProcessRunner::spawn(const UnitInstance &u, const LogPolicy &logs) {
  if (u.command.empty())
    throw SpawnFailed(u.name, "empty command");

  std::vector<std::string> args;
  args.reserve(u.args.size() + 1);
  args.push_back(u.command);
  args.insert(args.end(), u.args.begin(), u.args.end());

  pid_t pid = launch(u, args, {}, logs, true);
  spdlog::info("[unit={}] started pid={} cmd={}", u.name, pid, u.command);
  return pid;
}

ExitStatus ProcessRunner::run_hook(const UnitInstance &u, const std::string &cmd,
                                   const LogPolicy &logs,
                                   std::chrono::milliseconds timeout,
                                   const std::vector<std::string> &extra_env) {
  pid_t pid = launch(u, {"/bin/sh", "-c", cmd}, extra_env, logs, false);

  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (auto st = try_reap(pid))
      return *st;
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  spdlog::warn("[unit={}] hook '{}' still running after {}ms; killing", u.name,
               cmd, timeout.count());
  signal_group(pid, SIGKILL);
  return reap(pid);
}

std::optional<ExitStatus> ProcessRunner::try_reap(pid_t pid) {
  int st = 0;
  pid_t r;
  do {
    r = ::waitpid(pid, &st, WNOHANG);
  } while (r < 0 && errno == EINTR);
  if (r == 0)
    return std::nullopt;
  if (r < 0) {
    // уже кто-то забрал статус
    spdlog::warn("waitpid({}) failed: {}", pid, strerror(errno));
    return ExitStatus{-1, 0};
  }
  if (WIFSIGNALED(st))
    return ExitStatus{0, WTERMSIG(st)};
  return ExitStatus{WIFEXITED(st) ? WEXITSTATUS(st) : -1, 0};
}

ExitStatus ProcessRunner::reap(pid_t pid) {
  int st = 0;
  pid_t r;
  do {
    r = ::waitpid(pid, &st, 0);
  } while (r < 0 && errno == EINTR);
  if (r < 0)
    return ExitStatus{-1, 0};
  if (WIFSIGNALED(st))
    return ExitStatus{0, WTERMSIG(st)};
  return ExitStatus{WIFEXITED(st) ? WEXITSTATUS(st) : -1, 0};
}

bool ProcessRunner::signal_group(pid_t pid, int sig) {
  if (pid <= 0)
    return false;
  if (::kill(-pid, sig) == 0)
    return true;
  return ::kill(pid, sig) == 0;
}

bool ProcessRunner::alive(pid_t pid) {
  if (pid <= 0)
    return false;
  return ::kill(pid, 0) == 0 || errno == EPERM;
}

} // namespace tendril
