#include <tendril/settings.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <string>

namespace tendril {

static const char *env(const char *name) {
  const char *v = ::getenv(name);
  return (v && *v) ? v : nullptr;
}

static std::optional<long> env_number(const char *name) {
  const char *v = env(name);
  if (!v)
    return std::nullopt;
  char *end = nullptr;
  long n = std::strtol(v, &end, 10);
  if (end == v || *end != '\0' || n < 0) {
    spdlog::warn("ignoring {}='{}': not a non-negative number", name, v);
    return std::nullopt;
  }
  return n;
}

Settings Settings::from_env() {
  Settings s;
  if (const char *v = env("TENDRIL_UNITS_DIR"))
    s.units_dir = v;
  if (const char *v = env("TENDRIL_LOG_DIR"))
    s.log_dir = v;
  if (const char *v = env("TENDRIL_LOG_FILE"))
    s.log_file = std::filesystem::path(v);
  if (auto n = env_number("TENDRIL_LOG_MAX_MB"))
    s.child_log_max_mb = static_cast<std::uintmax_t>(*n);
  if (auto n = env_number("TENDRIL_SHUTDOWN_TIMEOUT_SEC"))
    s.shutdown_timeout = std::chrono::seconds(*n);
  return s;
}

LogPolicy Settings::child_logs() const {
  LogPolicy p;
  p.dir = log_dir;
  p.max_bytes = child_log_max_mb * 1024 * 1024;
  p.backups = child_log_backups;
  return p;
}

} // namespace tendril
