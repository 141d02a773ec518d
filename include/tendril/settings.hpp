#pragma once
#include <tendril/process.hpp>

#include <chrono>
#include <filesystem>
#include <optional>

namespace tendril {

struct Settings {
  std::filesystem::path units_dir{"/etc/tendril/units"};
  std::filesystem::path log_dir{"/var/log/tendril"};
  std::optional<std::filesystem::path> log_file;
  std::uintmax_t child_log_max_mb{5};
  int child_log_backups{3};
  std::chrono::milliseconds shutdown_timeout{std::chrono::seconds(10)};
  bool verbose{false};

  // Defaults overridden by TENDRIL_* environment variables.
  static Settings from_env();

  LogPolicy child_logs() const;
};

} // namespace tendril
