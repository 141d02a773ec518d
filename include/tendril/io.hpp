#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

namespace tendril {
namespace io {
  void ensure_dir(const std::filesystem::path& p);

  // O_APPEND, 0644; throws std::runtime_error.
  int  open_log(const std::filesystem::path& path);

  // dup() with FD_CLOEXEC set atomically; throws std::runtime_error.
  int  dup_cloexec(int fd);

  // base -> base.1 -> ... -> base.<backups> once base reaches max_bytes
  void rotate_logs(const std::filesystem::path& base_path,
                   std::uintmax_t max_bytes,
                   int backups);
}
} // namespace tendril
