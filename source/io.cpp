#include <fcntl.h>
#include <filesystem>
#include <tendril/io.hpp>
#include <stdexcept>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace tendril {
namespace io {

void ensure_dir(const fs::path &p) {
  if (p.empty())
    return;
  std::error_code ec;
  if (!fs::exists(p, ec))
    fs::create_directories(p);
}

void rotate_logs(const fs::path &base_path, std::uintmax_t max_bytes,
                 int backups) {
  std::error_code ec;
  if (backups < 1 || !fs::exists(base_path, ec))
    return;
  auto sz = fs::file_size(base_path, ec);
  if (ec || sz < max_bytes)
    return;

  fs::path oldest = base_path;
  oldest += "." + std::to_string(backups);
  fs::remove(oldest, ec);

  for (int i = backups - 1; i >= 1; --i) {
    fs::path src = base_path;
    src += "." + std::to_string(i);
    fs::path dst = base_path;
    dst += "." + std::to_string(i + 1);
    std::error_code e2;
    if (fs::exists(src, e2))
      fs::rename(src, dst, e2);
  }
  fs::path first = base_path;
  first += ".1";
  fs::rename(base_path, first, ec);
  int fd = ::open(base_path.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0644);
  if (fd >= 0)
    ::close(fd);
}

int open_log(const fs::path &path) {
  ensure_dir(path.parent_path());
  int fd = ::open(path.c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC, 0644);
  if (fd < 0)
    throw std::runtime_error("open: " + path.string());
  return fd;
}

int dup_cloexec(int fd) {
  int nfd = ::fcntl(fd, F_DUPFD_CLOEXEC, 0);
  if (nfd < 0)
    throw std::runtime_error("dup: fd " + std::to_string(fd));
  return nfd;
}

} // namespace io
} // namespace tendril
