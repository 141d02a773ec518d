#include <tendril/io.hpp>
#include <tendril/logging.hpp>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <vector>

namespace tendril {

static constexpr std::size_t kLogRotateMax = 10 * 1024 * 1024;
static constexpr std::size_t kLogRotateFiles = 3;

void setup_logging(const std::optional<std::filesystem::path> &log_file,
                   bool verbose) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

  if (log_file) {
    try {
      io::ensure_dir(log_file->parent_path());
      sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          log_file->string(), kLogRotateMax, kLogRotateFiles));
    } catch (const std::exception &e) {
      spdlog::warn("failed to open log file {}: {}; console only",
                   log_file->string(), e.what());
    }
  }

  auto logger =
      std::make_shared<spdlog::logger>("tendril", sinks.begin(), sinks.end());
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
  spdlog::flush_on(spdlog::level::warn);
}

} // namespace tendril
