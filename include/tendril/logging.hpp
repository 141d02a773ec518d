#pragma once
#include <filesystem>
#include <optional>

namespace tendril {

// Colored console sink, plus a rotating file sink when log_file is set.
void setup_logging(const std::optional<std::filesystem::path> &log_file,
                   bool verbose);

} // namespace tendril
