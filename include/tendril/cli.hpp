#pragma once
#include <optional>
#include <string>
#include <variant>

namespace tendril {

struct CommonOpts {
  std::optional<std::string> units_dir;
  std::optional<std::string> log_dir;
  std::optional<std::string> log_file;
  bool verbose = false;
};

struct CmdRun {
  CommonOpts opts;
  std::optional<int> shutdown_timeout_sec;
};
struct CmdCheck {
  CommonOpts opts;
};
struct CmdList {
  CommonOpts opts;
  std::optional<std::string> tag;
};

struct CmdHelp {};
struct CmdVersion {};

using Command = std::variant<CmdRun, CmdCheck, CmdList, CmdHelp, CmdVersion>;

struct ParseResult {
  std::optional<Command> cmd;
  std::string error;
};

ParseResult parse_cli(int argc, char **argv);

} // namespace tendril
