#include <cstdlib>
#include <tendril/cli.hpp>
#include <string_view>

namespace tendril {

static bool has_arg(int i, int argc) { return i + 1 < argc; }

// --units/--log-dir/--log-file/--verbose; false if argv[i] is not one of them
static bool parse_common(int &i, int argc, char **argv, CommonOpts &o) {
  std::string_view a = argv[i];
  if ((a == "--units" || a == "-u") && has_arg(i, argc)) {
    o.units_dir = argv[++i];
  } else if (a == "--log-dir" && has_arg(i, argc)) {
    o.log_dir = argv[++i];
  } else if (a == "--log-file" && has_arg(i, argc)) {
    o.log_file = argv[++i];
  } else if (a == "--verbose" || a == "-v") {
    o.verbose = true;
  } else {
    return false;
  }
  return true;
}

static bool parse_seconds(const char *s, int &out) {
  char *end = nullptr;
  long v = std::strtol(s, &end, 10);
  if (end == s || *end != '\0' || v < 0)
    return false;
  out = static_cast<int>(v);
  return true;
}

ParseResult parse_cli(int argc, char **argv) {
  ParseResult r{};
  if (argc < 2) {
    r.cmd = CmdHelp{};
    return r;
  }

  std::string cmd = argv[1];
  if (cmd == "--help" || cmd == "-h" || cmd == "help") {
    r.cmd = CmdHelp{};
    return r;
  }
  if (cmd == "--version" || cmd == "version") {
    r.cmd = CmdVersion{};
    return r;
  }

  if (cmd == "run") {
    CmdRun c{};
    for (int i = 2; i < argc; i++) {
      if (parse_common(i, argc, argv, c.opts))
        continue;
      std::string_view a = argv[i];
      if (a == "--shutdown-timeout" && has_arg(i, argc)) {
        int sec = 0;
        if (!parse_seconds(argv[++i], sec)) {
          r.error = "run: --shutdown-timeout expects seconds";
          return r;
        }
        c.shutdown_timeout_sec = sec;
      } else {
        r.error = "run: unknown argument: " + std::string(a);
        return r;
      }
    }
    r.cmd = c;
    return r;
  }

  if (cmd == "check") {
    CmdCheck c{};
    for (int i = 2; i < argc; i++) {
      if (!parse_common(i, argc, argv, c.opts)) {
        r.error = "check: unknown argument: " + std::string(argv[i]);
        return r;
      }
    }
    r.cmd = c;
    return r;
  }

  if (cmd == "list") {
    CmdList c{};
    for (int i = 2; i < argc; i++) {
      if (parse_common(i, argc, argv, c.opts))
        continue;
      std::string_view a = argv[i];
      if ((a == "--tag" || a == "-t") && has_arg(i, argc)) {
        c.tag = argv[++i];
      } else {
        r.error = "list: unknown argument: " + std::string(a);
        return r;
      }
    }
    r.cmd = c;
    return r;
  }

  r.error = "unknown command: " + cmd;
  return r;
}

} // namespace tendril
