#include <tendril/errors.hpp>
#include <tendril/loader.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <optional>
#include <sstream>

namespace fs = std::filesystem;

namespace tendril {

static std::string trim(std::string s) {
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t' ||
                        s.back() == '\r' || s.back() == '\n'))
    s.pop_back();
  size_t i = 0;
  while (i < s.size() && (s[i] == ' ' || s[i] == '\t'))
    ++i;
  return s.substr(i);
}

// whitespace split with '...' / "..." quoting and backslash escapes
static std::vector<std::string> split_cmd(const std::string &s) {
  std::vector<std::string> out;
  std::string cur;
  bool in_single = false, in_double = false, esc = false, quoted = false;
  for (char c : s) {
    if (esc) {
      cur.push_back(c);
      esc = false;
      continue;
    }
    if (c == '\\' && !in_single) {
      esc = true;
      continue;
    }
    if (c == '\'' && !in_double) {
      in_single = !in_single;
      quoted = true;
      continue;
    }
    if (c == '"' && !in_single) {
      in_double = !in_double;
      quoted = true;
      continue;
    }
    if (!in_single && !in_double && (c == ' ' || c == '\t')) {
      if (!cur.empty() || quoted) {
        out.push_back(cur);
        cur.clear();
        quoted = false;
      }
      continue;
    }
    cur.push_back(c);
  }
  if (!cur.empty() || quoted)
    out.push_back(cur);
  return out;
}

// "a, b c" / "[a, b]"
static std::vector<std::string> split_names(std::string s) {
  s = trim(s);
  if (s.size() >= 2 && s.front() == '[' && s.back() == ']')
    s = s.substr(1, s.size() - 2);
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == ',' || c == ' ' || c == '\t') {
      if (!cur.empty()) {
        out.push_back(cur);
        cur.clear();
      }
      continue;
    }
    cur.push_back(c);
  }
  if (!cur.empty())
    out.push_back(cur);
  return out;
}

static int parse_int(const std::string &key, const std::string &v) {
  try {
    size_t used = 0;
    int n = std::stoi(v, &used);
    if (used != v.size())
      throw std::invalid_argument(v);
    return n;
  } catch (const std::exception &) {
    throw UnitFileError(fmt::format("{}: not an integer: '{}'", key, v));
  }
}

RestartPolicy parse_restart(std::string v) {
  for (auto &ch : v)
    ch = (char)std::tolower((unsigned char)ch);
  if (v == "always")
    return RestartPolicy::Always;
  if (v == "on-failure" || v == "onfailure")
    return RestartPolicy::OnFailure;
  if (v == "never" || v == "no" || v == "false" || v == "0")
    return RestartPolicy::Never;
  spdlog::warn("Unknown restart policy '{}', falling back to 'never'", v);
  return RestartPolicy::Never;
}

std::chrono::milliseconds parse_duration(const std::string &raw) {
  std::string v = trim(raw);
  long long scale = 1000;
  if (v.size() > 2 && v.compare(v.size() - 2, 2, "ms") == 0) {
    scale = 1;
    v.resize(v.size() - 2);
  } else if (v.size() > 1 && v.back() == 's') {
    v.pop_back();
  }
  int n = parse_int("duration", v);
  if (n < 0)
    throw UnitFileError(fmt::format("negative duration: '{}'", raw));
  return std::chrono::milliseconds(static_cast<long long>(n) * scale);
}

static bool is_list_key(const std::string &k) {
  return k == "args" || k == "tags" || k == "instances" || k == "env" ||
         k == "dependencies";
}

static void add_list_item(UnitDefinition &u, const std::string &key,
                          const std::string &item) {
  if (item.empty())
    return;
  if (key == "args")
    u.args.push_back(item);
  else if (key == "tags")
    u.tags.insert(item);
  else if (key == "instances")
    u.instances.push_back(item);
  else if (key == "env")
    u.env.push_back(item);
  else if (key == "dependencies")
    u.dependencies.push_back(item);
}

UnitDefinition parse_unit(const std::string &content, const fs::path &source) {
  UnitDefinition u;
  u.source = source;

  std::istringstream in(content);
  std::optional<std::string> list_key;
  std::string raw;
  int lineno = 0;
  while (std::getline(in, raw)) {
    ++lineno;
    auto line = trim(raw);
    if (line.empty() || line[0] == '#')
      continue;

    // "  - item" after a list key
    if (raw[0] == ' ' || raw[0] == '\t') {
      if (!list_key) {
        spdlog::debug("{}:{}: stray indented line ignored", source.string(),
                      lineno);
        continue;
      }
      std::string item = line;
      if (!item.empty() && item[0] == '-')
        item = trim(item.substr(1));
      add_list_item(u, *list_key, item);
      continue;
    }

    auto colon = line.find(':');
    if (colon == std::string::npos) {
      spdlog::debug("{}:{}: line without ':' ignored", source.string(), lineno);
      list_key.reset();
      continue;
    }
    auto key = trim(line.substr(0, colon));
    auto val = trim(line.substr(colon + 1));
    list_key.reset();
    if (is_list_key(key))
      list_key = key;

    if (key == "name") {
      u.name = val;
    } else if (key == "desc" || key == "description") {
      u.description = val;
    } else if (key == "cmd") {
      u.command = val;
    } else if (key == "args") {
      for (auto &a : split_cmd(val))
        u.args.push_back(std::move(a));
    } else if (key == "env") {
      for (auto &e : split_cmd(val))
        u.env.push_back(std::move(e));
    } else if (key == "tags") {
      for (auto &t : split_names(val))
        u.tags.insert(std::move(t));
    } else if (key == "instances") {
      for (auto &i : split_names(val))
        u.instances.push_back(std::move(i));
    } else if (key == "dependencies") {
      for (auto &d : split_names(val))
        u.dependencies.push_back(std::move(d));
    } else if (key == "pre-cmd") {
      u.pre_cmd = val;
    } else if (key == "post-cmd") {
      u.post_cmd = val;
    } else if (key == "stop-cmd") {
      u.stop_cmd = val;
    } else if (key == "restart") {
      u.restart = parse_restart(val);
    } else if (key == "restart-delay") {
      u.restart_delay = parse_duration(val);
    } else if (key == "priority") {
      u.priority = parse_int(key, val);
    } else if (key == "working-dir") {
      u.working_dir = val;
    } else if (key == "user") {
      u.user = val;
    } else if (key == "stdout-log") {
      u.stdout_log = val;
    } else if (key == "stderr-log") {
      u.stderr_log = val;
    } else if (key == "timeout-stop") {
      u.stop_timeout = parse_duration(val);
    } else if (key == "max-restarts") {
      int n = parse_int(key, val);
      if (n < 0)
        throw UnitFileError("max-restarts must be >= 0");
      u.max_restarts = n;
    } else {
      spdlog::debug("{}:{}: unknown key '{}'", source.string(), lineno, key);
    }
  }

  if (u.name.empty())
    throw UnitFileError(fmt::format("{}: 'name' is required", source.string()));
  if (u.command.empty())
    throw UnitFileError(fmt::format("{}: 'cmd' is required", source.string()));
  return u;
}

UnitDefinition load_unit_file(const fs::path &p) {
  std::ifstream in(p);
  if (!in)
    throw UnitFileError("Unit file not found: " + p.string());
  std::stringstream ss;
  ss << in.rdbuf();
  return parse_unit(ss.str(), fs::absolute(p));
}

LoadResult load_directory(const fs::path &dir) {
  LoadResult r;
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    spdlog::warn("units directory not found: {}", dir.string());
    return r;
  }

  std::vector<fs::path> files;
  for (auto &e : fs::directory_iterator(dir, ec)) {
    if (e.is_regular_file() && e.path().extension() == ".unit")
      files.push_back(e.path());
  }
  std::sort(files.begin(), files.end());

  for (const auto &f : files) {
    try {
      r.units.push_back(load_unit_file(f));
    } catch (const UnitFileError &e) {
      spdlog::error("failed to parse unit file {}: {}", f.string(), e.what());
      r.failures.push_back({f.stem().string(), e.what()});
    }
  }
  spdlog::info("parsed {} unit file(s) from {}", r.units.size(), dir.string());
  return r;
}

} // namespace tendril
