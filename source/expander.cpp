#include <tendril/errors.hpp>
#include <tendril/expander.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cctype>
#include <functional>
#include <unordered_set>

namespace tendril {

static bool is_token_char(char c, bool first) {
  if (std::isalpha(static_cast<unsigned char>(c)) || c == '_')
    return true;
  return !first && (std::isdigit(static_cast<unsigned char>(c)) || c == '-');
}

// Length of a `{...}` token starting at s[pos], or 0. `${VAR}` is not a token.
static size_t token_len(const std::string &s, size_t pos) {
  if (s[pos] != '{')
    return 0;
  if (pos > 0 && s[pos - 1] == '$')
    return 0;
  size_t i = pos + 1;
  while (i < s.size() && s[i] != '}') {
    if (!is_token_char(s[i], i == pos + 1))
      return 0;
    ++i;
  }
  if (i >= s.size())
    return 0;
  return i - pos + 1;
}

static std::vector<std::string> tokens_in(const std::string &s) {
  std::vector<std::string> out;
  for (size_t i = 0; i < s.size(); ++i) {
    if (size_t n = token_len(s, i)) {
      out.push_back(s.substr(i + 1, n - 2));
      i += n - 1;
    }
  }
  return out;
}

static bool is_placeholder(const std::string &tok) {
  return tok.empty() || tok == "id";
}

bool has_placeholder(const std::string &s) {
  for (const auto &t : tokens_in(s))
    if (is_placeholder(t))
      return true;
  return false;
}

std::string substitute(const std::string &s, const std::string &id) {
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    size_t n = token_len(s, i);
    if (n && is_placeholder(s.substr(i + 1, n - 2))) {
      out += id;
      i += n - 1;
      continue;
    }
    out.push_back(s[i]);
  }
  return out;
}

static std::vector<const std::string *> template_fields(const UnitDefinition &d) {
  std::vector<const std::string *> f{&d.name,       &d.description,
                                     &d.command,    &d.working_dir,
                                     &d.user,       &d.stdout_log,
                                     &d.stderr_log, &d.pre_cmd,
                                     &d.post_cmd,   &d.stop_cmd};
  for (const auto &a : d.args)
    f.push_back(&a);
  for (const auto &e : d.env)
    f.push_back(&e);
  for (const auto &dep : d.dependencies)
    f.push_back(&dep);
  return f;
}

static UnitInstance
make_instance(const UnitDefinition &d, const std::string &id,
              const std::function<std::string(const std::string &)> &sub) {
  UnitInstance u;
  u.name = sub(d.name);
  u.description = sub(d.description);
  u.command = sub(d.command);
  u.args.reserve(d.args.size());
  for (const auto &a : d.args)
    u.args.push_back(sub(a));
  u.instance_id = id;

  u.restart = d.restart;
  u.restart_delay = d.restart_delay;
  u.priority = d.priority;
  u.tags = d.tags;

  for (const auto &e : d.env)
    u.env.push_back(sub(e));
  u.working_dir = sub(d.working_dir);
  u.user = sub(d.user);
  u.stdout_log = sub(d.stdout_log);
  u.stderr_log = sub(d.stderr_log);
  u.stop_timeout = d.stop_timeout;
  u.max_restarts = d.max_restarts;

  for (const auto &dep : d.dependencies)
    u.dependencies.push_back(sub(dep));
  u.pre_cmd = sub(d.pre_cmd);
  u.post_cmd = sub(d.post_cmd);
  u.stop_cmd = sub(d.stop_cmd);
  return u;
}

std::vector<UnitInstance> expand(const UnitDefinition &def) {
  for (const auto *field : template_fields(def)) {
    for (const auto &tok : tokens_in(*field)) {
      if (!is_placeholder(tok))
        throw InvalidTemplate(
            def.name, fmt::format("no substitution defined for '{{{}}}'", tok));
      // без instances голый {} остаётся как есть (find -exec ... {} ;)
      if (def.instances.empty() && !tok.empty())
        throw InvalidTemplate(
            def.name, fmt::format("placeholder '{{{}}}' used but no instances "
                                  "declared",
                                  tok));
    }
  }

  if (def.instances.empty()) {
    return {make_instance(def, "", [](const std::string &s) { return s; })};
  }

  if (!has_placeholder(def.name))
    throw InvalidTemplate(def.name,
                          "instances declared but name has no placeholder");

  std::unordered_set<std::string> ids;
  std::vector<UnitInstance> out;
  out.reserve(def.instances.size());
  for (const auto &id : def.instances) {
    if (id.empty())
      throw InvalidTemplate(def.name, "empty instance id");
    if (!ids.insert(id).second)
      throw InvalidTemplate(def.name,
                            fmt::format("instance '{}' listed twice", id));
    out.push_back(make_instance(
        def, id, [&id](const std::string &s) { return substitute(s, id); }));
  }
  return out;
}

Expansion expand_all(const std::vector<UnitDefinition> &defs) {
  Expansion ex;
  for (const auto &d : defs) {
    try {
      auto v = expand(d);
      for (auto &u : v)
        ex.instances.push_back(std::move(u));
    } catch (const InvalidTemplate &e) {
      spdlog::error("[unit={}] {}", d.name, e.what());
      ex.failures.push_back({d.name, e.what()});
    }
  }

  std::unordered_set<std::string> seen;
  for (const auto &u : ex.instances) {
    if (!seen.insert(u.name).second)
      throw DuplicateName(u.name);
  }
  return ex;
}

} // namespace tendril
