#include <catch2/catch_all.hpp>
#include <tendril/errors.hpp>
#include <tendril/expander.hpp>

using namespace tendril;

static UnitDefinition tty_template() {
  UnitDefinition d;
  d.name = "tty@{}";
  d.description = "getty on {}";
  d.command = "/sbin/agetty";
  d.args = {"-L", "115200", "/dev/{}", "linux"};
  d.restart = RestartPolicy::Always;
  d.tags = {"console"};
  d.instances = {"tty1", "tty2"};
  return d;
}

TEST_CASE("plain unit expands to exactly one identical instance") {
  UnitDefinition d;
  d.name = "syslogd";
  d.description = "system log";
  d.command = "/sbin/syslogd";
  d.args = {"-n", "${LOGDIR}"};
  d.priority = 5;
  d.tags = {"base"};

  auto v = expand(d);
  REQUIRE(v.size() == 1);
  const auto &u = v[0];
  CHECK(u.name == d.name);
  CHECK(u.description == d.description);
  CHECK(u.command == d.command);
  CHECK(u.args == d.args);
  CHECK(u.priority == 5);
  CHECK(u.tags == d.tags);
  CHECK(u.instance_id.empty());
}

TEST_CASE("tty template expands per instance") {
  auto v = expand(tty_template());
  REQUIRE(v.size() == 2);

  CHECK(v[0].name == "tty@tty1");
  CHECK(v[0].description == "getty on tty1");
  CHECK(v[0].args == std::vector<std::string>{"-L", "115200", "/dev/tty1", "linux"});
  CHECK(v[0].instance_id == "tty1");

  CHECK(v[1].name == "tty@tty2");
  CHECK(v[1].args == std::vector<std::string>{"-L", "115200", "/dev/tty2", "linux"});
  CHECK(v[1].restart == RestartPolicy::Always);
  CHECK(v[1].tags.count("console") == 1);
}

TEST_CASE("k instances produce k fully substituted instances") {
  auto d = tty_template();
  d.name = "worker-{id}";
  d.description = "{} / {id} / {}";
  d.args = {"--id={id}", "{}{}", "plain"};
  d.instances = {"a", "b", "c", "d"};

  auto v = expand(d);
  REQUIRE(v.size() == 4);
  for (size_t i = 0; i < v.size(); ++i) {
    const auto &id = d.instances[i];
    CHECK(v[i].name == "worker-" + id);
    CHECK(v[i].description == id + " / " + id + " / " + id);
    CHECK(v[i].args[0] == "--id=" + id);
    CHECK(v[i].args[1] == id + id);
    CHECK(v[i].args[2] == "plain");
    CHECK_FALSE(has_placeholder(v[i].name));
  }
}

TEST_CASE("expansion is idempotent") {
  auto d = tty_template();
  CHECK(expand(d) == expand(d));
}

TEST_CASE("shell variables are not placeholders") {
  CHECK(substitute("${HOME}/{}", "x") == "${HOME}/x");
  CHECK_FALSE(has_placeholder("${id}"));
  CHECK(has_placeholder("a{id}b"));
  CHECK(has_placeholder("{}"));
  CHECK_FALSE(has_placeholder("{ }"));
}

TEST_CASE("bare {} in a plain unit passes through untouched") {
  UnitDefinition d;
  d.name = "cleaner";
  d.command = "/usr/bin/find";
  d.args = {"/tmp", "-name", "*.tmp", "-exec", "rm", "{}", ";"};

  auto v = expand(d);
  REQUIRE(v.size() == 1);
  CHECK(v[0].name == "cleaner");
  CHECK(v[0].args == d.args);
  CHECK(v[0].instance_id.empty());

  UnitDefinition x;
  x.name = "fanout-{}";
  x.command = "/usr/bin/xargs";
  x.args = {"-I{}", "echo", "{}"};
  v = expand(x);
  REQUIRE(v.size() == 1);
  CHECK(v[0].name == "fanout-{}");
  CHECK(v[0].args == x.args);
}

TEST_CASE("invalid templates are rejected") {
  SECTION("{id} in the name without instances") {
    UnitDefinition d;
    d.name = "getty@{id}";
    d.command = "/sbin/agetty";
    CHECK_THROWS_AS(expand(d), InvalidTemplate);
  }
  SECTION("named placeholder without instances") {
    UnitDefinition d;
    d.name = "getty";
    d.command = "/sbin/agetty";
    d.args = {"/dev/{id}"};
    CHECK_THROWS_AS(expand(d), InvalidTemplate);
  }
  SECTION("unknown named token") {
    auto d = tty_template();
    d.args.push_back("--port={port}");
    CHECK_THROWS_AS(expand(d), InvalidTemplate);
  }
  SECTION("instances but no placeholder in name") {
    auto d = tty_template();
    d.name = "tty";
    CHECK_THROWS_AS(expand(d), InvalidTemplate);
  }
  SECTION("instance listed twice") {
    auto d = tty_template();
    d.instances = {"tty1", "tty1"};
    CHECK_THROWS_AS(expand(d), InvalidTemplate);
  }
  SECTION("empty instance id") {
    auto d = tty_template();
    d.instances = {"tty1", ""};
    CHECK_THROWS_AS(expand(d), InvalidTemplate);
  }
}

TEST_CASE("expand_all isolates broken units") {
  UnitDefinition ok;
  ok.name = "cron";
  ok.command = "/usr/sbin/cron";

  UnitDefinition bad;
  bad.name = "bad@{id}";
  bad.command = "/bin/true";

  auto ex = expand_all({ok, bad, tty_template()});
  REQUIRE(ex.instances.size() == 3);
  CHECK(ex.instances[0].name == "cron");
  CHECK(ex.instances[1].name == "tty@tty1");
  CHECK(ex.instances[2].name == "tty@tty2");
  REQUIRE(ex.failures.size() == 1);
  CHECK(ex.failures[0].name == "bad@{id}");
  CHECK_FALSE(ex.failures[0].reason.empty());
}

TEST_CASE("expand_all rejects duplicate resolved names") {
  auto a = tty_template();
  UnitDefinition b;
  b.name = "tty@tty2";
  b.command = "/bin/true";
  CHECK_THROWS_AS(expand_all({a, b}), DuplicateName);

  try {
    expand_all({a, b});
  } catch (const DuplicateName &e) {
    CHECK(e.name() == "tty@tty2");
  }
}
