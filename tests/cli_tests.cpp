#include <catch2/catch_all.hpp>
#include <tendril/app.hpp>
#include <tendril/cli.hpp>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace tendril;
namespace fs = std::filesystem;

static fs::path mkd(const char* name){
  auto d = fs::temp_directory_path() / (std::string("tendril_cli_")+name);
  fs::remove_all(d);
  fs::create_directories(d);
  return d;
}

static void write(const fs::path& p, const std::string& body){
  std::ofstream o(p);
  o << body;
}

// argv из строк; живёт, пока жив объект
struct Args {
  std::vector<std::string> store;
  std::vector<char*> ptrs;

  Args(std::initializer_list<std::string> a) : store(a) {
    for (auto& s : store)
      ptrs.push_back(s.data());
    ptrs.push_back(nullptr);
  }
  Args(const Args&) = delete;
  int argc() const { return static_cast<int>(store.size()); }
  char** argv() { return ptrs.data(); }
};

static ParseResult parse(Args a){
  return parse_cli(a.argc(), a.argv());
}

TEST_CASE("no arguments and help flags mean help") {
  auto r = parse({"tendrild"});
  REQUIRE(r.cmd);
  CHECK(std::holds_alternative<CmdHelp>(*r.cmd));

  r = parse({"tendrild", "--help"});
  REQUIRE(r.cmd);
  CHECK(std::holds_alternative<CmdHelp>(*r.cmd));

  r = parse({"tendrild", "version"});
  REQUIRE(r.cmd);
  CHECK(std::holds_alternative<CmdVersion>(*r.cmd));
}

TEST_CASE("run options") {
  auto r = parse({"tendrild", "run", "--units", "/srv/units", "--log-dir", "/tmp/l",
                  "--log-file", "/tmp/d.log", "-v", "--shutdown-timeout", "3"});
  REQUIRE(r.cmd);
  REQUIRE(std::holds_alternative<CmdRun>(*r.cmd));
  auto& c = std::get<CmdRun>(*r.cmd);
  CHECK(c.opts.units_dir == std::optional<std::string>("/srv/units"));
  CHECK(c.opts.log_dir == std::optional<std::string>("/tmp/l"));
  CHECK(c.opts.log_file == std::optional<std::string>("/tmp/d.log"));
  CHECK(c.opts.verbose);
  CHECK(c.shutdown_timeout_sec == std::optional<int>(3));
}

TEST_CASE("list with tag and check") {
  auto r = parse({"tendrild", "list", "-u", "/u", "--tag", "console"});
  REQUIRE(r.cmd);
  REQUIRE(std::holds_alternative<CmdList>(*r.cmd));
  CHECK(std::get<CmdList>(*r.cmd).tag == std::optional<std::string>("console"));
  CHECK(std::get<CmdList>(*r.cmd).opts.units_dir == std::optional<std::string>("/u"));

  r = parse({"tendrild", "check"});
  REQUIRE(r.cmd);
  CHECK(std::holds_alternative<CmdCheck>(*r.cmd));
}

TEST_CASE("bad command lines report an error") {
  auto r = parse({"tendrild", "explode"});
  CHECK_FALSE(r.cmd);
  CHECK(r.error.find("unknown command") != std::string::npos);

  r = parse({"tendrild", "run", "--bogus"});
  CHECK_FALSE(r.cmd);
  CHECK_FALSE(r.error.empty());

  r = parse({"tendrild", "run", "--shutdown-timeout", "soon"});
  CHECK_FALSE(r.cmd);

  r = parse({"tendrild", "check", "--tag", "x"});
  CHECK_FALSE(r.cmd);

  // флаг без значения
  r = parse({"tendrild", "list", "--units"});
  CHECK_FALSE(r.cmd);
}

TEST_CASE("check and list exit codes") {
  auto good = mkd("good");
  write(good / "10-a.unit", "name: a\ncmd: /bin/true\ntags: core\n");
  write(good / "20-tty.unit", "name: tty@{}\ncmd: /sbin/agetty\ninstances: tty1, tty2\n");

  auto broken = mkd("broken");
  write(broken / "getty.unit", "name: getty\ncmd: /sbin/agetty\nargs: /dev/{id}\n");

  auto dup = mkd("dup");
  write(dup / "a.unit", "name: svc-{}\ncmd: /bin/true\ninstances: x\n");
  write(dup / "b.unit", "name: svc-x\ncmd: /bin/true\n");

  auto cycle = mkd("cycle");
  write(cycle / "a.unit", "name: a\ncmd: /bin/true\ndependencies: b\n");
  write(cycle / "b.unit", "name: b\ncmd: /bin/true\ndependencies: a\n");

  App app;
  {
    Args a{"tendrild", "check", "--units", cycle.string()};
    CHECK(app.run(a.argc(), a.argv()) == 2);
  }
  {
    Args a{"tendrild", "list", "--units", cycle.string()};
    CHECK(app.run(a.argc(), a.argv()) == 2);
  }
  {
    Args a{"tendrild", "list", "--units", broken.string()};
    CHECK(app.run(a.argc(), a.argv()) == 0);
  }
  {
    Args a{"tendrild", "check", "--units", good.string()};
    CHECK(app.run(a.argc(), a.argv()) == 0);
  }
  {
    Args a{"tendrild", "list", "--units", good.string(), "--tag", "core"};
    CHECK(app.run(a.argc(), a.argv()) == 0);
  }
  {
    Args a{"tendrild", "check", "--units", broken.string()};
    CHECK(app.run(a.argc(), a.argv()) == 1);
  }
  {
    Args a{"tendrild", "check", "--units", dup.string()};
    CHECK(app.run(a.argc(), a.argv()) == 2);
  }
  {
    Args a{"tendrild", "frobnicate"};
    CHECK(app.run(a.argc(), a.argv()) == 2);
  }
  {
    Args a{"tendrild", "help"};
    CHECK(app.run(a.argc(), a.argv()) == 0);
  }
}
