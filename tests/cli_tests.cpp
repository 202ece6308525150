#include <catch2/catch_all.hpp>
#include <pkgtable/app.hpp>
#include <pkgtable/cli.hpp>

#include "fixtures.hpp"

#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace pkgtable;
namespace fs = std::filesystem;

struct Argv {
  std::vector<std::string> store;
  std::vector<char*> ptrs;
  explicit Argv(std::vector<std::string> args) : store(std::move(args)) {
    store.insert(store.begin(), "pkgtable");
    for (auto& s : store) ptrs.push_back(s.data());
    ptrs.push_back(nullptr);
  }
  int argc() const { return static_cast<int>(store.size()); }
  char** argv() { return ptrs.data(); }
};

static ParseResult parse(std::vector<std::string> args) {
  Argv a(std::move(args));
  return parse_cli(a.argc(), a.argv());
}

static int run(std::vector<std::string> args, std::string& out) {
  Argv a(std::move(args));
  std::ostringstream os;
  int rc = App{os}.run(a.argc(), a.argv());
  out = os.str();
  return rc;
}

TEST_CASE("cli: help and version") {
  REQUIRE(std::holds_alternative<CmdHelp>(*parse({}).cmd));
  REQUIRE(std::holds_alternative<CmdHelp>(*parse({"help"}).cmd));
  REQUIRE(std::holds_alternative<CmdVersion>(*parse({"--version"}).cmd));
}

TEST_CASE("cli: create") {
  auto r = parse({"create", "--manifest", "m.ini", "--out", "p.map", "--container", "vendor"});
  REQUIRE(r.error.empty());
  auto c = std::get<CmdCreate>(*r.cmd);
  REQUIRE(c.manifest == "m.ini");
  REQUIRE(c.out == "p.map");
  REQUIRE(c.container == std::optional<std::string>("vendor"));

  REQUIRE_FALSE(parse({"create", "--manifest", "m.ini"}).cmd.has_value());
  REQUIRE_FALSE(parse({"create", "--bogus"}).error.empty());
}

TEST_CASE("cli: dump, lookup, verify") {
  auto d = std::get<CmdDump>(*parse({"dump", "p.map", "--json"}).cmd);
  REQUIRE(d.file == "p.map");
  REQUIRE(d.json);

  auto l = std::get<CmdLookup>(*parse({"lookup", "p.map", "com.a"}).cmd);
  REQUIRE(l.package == "com.a");
  REQUIRE_FALSE(l.json);

  REQUIRE(std::get<CmdVerify>(*parse({"verify", "p.map"}).cmd).file == "p.map");

  REQUIRE_FALSE(parse({"lookup", "p.map"}).cmd.has_value());
  REQUIRE_FALSE(parse({"verify"}).cmd.has_value());
  REQUIRE_FALSE(parse({"frobnicate"}).cmd.has_value());
}

TEST_CASE("cli: log level anywhere on the line") {
  auto r = parse({"dump", "--log-level", "debug", "p.map"});
  REQUIRE(r.log_level == "debug");
  REQUIRE(std::get<CmdDump>(*r.cmd).file == "p.map");

  REQUIRE_FALSE(parse({"--log-level", "loud", "dump", "p.map"}).error.empty());
  REQUIRE_FALSE(parse({"dump", "p.map", "--log-level"}).error.empty());
}

TEST_CASE("app: create, lookup, dump and verify a table") {
  auto dir = mktmpdir("pkgtable_app_");
  auto manifest = dir / "system.manifest";
  auto table = dir / "package.map";
  std::ofstream(manifest) << "[Container]\nName=system\n[Packages]\n"
                             "com.android.alpha=3\ncom.android.beta=2\ncom.android.gamma=1\n";

  std::string out;
  REQUIRE(run({"create", "--manifest", manifest.string(), "--out", table.string()}, out) == 0);
  REQUIRE(out.find("packages=3") != std::string::npos);

  REQUIRE(run({"lookup", table.string(), "com.android.gamma"}, out) == 0);
  REQUIRE(out == "com.android.gamma id=2 boolean_offset=5\n");

  REQUIRE(run({"lookup", table.string(), "com.android.beta", "--json"}, out) == 0);
  REQUIRE(out == "{\"package\":\"com.android.beta\",\"id\":1,\"boolean_offset\":3}\n");

  REQUIRE(run({"lookup", table.string(), "com.android.delta"}, out) == 1);

  REQUIRE(run({"dump", table.string()}, out) == 0);
  REQUIRE(out.find("Container: system") != std::string::npos);

  REQUIRE(run({"dump", table.string(), "--json"}, out) == 0);
  REQUIRE(out.find("\"num_packages\":3") != std::string::npos);

  REQUIRE(run({"verify", table.string()}, out) == 0);
  REQUIRE(out.find("ok (3 packages)") != std::string::npos);
  fs::remove_all(dir);
}

TEST_CASE("app: corrupt and missing inputs fail cleanly") {
  auto dir = mktmpdir("pkgtable_app_bad_");
  auto table = dir / "package.map";
  std::ofstream(table, std::ios::binary) << "garbage";

  std::string out;
  REQUIRE(run({"dump", table.string()}, out) == 1);
  REQUIRE(run({"verify", table.string()}, out) == 1);
  REQUIRE(run({"lookup", table.string(), "x"}, out) == 1);
  REQUIRE(run({"create", "--manifest", (dir / "none").string(), "--out", table.string()}, out) == 1);
  REQUIRE(run({"frobnicate"}, out) == 2);
  fs::remove_all(dir);
}
