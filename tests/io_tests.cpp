#include <catch2/catch_all.hpp>
#include <pkgtable/builder.hpp>
#include <pkgtable/io.hpp>
#include <pkgtable/query.hpp>

#include "fixtures.hpp"

#include <fstream>
#include <stdexcept>

using namespace pkgtable;
namespace fs = std::filesystem;

TEST_CASE("table file written and read back") {
  auto dir = mktmpdir("pkgtable_io_");
  auto p = dir / "package.map";

  auto t = build_package_table("system", {{"com.a", 0, 0}, {"com.b", 1, 4}, {"com.c", 2, 9}});
  io::write_table_file(p, t);

  REQUIRE(fs::exists(p));
  REQUIRE_FALSE(fs::exists(dir / "package.map.tmp"));
  REQUIRE(fs::file_size(p) == t.header.file_size);
  REQUIRE(io::read_file_bytes(p) == t.encode());
  REQUIRE(io::read_table_file(p) == t);
  fs::remove_all(dir);
}

TEST_CASE("mapped table answers lookups") {
  auto dir = mktmpdir("pkgtable_mmap_");
  auto p = dir / "package.map";
  io::write_table_file(p, build_package_table("system", {{"com.a", 0, 0}, {"com.b", 1, 4}}));

  io::MappedFile mf;
  REQUIRE(mf.open(p));
  REQUIRE(mf.good());
  REQUIRE(mf.size() == fs::file_size(p));

  auto ctx = find_package(mf.data(), mf.size(), "com.b");
  REQUIRE(ctx.has_value());
  REQUIRE(ctx->package_id == 1);
  REQUIRE(ctx->boolean_offset == 4);
  REQUIRE_FALSE(find_package(mf.data(), mf.size(), "com.z").has_value());

  mf.close();
  REQUIRE_FALSE(mf.good());
  fs::remove_all(dir);
}

TEST_CASE("missing or empty files") {
  auto dir = mktmpdir("pkgtable_missing_");
  io::MappedFile mf;
  REQUIRE_FALSE(mf.open(dir / "nope.map"));
  REQUIRE_THROWS_AS(io::read_file_bytes(dir / "nope.map"), std::runtime_error);

  auto empty = dir / "empty.map";
  std::ofstream(empty).close();
  REQUIRE_FALSE(mf.open(empty));
  REQUIRE(io::read_file_bytes(empty).empty());
  REQUIRE_THROWS_AS(io::read_table_file(empty), ParseError);
  fs::remove_all(dir);
}

TEST_CASE("rewriting a table replaces the old file") {
  auto dir = mktmpdir("pkgtable_rewrite_");
  auto p = dir / "package.map";
  io::write_table_file(p, build_package_table("system", {{"com.a", 0, 0}}));
  auto t2 = build_package_table("system", {{"com.a", 0, 0}, {"com.b", 1, 1}});
  io::write_table_file(p, t2);
  REQUIRE(io::read_table_file(p) == t2);
  fs::remove_all(dir);
}
