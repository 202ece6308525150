#include <catch2/catch_all.hpp>
#include <pkgtable/error.hpp>
#include <pkgtable/hash.hpp>

#include <string>

using namespace pkgtable;

TEST_CASE("bucket_count keeps load factor at or below one half") {
  REQUIRE(bucket_count(0) == 7);
  REQUIRE(bucket_count(1) == 7);
  REQUIRE(bucket_count(3) == 7);
  REQUIRE(bucket_count(4) == 17);
  REQUIRE(bucket_count(8) == 17);
  REQUIRE(bucket_count(9) == 29);
  REQUIRE(bucket_count(1000) == 3079);

  for (uint32_t n : {1u, 10u, 100u, 5000u, 123456u})
    REQUIRE(uint64_t(bucket_count(n)) >= 2ull * n);
}

TEST_CASE("bucket_count refuses tables past the largest prime") {
  REQUIRE(bucket_count(805306370u) == 1610612741u);
  REQUIRE_THROWS_AS(bucket_count(805306371u), BuildError);
  REQUIRE_THROWS_AS(bucket_count(0xffffffffu), BuildError);
}

TEST_CASE("bucket_of is deterministic and in range") {
  for (uint32_t n : {7u, 17u, 29u, 3079u}) {
    for (int i = 0; i < 200; ++i) {
      const std::string name = "com.example.pkg" + std::to_string(i);
      const uint32_t b = bucket_of(name, n);
      REQUIRE(b < n);
      REQUIRE(bucket_of(name, n) == b);
    }
  }
}

TEST_CASE("bucket_of spreads names over buckets") {
  std::vector<int> hits(17, 0);
  for (int i = 0; i < 1700; ++i)
    ++hits[bucket_of("pkg." + std::to_string(i), 17)];
  for (int h : hits)
    REQUIRE(h > 0);
}

TEST_CASE("bucket_of rejects zero buckets") {
  REQUIRE_THROWS_AS(bucket_of("x", 0), BuildError);
}
