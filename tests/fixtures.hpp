#pragma once
#include <pkgtable/table.hpp>

#include <filesystem>
#include <string>
#include <unistd.h>

// Hand-laid table used by the codec tests. Bucket placement is arbitrary
// here; only the byte layout matters.
//   header: 4 + (4+6) + 16 = 30 bytes, 7 buckets -> nodes start at 58
//   each node name is 34 bytes -> 50 bytes per node
inline pkgtable::PackageTable mockup_table() {
  using namespace pkgtable;
  PackageTable t;
  t.header = PackageTableHeader{1234, "mockup", 208, 3, 30, 58};
  t.buckets = {58u, std::nullopt, std::nullopt, 108u, std::nullopt, std::nullopt, std::nullopt};
  t.nodes = {
      PackageTableNode{"com.android.aconfig.storage.test_2", 1, 3, std::nullopt},
      PackageTableNode{"com.android.aconfig.storage.test_1", 0, 0, 158u},
      PackageTableNode{"com.android.aconfig.storage.test_4", 2, 6, std::nullopt},
  };
  return t;
}

inline std::filesystem::path mktmpdir(const char* prefix) {
  auto d = std::filesystem::temp_directory_path() /
           (std::string(prefix) + std::to_string(::getpid()));
  std::filesystem::remove_all(d);
  std::filesystem::create_directories(d);
  return d;
}
