#pragma once
#include <pkgtable/builder.hpp>
#include <pkgtable/error.hpp>

#include <cstdint>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace pkgtable {

struct ManifestError : Error {
  using Error::Error;
};

// Package manifest describing one container:
//
//   [Container]
//   Name=system
//   Version=1
//   [Packages]
//   com.example.alpha=3      ; package = number of boolean flags
//
// Packages keep file order, which fixes their ids and boolean offsets.
struct Manifest {
  std::filesystem::path path;
  std::string container;
  std::optional<uint32_t> version;
  std::vector<PackageSpec> packages;

  static Manifest Load(const std::filesystem::path& p);
  static Manifest Parse(std::istream& in, const std::string& origin);
};

} // namespace pkgtable
