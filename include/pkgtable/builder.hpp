#pragma once
#include <pkgtable/header.hpp>
#include <pkgtable/table.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace pkgtable {

struct PackageEntry {
  std::string name;
  uint32_t package_id = 0;
  uint32_t boolean_offset = 0;
};

// A package as declared in a manifest: ids and offsets not yet assigned.
struct PackageSpec {
  std::string name;
  uint32_t boolean_flag_count = 0;
};

struct BuildOptions {
  uint32_t version = kFileVersion;
};

// Dense ids in input order; each package's booleans follow the previous
// package's in the value file.
std::vector<PackageEntry> assign_packages(const std::vector<PackageSpec>& specs);

// Lays out a complete table. Output depends only on the arguments, so two
// builds of the same package set are byte-identical.
// Throws BuildError on empty or duplicate names or when the table would not
// fit 32-bit offsets.
PackageTable build_package_table(const std::string& container,
                                 const std::vector<PackageEntry>& packages,
                                 const BuildOptions& opts = {});

} // namespace pkgtable
