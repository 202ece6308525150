#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace pkgtable {

// What a flag reader needs about a package: its id and where its booleans
// start in the flag value file.
struct PackageContext {
  uint32_t package_id = 0;
  uint32_t boolean_offset = 0;

  bool operator==(const PackageContext&) const = default;
};

// First word of any table. Throws ParseError on fewer than 4 bytes.
uint32_t peek_version(const uint8_t* data, size_t size);

// Point lookup straight over encoded bytes (for example a read-only mapping
// of the table file): header, one bucket slot, then only the nodes on that
// bucket's chain are decoded. nullopt if the package is not in the table.
// Throws ParseError on a corrupt table or one newer than kFileVersion.
std::optional<PackageContext> find_package(const uint8_t* data, size_t size,
                                           std::string_view package);
std::optional<PackageContext> find_package(const std::vector<uint8_t>& bytes,
                                           std::string_view package);

} // namespace pkgtable
