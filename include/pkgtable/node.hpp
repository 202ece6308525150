#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pkgtable {

// ---- On-disk node layout (little-endian) ----
// name_len(4) name | package_id(4) | boolean_offset(4) | next_offset(4)
//
// Nodes are variable length; advance by the decoder's consumed bytes, never
// by a fixed stride. next_offset == 0 on disk means end of chain.
struct PackageTableNode {
  std::string package_name;
  uint32_t package_id = 0;
  // first boolean of this package within the flag value file's boolean array
  uint32_t boolean_offset = 0;
  std::optional<uint32_t> next_offset;

  size_t encoded_size() const;
  // Throws BuildError for next_offset == 0, which the sentinel reserves.
  std::vector<uint8_t> encode() const;
  void encode_to(std::vector<uint8_t>& out) const;

  static PackageTableNode decode(const uint8_t* data, size_t size, size_t& head);
  static PackageTableNode decode(const std::vector<uint8_t>& bytes);

  bool operator==(const PackageTableNode&) const = default;
};

std::string to_string(const PackageTableNode& n);

} // namespace pkgtable
