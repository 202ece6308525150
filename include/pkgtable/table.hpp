#pragma once
#include <pkgtable/header.hpp>
#include <pkgtable/node.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pkgtable {

// ---- On-disk table layout ----
// [PackageTableHeader]
// [u32 bucket[num_buckets]]   0 == empty, else offset of the chain head
// [PackageTableNode node[num_packages]]
//
// All offsets are relative to the start of the table. num_buckets is not
// stored; it is bucket_count(num_packages) on both sides.
struct PackageTable {
  PackageTableHeader header;
  std::vector<std::optional<uint32_t>> buckets;
  std::vector<PackageTableNode> nodes;

  size_t encoded_size() const;
  std::vector<uint8_t> encode() const;

  static PackageTable decode(const uint8_t* data, size_t size);
  static PackageTable decode(const std::vector<uint8_t>& bytes);

  // Table-relative byte offset of every node, in node-list order.
  std::vector<uint32_t> node_offsets() const;
  std::optional<size_t> node_index_at(uint32_t offset) const;

  // Node indices of one bucket's chain in link order. Throws Error for a
  // bucket past the array, ParseError on a link that does not land on a node
  // or a chain that never terminates.
  std::vector<size_t> chain(uint32_t bucket) const;

  const PackageTableNode* find(std::string_view package) const;

  // Structural problems found; empty when the table is sound.
  std::vector<std::string> verify() const;

  bool operator==(const PackageTable&) const = default;
};

std::string to_string(const PackageTable& t);

} // namespace pkgtable
