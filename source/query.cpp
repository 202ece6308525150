#include <pkgtable/bytes.hpp>
#include <pkgtable/error.hpp>
#include <pkgtable/hash.hpp>
#include <pkgtable/header.hpp>
#include <pkgtable/node.hpp>
#include <pkgtable/query.hpp>

#include <fmt/format.h>

#include <algorithm>

namespace pkgtable {

// empty name + three u32 fields
static constexpr size_t kMinNodeSize = 4 * sizeof(uint32_t);

uint32_t peek_version(const uint8_t* data, size_t size) {
  size_t head = 0;
  try {
    return read_u32(data, size, head);
  } catch (const ParseError& e) {
    throw ParseError(fmt::format("fail to read storage file version: {}", e.what()));
  }
}

std::optional<PackageContext> find_package(const uint8_t* data, size_t size,
                                           std::string_view package) {
  size_t head = 0;
  const auto h = PackageTableHeader::decode(data, size, head);
  if (h.version > kFileVersion)
    throw ParseError(fmt::format("cannot read storage file with a higher version of {} with "
                                 "lib version {}",
                                 h.version, kFileVersion));

  uint32_t num_buckets = 0;
  try {
    num_buckets = bucket_count(h.num_packages);
  } catch (const BuildError& e) {
    throw ParseError(fmt::format("fail to parse package table: {}", e.what()));
  }
  const uint64_t node_start = uint64_t(h.bucket_offset) + uint64_t(num_buckets) * sizeof(uint32_t);
  if (h.bucket_offset < head || h.node_offset != node_start)
    throw ParseError(fmt::format("package table offsets (bucket {}, node {}) do not fit {} buckets "
                                 "after a {}-byte header",
                                 h.bucket_offset, h.node_offset, num_buckets, head));
  const uint32_t b = bucket_of(package, num_buckets);

  size_t pos = static_cast<size_t>(h.bucket_offset) + sizeof(uint32_t) * b;
  uint32_t node_off = read_u32(data, size, pos);
  // empty slot is 0, which is always below the node array
  if (node_off < h.node_offset)
    return std::nullopt;

  // a chain can hold no more nodes than the file or the header allows
  const uint64_t fit = size > h.node_offset ? (size - h.node_offset) / kMinNodeSize : 0;
  const uint64_t max_steps = std::min<uint64_t>(h.num_packages, fit);
  for (uint64_t steps = 0; steps <= max_steps; ++steps) {
    size_t at = node_off;
    const auto node = PackageTableNode::decode(data, size, at);
    if (node.package_name == package)
      return PackageContext{node.package_id, node.boolean_offset};
    if (!node.next_offset)
      return std::nullopt;
    node_off = *node.next_offset;
  }
  throw ParseError(fmt::format("package table chain for bucket {} does not terminate", b));
}

std::optional<PackageContext> find_package(const std::vector<uint8_t>& bytes,
                                           std::string_view package) {
  return find_package(bytes.data(), bytes.size(), package);
}

} // namespace pkgtable
