#include <pkgtable/bytes.hpp>
#include <pkgtable/error.hpp>
#include <pkgtable/hash.hpp>
#include <pkgtable/table.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <unordered_set>

namespace pkgtable {

// smallest possible node: empty name + three u32 fields
static constexpr size_t kMinNodeSize = 4 * sizeof(uint32_t);

size_t PackageTable::encoded_size() const {
  size_t n = header.encoded_size() + buckets.size() * sizeof(uint32_t);
  for (const auto& node : nodes)
    n += node.encoded_size();
  return n;
}

std::vector<uint8_t> PackageTable::encode() const {
  // 0 is the empty/none sentinel, so no real offset may be 0.
  if (header.bucket_offset == 0 || header.node_offset == 0)
    throw BuildError(fmt::format("package table offsets must be non-zero (bucket {}, node {})",
                                 header.bucket_offset, header.node_offset));

  std::vector<uint8_t> out;
  out.reserve(encoded_size());
  header.encode_to(out);
  for (size_t i = 0; i < buckets.size(); ++i) {
    if (buckets[i] && *buckets[i] == 0)
      throw BuildError(fmt::format("bucket {} points at offset 0", i));
    append_u32(out, buckets[i].value_or(0));
  }
  for (const auto& node : nodes)
    node.encode_to(out);
  return out;
}

PackageTable PackageTable::decode(const uint8_t* data, size_t size) {
  PackageTable t;
  size_t head = 0;
  t.header = PackageTableHeader::decode(data, size, head);

  uint32_t num_buckets = 0;
  try {
    num_buckets = bucket_count(t.header.num_packages);
  } catch (const BuildError& e) {
    throw ParseError(fmt::format("fail to parse package table: {}", e.what()));
  }

  if ((size - head) / sizeof(uint32_t) < num_buckets)
    throw ParseError(fmt::format("fail to parse package table buckets: {} buckets need {} bytes, "
                                 "only {} left",
                                 num_buckets, uint64_t(num_buckets) * sizeof(uint32_t),
                                 size - head));

  try {
    t.buckets.reserve(num_buckets);
    for (uint32_t i = 0; i < num_buckets; ++i) {
      const uint32_t off = read_u32(data, size, head);
      t.buckets.push_back(off == 0 ? std::nullopt : std::optional<uint32_t>(off));
    }
  } catch (const ParseError& e) {
    throw ParseError(fmt::format("fail to parse package table buckets: {}", e.what()));
  }

  const uint32_t declared = t.header.num_packages;
  if ((size - head) / kMinNodeSize < declared)
    throw ParseError(fmt::format("fail to parse package table: {} packages declared but only {} "
                                 "bytes left for nodes",
                                 declared, size - head));

  t.nodes.reserve(declared);
  for (uint32_t i = 0; i < declared; ++i) {
    try {
      t.nodes.push_back(PackageTableNode::decode(data, size, head));
    } catch (const ParseError& e) {
      throw ParseError(fmt::format("fail to parse package table: node {} of {}: {}", i, declared,
                                   e.what()));
    }
  }
  return t;
}

PackageTable PackageTable::decode(const std::vector<uint8_t>& bytes) {
  return decode(bytes.data(), bytes.size());
}

std::vector<uint32_t> PackageTable::node_offsets() const {
  std::vector<uint32_t> out;
  out.reserve(nodes.size());
  uint64_t off = header.node_offset;
  for (const auto& node : nodes) {
    out.push_back(static_cast<uint32_t>(off));
    off += node.encoded_size();
  }
  return out;
}

static std::optional<size_t> index_in(const std::vector<uint32_t>& offsets, uint32_t offset) {
  auto it = std::lower_bound(offsets.begin(), offsets.end(), offset);
  if (it == offsets.end() || *it != offset)
    return std::nullopt;
  return static_cast<size_t>(it - offsets.begin());
}

std::optional<size_t> PackageTable::node_index_at(uint32_t offset) const {
  return index_in(node_offsets(), offset);
}

static std::vector<size_t> walk_chain(const PackageTable& t, const std::vector<uint32_t>& offsets,
                                      uint32_t bucket) {
  std::vector<size_t> out;
  std::optional<uint32_t> cur = t.buckets[bucket];
  while (cur) {
    auto idx = index_in(offsets, *cur);
    if (!idx)
      throw ParseError(
          fmt::format("bucket {} chain links to offset {}, not a node start", bucket, *cur));
    if (out.size() >= t.nodes.size())
      throw ParseError(fmt::format("bucket {} chain does not terminate", bucket));
    out.push_back(*idx);
    cur = t.nodes[*idx].next_offset;
  }
  return out;
}

std::vector<size_t> PackageTable::chain(uint32_t bucket) const {
  if (bucket >= buckets.size())
    throw Error(fmt::format("bucket {} out of range ({})", bucket, buckets.size()));
  return walk_chain(*this, node_offsets(), bucket);
}

const PackageTableNode* PackageTable::find(std::string_view package) const {
  if (buckets.empty())
    return nullptr;
  const uint32_t b = bucket_of(package, static_cast<uint32_t>(buckets.size()));
  for (size_t idx : walk_chain(*this, node_offsets(), b)) {
    if (nodes[idx].package_name == package)
      return &nodes[idx];
  }
  return nullptr;
}

std::vector<std::string> PackageTable::verify() const {
  std::vector<std::string> problems;

  if (header.num_packages != nodes.size())
    problems.push_back(fmt::format("header declares {} packages, table holds {}",
                                   header.num_packages, nodes.size()));
  try {
    const uint32_t expect = bucket_count(header.num_packages);
    if (buckets.size() != expect)
      problems.push_back(
          fmt::format("{} buckets, sizing policy expects {}", buckets.size(), expect));
  } catch (const BuildError& e) {
    problems.push_back(e.what());
  }

  if (header.bucket_offset != header.encoded_size())
    problems.push_back(fmt::format("bucket offset {} does not follow the {}-byte header",
                                   header.bucket_offset, header.encoded_size()));
  const uint64_t node_start = uint64_t(header.bucket_offset) + buckets.size() * sizeof(uint32_t);
  if (header.node_offset != node_start)
    problems.push_back(fmt::format("node offset {} does not follow the bucket array (ends at {})",
                                   header.node_offset, node_start));
  if (header.node_offset <= header.bucket_offset)
    problems.push_back(fmt::format("node offset {} is not after bucket offset {}",
                                   header.node_offset, header.bucket_offset));
  if (header.file_size != encoded_size())
    problems.push_back(fmt::format("file size {} does not match encoded size {}",
                                   header.file_size, encoded_size()));

  std::unordered_set<std::string_view> names;
  for (const auto& n : nodes) {
    if (!names.insert(n.package_name).second)
      problems.push_back(fmt::format("duplicate package '{}'", n.package_name));
  }

  const auto offsets = node_offsets();
  std::vector<int> seen(nodes.size(), 0);
  for (uint32_t b = 0; b < buckets.size(); ++b) {
    std::vector<size_t> members;
    try {
      members = walk_chain(*this, offsets, b);
    } catch (const ParseError& e) {
      problems.push_back(e.what());
      continue;
    }
    for (size_t idx : members) {
      ++seen[idx];
      const auto& name = nodes[idx].package_name;
      const uint32_t want = bucket_of(name, static_cast<uint32_t>(buckets.size()));
      if (want != b)
        problems.push_back(
            fmt::format("package '{}' chained from bucket {}, hashes to {}", name, b, want));
    }
  }
  for (size_t i = 0; i < nodes.size(); ++i) {
    if (seen[i] == 0)
      problems.push_back(fmt::format("package '{}' is unreachable", nodes[i].package_name));
    else if (seen[i] > 1)
      problems.push_back(
          fmt::format("package '{}' is reachable {} times", nodes[i].package_name, seen[i]));
  }
  return problems;
}

std::string to_string(const PackageTable& t) {
  std::string s = "Header:\n" + to_string(t.header) + "Buckets:\n[";
  for (size_t i = 0; i < t.buckets.size(); ++i) {
    if (i)
      s += ", ";
    s += t.buckets[i] ? fmt::format("Some({})", *t.buckets[i]) : std::string("None");
  }
  s += "]\nNodes:\n";
  for (const auto& n : t.nodes)
    s += to_string(n);
  return s;
}

} // namespace pkgtable
