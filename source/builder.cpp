#include <pkgtable/builder.hpp>
#include <pkgtable/bytes.hpp>
#include <pkgtable/error.hpp>
#include <pkgtable/hash.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <limits>
#include <optional>
#include <string_view>
#include <unordered_set>

namespace pkgtable {

static constexpr uint64_t kMaxOffset = std::numeric_limits<uint32_t>::max();

std::vector<PackageEntry> assign_packages(const std::vector<PackageSpec>& specs) {
  if (specs.size() > kMaxOffset)
    throw BuildError(fmt::format("too many packages: {}", specs.size()));

  std::vector<PackageEntry> out;
  out.reserve(specs.size());
  uint64_t next_boolean = 0;
  for (size_t i = 0; i < specs.size(); ++i) {
    if (next_boolean > kMaxOffset)
      throw BuildError(
          fmt::format("boolean offset of package '{}' overflows 32 bits", specs[i].name));
    out.push_back(PackageEntry{specs[i].name, static_cast<uint32_t>(i),
                               static_cast<uint32_t>(next_boolean)});
    next_boolean += specs[i].boolean_flag_count;
  }
  return out;
}

namespace {

// In-memory chain element: links are indices into the arena, turned into
// byte offsets only once every node's position is known.
struct ArenaNode {
  size_t entry;
  uint32_t bucket;
  std::optional<size_t> next;
};

} // namespace

PackageTable build_package_table(const std::string& container,
                                 const std::vector<PackageEntry>& packages,
                                 const BuildOptions& opts) {
  if (packages.size() > kMaxOffset)
    throw BuildError(fmt::format("too many packages: {}", packages.size()));

  std::unordered_set<std::string_view> names;
  for (const auto& p : packages) {
    if (p.name.empty())
      throw BuildError("package name must not be empty");
    if (!names.insert(p.name).second)
      throw BuildError(fmt::format("duplicate package '{}'", p.name));
  }

  const uint32_t num_packages = static_cast<uint32_t>(packages.size());
  const uint32_t num_buckets = bucket_count(num_packages);

  PackageTable t;
  t.header.version = opts.version;
  t.header.container = container;
  t.header.num_packages = num_packages;

  const uint64_t bucket_offset = t.header.encoded_size();
  const uint64_t node_offset = bucket_offset + uint64_t(num_buckets) * sizeof(uint32_t);
  if (node_offset > kMaxOffset)
    throw BuildError(fmt::format("container name of {} bytes does not fit the table",
                                 container.size()));
  t.header.bucket_offset = static_cast<uint32_t>(bucket_offset);
  t.header.node_offset = static_cast<uint32_t>(node_offset);

  std::vector<ArenaNode> arena;
  arena.reserve(packages.size());
  for (size_t i = 0; i < packages.size(); ++i)
    arena.push_back(ArenaNode{i, bucket_of(packages[i].name, num_buckets), std::nullopt});

  // group each bucket's nodes together; stable so ties keep input order
  std::stable_sort(arena.begin(), arena.end(),
                   [](const ArenaNode& a, const ArenaNode& b) { return a.bucket < b.bucket; });

  std::vector<std::optional<size_t>> heads(num_buckets);
  for (size_t i = 0; i < arena.size(); ++i) {
    if (!heads[arena[i].bucket])
      heads[arena[i].bucket] = i;
    if (i + 1 < arena.size() && arena[i + 1].bucket == arena[i].bucket)
      arena[i].next = i + 1;
  }

  std::vector<uint32_t> offsets(arena.size());
  uint64_t off = node_offset;
  for (size_t i = 0; i < arena.size(); ++i) {
    offsets[i] = static_cast<uint32_t>(off);
    off += encoded_str_size(packages[arena[i].entry].name) + 3 * sizeof(uint32_t);
    if (off > kMaxOffset)
      throw BuildError(fmt::format("package table exceeds {} bytes", kMaxOffset));
  }
  t.header.file_size = static_cast<uint32_t>(off);

  t.buckets.resize(num_buckets);
  for (uint32_t b = 0; b < num_buckets; ++b) {
    if (heads[b])
      t.buckets[b] = offsets[*heads[b]];
  }

  t.nodes.reserve(arena.size());
  for (const auto& a : arena) {
    const auto& p = packages[a.entry];
    PackageTableNode n;
    n.package_name = p.name;
    n.package_id = p.package_id;
    n.boolean_offset = p.boolean_offset;
    if (a.next)
      n.next_offset = offsets[*a.next];
    t.nodes.push_back(std::move(n));
  }

  spdlog::debug("package table for '{}': {} packages, {} buckets, {} bytes", container,
                num_packages, num_buckets, t.header.file_size);
  return t;
}

} // namespace pkgtable
