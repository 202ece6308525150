#include <pkgtable/error.hpp>
#include <pkgtable/hash.hpp>

#include <fmt/format.h>
#include <xxhash.h>

namespace pkgtable {

uint32_t bucket_count(uint32_t num_packages) {
  const uint64_t need = 2ull * num_packages;
  for (uint32_t p : kHashPrimes) {
    if (p >= need)
      return p;
  }
  throw BuildError(fmt::format("number of items in a hash table exceeds limit: {}", num_packages));
}

uint32_t bucket_of(std::string_view name, uint32_t num_buckets) {
  if (num_buckets == 0)
    throw BuildError("bucket_of: zero buckets");
  const uint64_t h = static_cast<uint64_t>(XXH64(name.data(), name.size(), 0));
  return static_cast<uint32_t>(h % num_buckets);
}

} // namespace pkgtable
