#pragma once
#include <array>
#include <cstdint>
#include <string_view>

namespace pkgtable {

// Bucket sizing and placement shared by the table builder and every reader.
// Both are part of the file format: changing either silently breaks lookups
// in tables written by older builds.

inline constexpr std::array<uint32_t, 29> kHashPrimes = {
    7,         17,        29,        53,        97,        193,       389,      769,
    1543,      3079,      6151,      12289,     24593,     49157,     98317,    196613,
    393241,    786433,    1572869,   3145739,   6291469,   12582917,  25165843, 50331653,
    100663319, 201326611, 402653189, 805306457, 1610612741};

// Smallest prime in kHashPrimes holding num_packages at load factor <= 0.5.
// Throws BuildError when num_packages exceeds the largest supported table.
uint32_t bucket_count(uint32_t num_packages);

// XXH64(name, seed 0) modulo num_buckets. num_buckets must be non-zero.
uint32_t bucket_of(std::string_view name, uint32_t num_buckets);

} // namespace pkgtable
