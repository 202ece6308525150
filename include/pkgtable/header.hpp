#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace pkgtable {

// Storage format revision written by this build. Readers refuse anything newer.
inline constexpr uint32_t kFileVersion = 1;

// ---- On-disk header layout (little-endian) ----
// version(4) | container_len(4) container | file_size(4) | num_packages(4)
// | bucket_offset(4) | node_offset(4)
//
// version is always the first word so a reader can check compatibility
// before decoding anything else.
struct PackageTableHeader {
  uint32_t version = kFileVersion;
  std::string container;
  uint32_t file_size = 0;
  uint32_t num_packages = 0;
  uint32_t bucket_offset = 0; // start of the bucket array
  uint32_t node_offset = 0;   // start of the node array

  size_t encoded_size() const;
  std::vector<uint8_t> encode() const;
  void encode_to(std::vector<uint8_t>& out) const;

  // Reads one header at `head` and leaves `head` just past it.
  static PackageTableHeader decode(const uint8_t* data, size_t size, size_t& head);
  static PackageTableHeader decode(const std::vector<uint8_t>& bytes);

  bool operator==(const PackageTableHeader&) const = default;
};

std::string to_string(const PackageTableHeader& h);

} // namespace pkgtable
