#include <pkgtable/bytes.hpp>
#include <pkgtable/error.hpp>
#include <pkgtable/header.hpp>

#include <fmt/format.h>

namespace pkgtable {

size_t PackageTableHeader::encoded_size() const {
  return sizeof(uint32_t) + encoded_str_size(container) + 4 * sizeof(uint32_t);
}

void PackageTableHeader::encode_to(std::vector<uint8_t>& out) const {
  append_u32(out, version);
  append_str(out, container);
  append_u32(out, file_size);
  append_u32(out, num_packages);
  append_u32(out, bucket_offset);
  append_u32(out, node_offset);
}

std::vector<uint8_t> PackageTableHeader::encode() const {
  std::vector<uint8_t> out;
  out.reserve(encoded_size());
  encode_to(out);
  return out;
}

PackageTableHeader PackageTableHeader::decode(const uint8_t* data, size_t size, size_t& head) {
  size_t pos = head;
  PackageTableHeader h;
  try {
    h.version = read_u32(data, size, pos);
    h.container = read_str(data, size, pos);
    h.file_size = read_u32(data, size, pos);
    h.num_packages = read_u32(data, size, pos);
    h.bucket_offset = read_u32(data, size, pos);
    h.node_offset = read_u32(data, size, pos);
  } catch (const ParseError& e) {
    throw ParseError(fmt::format("fail to parse package table header: {}", e.what()));
  }
  head = pos;
  return h;
}

PackageTableHeader PackageTableHeader::decode(const std::vector<uint8_t>& bytes) {
  size_t head = 0;
  return decode(bytes.data(), bytes.size(), head);
}

std::string to_string(const PackageTableHeader& h) {
  return fmt::format("Version: {}, Container: {}, File Size: {}\n"
                     "Num of Packages: {}, Bucket Offset: {}, Node Offset: {}\n",
                     h.version, h.container, h.file_size, h.num_packages, h.bucket_offset,
                     h.node_offset);
}

} // namespace pkgtable
