#include <pkgtable/bytes.hpp>
#include <pkgtable/error.hpp>
#include <pkgtable/node.hpp>

#include <fmt/format.h>

namespace pkgtable {

size_t PackageTableNode::encoded_size() const {
  return encoded_str_size(package_name) + 3 * sizeof(uint32_t);
}

void PackageTableNode::encode_to(std::vector<uint8_t>& out) const {
  if (next_offset && *next_offset == 0)
    throw BuildError(fmt::format("node '{}': next offset 0 collides with the end-of-chain sentinel",
                                 package_name));
  append_str(out, package_name);
  append_u32(out, package_id);
  append_u32(out, boolean_offset);
  append_u32(out, next_offset.value_or(0));
}

std::vector<uint8_t> PackageTableNode::encode() const {
  std::vector<uint8_t> out;
  out.reserve(encoded_size());
  encode_to(out);
  return out;
}

PackageTableNode PackageTableNode::decode(const uint8_t* data, size_t size, size_t& head) {
  size_t pos = head;
  PackageTableNode n;
  try {
    n.package_name = read_str(data, size, pos);
    n.package_id = read_u32(data, size, pos);
    n.boolean_offset = read_u32(data, size, pos);
    const uint32_t next = read_u32(data, size, pos);
    if (next != 0)
      n.next_offset = next;
  } catch (const ParseError& e) {
    throw ParseError(fmt::format("fail to parse package table node at {}: {}", head, e.what()));
  }
  head = pos;
  return n;
}

PackageTableNode PackageTableNode::decode(const std::vector<uint8_t>& bytes) {
  size_t head = 0;
  return decode(bytes.data(), bytes.size(), head);
}

std::string to_string(const PackageTableNode& n) {
  return fmt::format("Package: {}, Id: {}, Offset: {}, Next: {}\n", n.package_name, n.package_id,
                     n.boolean_offset,
                     n.next_offset ? std::to_string(*n.next_offset) : std::string("None"));
}

} // namespace pkgtable
