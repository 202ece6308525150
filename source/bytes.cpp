#include <pkgtable/bytes.hpp>
#include <pkgtable/error.hpp>

#include <fmt/format.h>

#include <limits>

namespace pkgtable {

uint32_t read_u32(const uint8_t* data, size_t size, size_t& head) {
  if (head > size || size - head < sizeof(uint32_t))
    throw ParseError(fmt::format("u32 read at {} out of bounds (size {})", head, size));
  const uint8_t* p = data + head;
  uint32_t v = static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
               (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
  head += sizeof(uint32_t);
  return v;
}

std::string read_str(const uint8_t* data, size_t size, size_t& head) {
  size_t pos = head;
  const uint32_t len = read_u32(data, size, pos);
  if (size - pos < len)
    throw ParseError(fmt::format("string of {} bytes at {} out of bounds (size {})", len, head, size));
  std::string s(reinterpret_cast<const char*>(data + pos), len);
  head = pos + len;
  return s;
}

void append_u32(std::vector<uint8_t>& out, uint32_t v) {
  out.push_back(static_cast<uint8_t>(v & 0xff));
  out.push_back(static_cast<uint8_t>((v >> 8) & 0xff));
  out.push_back(static_cast<uint8_t>((v >> 16) & 0xff));
  out.push_back(static_cast<uint8_t>((v >> 24) & 0xff));
}

void append_str(std::vector<uint8_t>& out, std::string_view s) {
  if (s.size() > std::numeric_limits<uint32_t>::max())
    throw BuildError(fmt::format("string of {} bytes does not fit a u32 length prefix", s.size()));
  append_u32(out, static_cast<uint32_t>(s.size()));
  out.insert(out.end(), s.begin(), s.end());
}

} // namespace pkgtable
