#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace pkgtable {

// Little-endian primitives shared by every codec in the table format.
// Readers advance `head` only on success and throw ParseError on any read
// that would cross `size`.

uint32_t read_u32(const uint8_t* data, size_t size, size_t& head);
std::string read_str(const uint8_t* data, size_t size, size_t& head);

void append_u32(std::vector<uint8_t>& out, uint32_t v);
void append_str(std::vector<uint8_t>& out, std::string_view s);

inline size_t encoded_str_size(std::string_view s) { return sizeof(uint32_t) + s.size(); }

} // namespace pkgtable
