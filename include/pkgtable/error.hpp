#pragma once
#include <stdexcept>
#include <string>

namespace pkgtable {

struct Error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Malformed or truncated table bytes. Decoding never returns partial results.
struct ParseError : Error {
  using Error::Error;
};

// Input that cannot be laid out as a table (duplicate names, size overflow,
// zero offsets where the sentinel forbids them).
struct BuildError : Error {
  using Error::Error;
};

} // namespace pkgtable
