#pragma once
#include <pkgtable/table.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <vector>

namespace pkgtable {
namespace io {
  std::vector<uint8_t> read_file_bytes(const std::filesystem::path& p);
  // temp file + fsync + rename, so readers never see a half-written table
  void write_file_atomic(const std::filesystem::path& p, const std::vector<uint8_t>& bytes);

  void write_table_file(const std::filesystem::path& p, const PackageTable& t);
  PackageTable read_table_file(const std::filesystem::path& p);

// ---- Read-only mapping of a table file ----
// Many processes may map the same file; nothing writes through the mapping.
class MappedFile {
public:
  MappedFile() = default;
  ~MappedFile() { close(); }

  MappedFile(const MappedFile&) = delete;
  MappedFile& operator=(const MappedFile&) = delete;

  bool open(const std::filesystem::path& p);
  void close();

  bool good() const { return base_ != nullptr; }
  const uint8_t* data() const { return static_cast<const uint8_t*>(base_); }
  size_t size() const { return len_; }

private:
  void*  base_ = nullptr;
  size_t len_  = 0;
};
} // namespace io
} // namespace pkgtable
