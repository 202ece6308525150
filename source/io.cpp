#include <pkgtable/io.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace pkgtable {
namespace io {

static std::runtime_error io_error(const char* what, const fs::path& p) {
  return std::runtime_error(fmt::format("{} {}: {}", what, p.string(), std::strerror(errno)));
}

std::vector<uint8_t> read_file_bytes(const fs::path& p) {
  int fd = ::open(p.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0)
    throw io_error("open", p);

  std::vector<uint8_t> out;
  struct stat st {};
  if (::fstat(fd, &st) == 0 && st.st_size > 0)
    out.reserve(static_cast<size_t>(st.st_size));

  uint8_t buf[64 * 1024];
  for (;;) {
    ssize_t r = ::read(fd, buf, sizeof(buf));
    if (r < 0) {
      if (errno == EINTR) continue;
      auto err = io_error("read", p);
      ::close(fd);
      throw err;
    }
    if (r == 0) break;
    out.insert(out.end(), buf, buf + r);
  }
  ::close(fd);
  return out;
}

void write_file_atomic(const fs::path& p, const std::vector<uint8_t>& bytes) {
  fs::path tmp = p;
  tmp += ".tmp";

  int fd = ::open(tmp.c_str(), O_CREAT | O_TRUNC | O_WRONLY | O_CLOEXEC, 0644);
  if (fd < 0)
    throw io_error("open", tmp);

  const uint8_t* ptr = bytes.data();
  size_t left = bytes.size();
  while (left > 0) {
    ssize_t w = ::write(fd, ptr, left);
    if (w < 0) {
      if (errno == EINTR) continue;
      auto err = io_error("write", tmp);
      ::close(fd);
      ::unlink(tmp.c_str());
      throw err;
    }
    ptr  += w;
    left -= static_cast<size_t>(w);
  }
  if (::fsync(fd) != 0) {
    auto err = io_error("fsync", tmp);
    ::close(fd);
    ::unlink(tmp.c_str());
    throw err;
  }
  ::close(fd);

  if (::rename(tmp.c_str(), p.c_str()) != 0) {
    auto err = io_error("rename", tmp);
    ::unlink(tmp.c_str());
    throw err;
  }
}

void write_table_file(const fs::path& p, const PackageTable& t) {
  auto bytes = t.encode();
  write_file_atomic(p, bytes);
  spdlog::info("wrote package table {} ({} packages, {} bytes)", p.string(), t.nodes.size(),
               bytes.size());
}

PackageTable read_table_file(const fs::path& p) {
  auto bytes = read_file_bytes(p);
  auto t = PackageTable::decode(bytes);
  if (t.header.file_size != bytes.size()) {
    spdlog::warn("package table {}: header file size {} but file holds {} bytes", p.string(),
                 t.header.file_size, bytes.size());
  }
  return t;
}

bool MappedFile::open(const fs::path& p) {
  close();

  int fd = ::open(p.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    spdlog::error("open {} failed (errno={})", p.string(), errno);
    return false;
  }
  struct stat st {};
  if (::fstat(fd, &st) != 0 || st.st_size <= 0) {
    ::close(fd);
    return false;
  }

  const size_t len = static_cast<size_t>(st.st_size);
  void* m = ::mmap(nullptr, len, PROT_READ, MAP_SHARED, fd, 0);
  ::close(fd); // the mapping keeps the file referenced
  if (m == MAP_FAILED) {
    spdlog::error("mmap {} failed (errno={})", p.string(), errno);
    return false;
  }
  base_ = m;
  len_  = len;
  return true;
}

void MappedFile::close() {
  if (base_) {
    ::munmap(base_, len_);
  }
  base_ = nullptr;
  len_  = 0;
}

} // namespace io
} // namespace pkgtable
