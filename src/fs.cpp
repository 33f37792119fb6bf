#include "gitpeek/fs.hpp"

#include "gitpeek/error.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <string>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

namespace gitpeek::fs {

bool exists(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec);
}

std::vector<std::uint8_t> read_file(const std::filesystem::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw Error(Errc::io_error, "open for read failed: " + p.string());
  }
  ifs.seekg(0, std::ios::end);
  auto n = static_cast<std::size_t>(ifs.tellg());
  ifs.seekg(0);
  std::vector<std::uint8_t> buf(n);
  if (n)
    ifs.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(n));
  if (!ifs)
    throw Error(Errc::io_error, "short read: " + p.string());
  return buf;
}

// FileImage

FileImage::~FileImage() { release(); }

FileImage::FileImage(FileImage &&other) noexcept
    : map_addr_(std::exchange(other.map_addr_, nullptr)),
      map_len_(std::exchange(other.map_len_, 0)), owned_(std::move(other.owned_)) {}

FileImage &FileImage::operator=(FileImage &&other) noexcept {
  if (this != &other) {
    release();
    map_addr_ = std::exchange(other.map_addr_, nullptr);
    map_len_ = std::exchange(other.map_len_, 0);
    owned_ = std::move(other.owned_);
  }
  return *this;
}

void FileImage::release() noexcept {
  if (map_addr_ != nullptr) {
    ::munmap(map_addr_, map_len_);
    map_addr_ = nullptr;
    map_len_ = 0;
  }
  owned_.clear();
}

FileImage FileImage::map(const std::filesystem::path &p) {
  const int fd = ::open(p.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    throw Error(Errc::io_error, "open failed: " + p.string() + ": " + std::strerror(errno));
  }
  struct stat sb {};
  if (::fstat(fd, &sb) < 0) {
    const int err = errno;
    ::close(fd);
    throw Error(Errc::io_error, "stat failed: " + p.string() + ": " + std::strerror(err));
  }

  FileImage img;
  const auto len = static_cast<std::size_t>(sb.st_size);
  if (len == 0) {
    // mmap rejects zero-length mappings
    ::close(fd);
    return img;
  }
  void *addr = ::mmap(nullptr, len, PROT_READ, MAP_PRIVATE, fd, 0);
  const int err = errno;
  ::close(fd); // the mapping keeps its own reference
  if (addr == MAP_FAILED) {
    throw Error(Errc::io_error, "mmap failed: " + p.string() + ": " + std::strerror(err));
  }
  img.map_addr_ = addr;
  img.map_len_ = len;
  return img;
}

FileImage FileImage::adopt(std::vector<std::uint8_t> bytes) {
  FileImage img;
  img.owned_ = std::move(bytes);
  return img;
}

std::span<const std::uint8_t> FileImage::bytes() const {
  if (map_addr_ != nullptr) {
    return {static_cast<const std::uint8_t *>(map_addr_), map_len_};
  }
  return {owned_.data(), owned_.size()};
}

} // namespace gitpeek::fs
