#pragma once
#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

namespace gitpeek::fs {

bool exists(const std::filesystem::path& p);

std::vector<std::uint8_t> read_file(const std::filesystem::path& p);

/**
 * Immutable bytes of one file, loaded once and shared by every reader.
 * map() uses a private read-only mmap that is released on destruction;
 * adopt() wraps an in-memory buffer (tests, or files too small to be worth mapping).
 * Move-only.
 */
class FileImage {
public:
  FileImage() = default;
  ~FileImage();

  FileImage(FileImage&& other) noexcept;
  FileImage& operator=(FileImage&& other) noexcept;
  FileImage(const FileImage&) = delete;
  FileImage& operator=(const FileImage&) = delete;

  static FileImage map(const std::filesystem::path& p);
  static FileImage adopt(std::vector<std::uint8_t> bytes);

  [[nodiscard]] std::span<const std::uint8_t> bytes() const;
  [[nodiscard]] std::size_t size() const { return bytes().size(); }
  [[nodiscard]] bool mapped() const { return map_addr_ != nullptr; }

private:
  void release() noexcept;

  void* map_addr_ = nullptr;
  std::size_t map_len_ = 0;
  std::vector<std::uint8_t> owned_;
};

} // namespace gitpeek::fs
