#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>

namespace nli {

// RAII wrapper for read-only memory-mapped files (POSIX)
// Backs the container reader and the writer's source files
class MappedFile {
public:
  MappedFile();
  ~MappedFile();

  // Delete copy, enable move
  MappedFile(const MappedFile &) = delete;
  MappedFile &operator=(const MappedFile &) = delete;
  MappedFile(MappedFile &&other) noexcept;
  MappedFile &operator=(MappedFile &&other) noexcept;

  // Map an existing, non-empty file for reading
  bool openRead(const std::filesystem::path &path, std::string *outError = nullptr);

  std::span<const uint8_t> data() const {
    return std::span<const uint8_t>(static_cast<const uint8_t *>(data_), size_);
  }

  void close();

  bool isOpen() const { return data_ != nullptr; }

  size_t size() const { return size_; }

  const std::filesystem::path &path() const { return path_; }

private:
  void cleanup() noexcept;

  int fd_ = -1;
  void *data_ = nullptr;
  size_t size_ = 0;
  std::filesystem::path path_;
};

} // namespace nli
