#pragma once

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include "mmap.hpp"
#include "types.hpp"

namespace nli {

// Reads a finished ZIP container (memory-mapped)
class ZipReader {
public:
  ZipReader() = default;
  ~ZipReader() = default;

  // Delete copy, enable move
  ZipReader(const ZipReader &) = delete;
  ZipReader &operator=(const ZipReader &) = delete;
  ZipReader(ZipReader &&) noexcept = default;
  ZipReader &operator=(ZipReader &&) noexcept = default;

  // Open container from file
  // Returns std::nullopt on failure, with error message in outError if provided
  static std::optional<ZipReader> open(const std::filesystem::path &path,
                                       std::string *outError = nullptr);

  // Members in central directory order
  const std::vector<ArchiveEntry> &entries() const { return entries_; }

  size_t entryCount() const { return entries_.size(); }

  // Case-insensitive member lookup
  // Returns nullptr if member not found
  const ArchiveEntry *findEntry(const std::string &path) const;

  // Inflate a member into memory, verifying its CRC-32
  // Returns std::nullopt on failure, with error message in outError if provided
  std::optional<std::vector<uint8_t>> extractToMemory(const ArchiveEntry &entry,
                                                      std::string *outError = nullptr) const;

  // Member text, for manifest and metadata members
  std::optional<std::string> extractText(const std::string &path,
                                         std::string *outError = nullptr) const;

  bool isOpen() const;

  void close();

private:
  bool parse(std::string *outError);

  // Compressed bytes of a member; std::nullopt if the local header or bounds are invalid
  std::optional<std::span<const uint8_t>> payloadView(const ArchiveEntry &entry) const;

  MappedFile mappedFile_;
  std::vector<ArchiveEntry> entries_;
  std::unordered_map<std::string, size_t> lookup_; // lowercase path -> index
};

} // namespace nli
