#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <span>
#include <string>
#include <unordered_set>
#include <vector>

#include "types.hpp"

namespace nli {

// Writes a ZIP container (deflate via zlib)
// Members are streamed to the destination one at a time; ZIP64 records are added once a count,
// size or offset outgrows the classic format
class ZipWriter {
public:
  explicit ZipWriter(int compressionLevel = -1) : compressionLevel_(compressionLevel) {}
  ~ZipWriter() = default;

  // Delete copy, enable move
  ZipWriter(const ZipWriter &) = delete;
  ZipWriter &operator=(const ZipWriter &) = delete;
  ZipWriter(ZipWriter &&) noexcept = default;
  ZipWriter &operator=(ZipWriter &&) noexcept = default;

  // Add file to container from disk; the bytes are read during write()
  // Returns true on success, false on failure (error in outError if provided)
  bool addFile(const std::filesystem::path &sourcePath, const std::string &archivePath,
               std::string *outError = nullptr);

  // Add file to container from memory
  bool addFile(std::span<const uint8_t> data, const std::string &archivePath,
               std::string *outError = nullptr);

  // Add an empty directory member (archivePath gets a trailing '/')
  bool addDirectory(const std::string &archivePath, std::string *outError = nullptr);

  // Write container to disk; nothing is left at destPath on failure
  // Returns true on success, false on failure (error in outError if provided)
  bool write(const std::filesystem::path &destPath, std::string *outError = nullptr);

  void clear();

  // Entries of the last successful write()
  const std::vector<ArchiveEntry> &entries() const { return entries_; }

  size_t memberCount() const { return pendingMembers_.size(); }

private:
  bool reservePath(const std::string &archivePath, std::string *outError);
  bool writeTo(std::ofstream &out, uint64_t &pos, std::vector<ArchiveEntry> &written,
               std::string *outError) const;

  struct PendingMember {
    std::string archivePath;          // Forward slashes, case preserved
    std::filesystem::path sourcePath; // Empty if from memory
    std::vector<uint8_t> data;        // Member data if from memory
    bool fromDisk = false;
  };

  int compressionLevel_;
  std::vector<PendingMember> pendingMembers_;
  std::unordered_set<std::string> normalizedPaths_; // Case-insensitive duplicate check
  std::vector<ArchiveEntry> entries_;
};

} // namespace nli
