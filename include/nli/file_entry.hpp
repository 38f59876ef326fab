#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "digest.hpp"
#include "entry.hpp"
#include "mapping_entry.hpp"

namespace nli {

// A file on disk, copied into the container as a native.
//
// Stat metadata and the SHA-1/MD5 digests are captured at registration; reading or stat'ing the
// file fails with Error(PackagingIOError).
class FileEntry : public Entry {
public:
  FileEntry(const std::filesystem::path &path, std::string mimeType,
            std::optional<std::string> parentId = std::nullopt);

  // Absolute path of the source file
  const std::filesystem::path &filePath() const { return path_; }

  std::string getName() const override;
  std::optional<Timestamp> itemDate() const override { return itemDate_; }

  NativeKind nativeKind() const override { return NativeKind::File; }
  std::filesystem::path nativePath() const override { return path_; }
  std::string nativeMd5() const override { return digests_.md5; }
  std::string digest() const override { return digests_.sha1; }

  uint64_t fileSize() const { return digests_.size; }

protected:
  void populateStandardFields(const BuildConfig &config) override;

private:
  std::filesystem::path path_;
  FileDigests digests_;
  std::optional<Timestamp> itemDate_;
};

// A folder of the case; one nesting level, no native bytes
class DirectoryEntry : public Entry {
public:
  explicit DirectoryEntry(std::string name, std::optional<std::string> parentId = std::nullopt);

  // Directory carrying the record's fields; named by the mapping naming rule
  explicit DirectoryEntry(const Mapping &fields, std::optional<std::string> parentId = std::nullopt);

  std::string getName() const override { return name_; }

  std::string addAsParentPath(const std::string &existingPath) const override;

  NativeKind nativeKind() const override { return NativeKind::Directory; }

private:
  std::string name_;
};

} // namespace nli
