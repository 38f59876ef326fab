#pragma once

#include <filesystem>
#include <string>

#include "config.hpp"
#include "entry_tree.hpp"
#include "types.hpp"

namespace nli {

// Writes a Nuix logical image container for an entry tree.
//
// The container is a ZIP archive holding the manifest, the image metadata, the SHA-1 of the
// manifest and every entry payload at its layout path. Output goes to "<dest>.partial" first and
// is renamed onto dest only when complete, so a failed write leaves dest as it was.
class Packager {
public:
  Packager(const EntryTree &tree, const BuildConfig &config);

  // Throws Error(PackagingIOError), or the tree validation errors
  void write(const std::filesystem::path &destPath) const;

  // image_metadata.xml contents
  std::string imageMetadata(Timestamp created) const;

private:
  const EntryTree &tree_;
  const BuildConfig &config_;
};

} // namespace nli
