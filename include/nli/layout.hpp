#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "entry.hpp"
#include "entry_tree.hpp"

namespace nli {

// Fixed members of a logical image container
inline constexpr std::string_view kMetadataDirectory = "._metadata";
inline constexpr std::string_view kManifestPath = "._metadata/image_contents.xml";
inline constexpr std::string_view kImageMetadataPath = "._metadata/image_metadata.xml";
inline constexpr std::string_view kManifestHashPath = "._metadata/image_contents.sha1_hash";

// Entry payload and its place in the container
struct StagedMember {
  const Entry *entry = nullptr;
  std::string archivePath; // Directory members end with '/'
};

// Container paths for every entry with a payload.
// Paths follow EntryTree::relativePath(). A file or text artifact whose path collides
// (case-insensitively) with an earlier member or a metadata member gets "_<id>" inserted before
// its extension. Directory entries resolving to the same folder share one directory member; a
// directory on the reserved metadata folder is moved to "<name>_<id>/" along with its contents.
class ArchiveLayout {
public:
  // Throws Error(DanglingParentReference) or Error(CyclicParentReference)
  static ArchiveLayout plan(const EntryTree &tree);

  // Members to write, depth-first in tree order
  const std::vector<StagedMember> &members() const { return members_; }

  // Container path of the entry's payload; nullptr for entries without one
  const std::string *pathFor(std::string_view id) const;

private:
  std::vector<StagedMember> members_;
  std::unordered_map<std::string, std::string> paths_; // id -> archive path
};

} // namespace nli
