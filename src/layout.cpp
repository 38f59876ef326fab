#include <format>
#include <unordered_set>

#include <nli/layout.hpp>
#include <nli/log.hpp>
#include <nli/names.hpp>

namespace nli {

namespace {

// "dir/report.txt" -> "dir/report_<id>.txt"; leaves without an extension (or dotfiles) get the
// suffix at the end
std::string withIdSuffix(const std::string &path, const std::string &id) {
  size_t leafStart = path.rfind('/');
  leafStart = leafStart == std::string::npos ? 0 : leafStart + 1;
  size_t dot = path.rfind('.');
  if (dot == std::string::npos || dot <= leafStart) {
    return std::format("{}_{}", path, id);
  }
  return std::format("{}_{}{}", path.substr(0, dot), id, path.substr(dot));
}

// Directory renamed away from a reserved path, and the prefix its descendants must swap
struct RenamedDirectory {
  std::string fromPrefix;
  std::string toPrefix;
};

} // namespace

ArchiveLayout ArchiveLayout::plan(const EntryTree &tree) {
  tree.validate();

  const std::unordered_set<std::string> reserved = {
      normalizeArchivePath(kMetadataDirectory),
      normalizeArchivePath(std::string(kMetadataDirectory) + "/"),
      normalizeArchivePath(kManifestPath),
      normalizeArchivePath(kImageMetadataPath),
      normalizeArchivePath(kManifestHashPath),
  };

  ArchiveLayout layout;
  std::unordered_set<std::string> taken = reserved;
  std::unordered_map<std::string, RenamedDirectory> renamed; // directory id -> prefixes

  for (const Entry *entry : tree.depthFirst()) {
    NativeKind kind = entry->nativeKind();
    if (kind == NativeKind::None) {
      continue;
    }

    std::string path = tree.relativePath(*entry);

    // Follow the nearest renamed ancestor
    for (const Entry *ancestor = entry; ancestor->parentId();) {
      ancestor = tree.find(*ancestor->parentId());
      auto it = renamed.find(ancestor->id());
      if (it != renamed.end()) {
        if (path.starts_with(it->second.fromPrefix)) {
          path = it->second.toPrefix + path.substr(it->second.fromPrefix.size());
        }
        break;
      }
    }

    if (kind == NativeKind::Directory) {
      std::string folder = path + '/';
      if (reserved.contains(normalizeArchivePath(folder))) {
        std::string moved = std::format("{}_{}/", path, entry->id());
        NLI_LOG(Warning) << "Directory " << folder << " is reserved; staging " << entry->id()
                         << " as " << moved;
        renamed[entry->id()] = {tree.relativePath(*entry) + '/', moved};
        folder = std::move(moved);
        taken.insert(normalizeArchivePath(folder));
        layout.members_.push_back({entry, folder});
      } else if (taken.insert(normalizeArchivePath(folder)).second) {
        layout.members_.push_back({entry, folder});
      } else {
        NLI_LOG(Debug) << "Directory " << folder << " already staged; sharing it";
      }
      layout.paths_[entry->id()] = std::move(folder);
      continue;
    }

    if (!taken.insert(normalizeArchivePath(path)).second) {
      std::string moved = withIdSuffix(path, entry->id());
      NLI_LOG(Warning) << "Container path " << path << " already used; staging " << entry->id()
                       << " as " << moved;
      path = std::move(moved);
      taken.insert(normalizeArchivePath(path));
    }

    layout.members_.push_back({entry, path});
    layout.paths_[entry->id()] = std::move(path);
  }

  return layout;
}

const std::string *ArchiveLayout::pathFor(std::string_view id) const {
  auto it = paths_.find(std::string(id));
  return it == paths_.end() ? nullptr : &it->second;
}

} // namespace nli
