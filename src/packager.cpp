#include <format>
#include <span>
#include <sstream>
#include <system_error>

#include <pugixml.hpp>

#include <nli/datetime.hpp>
#include <nli/digest.hpp>
#include <nli/layout.hpp>
#include <nli/log.hpp>
#include <nli/manifest.hpp>
#include <nli/packager.hpp>
#include <nli/zip_writer.hpp>

namespace nli {

namespace {

std::span<const uint8_t> bytesOf(std::string_view text) {
  return {reinterpret_cast<const uint8_t *>(text.data()), text.size()};
}

void check(bool ok, const std::string &error) {
  if (!ok) {
    throw Error(ErrorCode::PackagingIOError, error);
  }
}

// Removes the partial output unless released
class PartialFile {
public:
  explicit PartialFile(std::filesystem::path path) : path_(std::move(path)) {}
  ~PartialFile() {
    if (!released_) {
      std::error_code ec;
      std::filesystem::remove(path_, ec);
    }
  }

  PartialFile(const PartialFile &) = delete;
  PartialFile &operator=(const PartialFile &) = delete;

  const std::filesystem::path &path() const { return path_; }
  void release() { released_ = true; }

private:
  std::filesystem::path path_;
  bool released_ = false;
};

} // namespace

Packager::Packager(const EntryTree &tree, const BuildConfig &config)
    : tree_(tree), config_(config) {}

std::string Packager::imageMetadata(Timestamp created) const {
  pugi::xml_document doc;
  pugi::xml_node declaration = doc.append_child(pugi::node_declaration);
  declaration.append_attribute("version").set_value("1.0");
  declaration.append_attribute("encoding").set_value("UTF-8");

  pugi::xml_node properties = doc.append_child("image-metadata").append_child("properties");
  auto property = [&properties](const char *key, const std::string &value) {
    pugi::xml_node node = properties.append_child("property");
    node.append_attribute("key").set_value(key);
    node.append_attribute("value").set_value(value.c_str());
  };

  property("case-number", config_.caseNumber);
  property("creation-datetime", formatMetadataTimestamp(created));
  property("creation-software-name", config_.softwareName);
  property("creation-software-version", config_.softwareVersion);
  property("evidence-number", config_.evidenceNumber);
  property("examiner-name", config_.examinerName);

  std::ostringstream out;
  doc.save(out, "    ", pugi::format_default, pugi::encoding_utf8);
  return out.str();
}

void Packager::write(const std::filesystem::path &destPath) const {
  ArchiveLayout layout = ArchiveLayout::plan(tree_);
  std::string manifest = ManifestBuilder(tree_, layout, config_).build();
  std::string metadata = imageMetadata(now());
  std::vector<uint8_t> manifestHash = sha1(bytesOf(manifest));

  ZipWriter zip(config_.compressionLevel);
  std::string error;

  check(zip.addDirectory(std::string(kMetadataDirectory), &error), error);
  check(zip.addFile(bytesOf(manifest), std::string(kManifestPath), &error), error);
  check(zip.addFile(bytesOf(metadata), std::string(kImageMetadataPath), &error), error);
  check(zip.addFile(manifestHash, std::string(kManifestHashPath), &error), error);

  for (const StagedMember &member : layout.members()) {
    const Entry &entry = *member.entry;
    switch (entry.nativeKind()) {
    case NativeKind::Directory:
      check(zip.addDirectory(member.archivePath, &error), error);
      break;
    case NativeKind::File:
      check(zip.addFile(entry.nativePath(), member.archivePath, &error), error);
      break;
    case NativeKind::Text: {
      std::string text = entry.text().value_or("");
      check(zip.addFile(bytesOf(text), member.archivePath, &error), error);
      break;
    }
    case NativeKind::None:
      break;
    }
  }

  NLI_LOG(Info) << "Packaging " << zip.memberCount() << " members into " << destPath.string();

  PartialFile partial(std::filesystem::path(destPath) += ".partial");
  if (!zip.write(partial.path(), &error)) {
    throw Error(ErrorCode::PackagingIOError,
                std::format("Failed to write {}: {}", destPath.string(), error));
  }

  std::error_code ec;
  std::filesystem::rename(partial.path(), destPath, ec);
  if (ec) {
    throw Error(ErrorCode::PackagingIOError,
                std::format("Failed to move container into place at {}: {}", destPath.string(),
                            ec.message()));
  }
  partial.release();

  NLI_LOG(Info) << "Wrote " << destPath.string();
}

} // namespace nli
