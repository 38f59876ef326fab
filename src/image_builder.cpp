#include <exception>
#include <format>
#include <utility>

#include <nli/entry_tree.hpp>
#include <nli/file_entry.hpp>
#include <nli/image_builder.hpp>
#include <nli/layout.hpp>
#include <nli/log.hpp>
#include <nli/manifest.hpp>
#include <nli/packager.hpp>

namespace nli {

namespace {

void report(ErrorInfo *outError, ErrorCode code, std::string message) {
  NLI_LOG(Error) << toString(code) << ": " << message;
  if (outError) {
    outError->code = code;
    outError->message = std::move(message);
  }
}

// Run op, turning anything it throws into an ErrorInfo report
template <typename Result, typename Op>
std::optional<Result> guarded(ErrorInfo *outError, Op &&op) {
  try {
    return op();
  } catch (const Error &e) {
    report(outError, e.code(), e.what());
  } catch (const std::filesystem::filesystem_error &e) {
    report(outError, ErrorCode::PackagingIOError, e.what());
  } catch (const std::exception &e) {
    report(outError, ErrorCode::UnhandledException, e.what());
  }
  return std::nullopt;
}

} // namespace

ImageBuilder::ImageBuilder() : ImageBuilder(BuildConfig{}) {}

ImageBuilder::ImageBuilder(BuildConfig config)
    : tree_(std::make_unique<EntryTree>(std::move(config))) {}

ImageBuilder::~ImageBuilder() = default;

ImageBuilder::ImageBuilder(ImageBuilder &&) noexcept = default;

ImageBuilder &ImageBuilder::operator=(ImageBuilder &&) noexcept = default;

std::optional<ImageBuilder> ImageBuilder::fromConfigFile(const std::filesystem::path &path,
                                                         ErrorInfo *outError) {
  std::string error;
  auto config = ConfigLoader::load(path, &error);
  if (!config) {
    report(outError, ErrorCode::InvalidArgument, error);
    return std::nullopt;
  }
  return ImageBuilder(std::move(*config));
}

std::optional<std::string> ImageBuilder::addFile(const std::filesystem::path &path,
                                                 std::string mimeType,
                                                 std::optional<std::string> parentId,
                                                 ErrorInfo *outError) {
  return guarded<std::string>(outError, [&] {
    return addEntryOrThrow(std::make_unique<FileEntry>(path, std::move(mimeType),
                                                       std::move(parentId)));
  });
}

std::optional<std::string> ImageBuilder::addDirectory(std::string name,
                                                      std::optional<std::string> parentId,
                                                      ErrorInfo *outError) {
  return guarded<std::string>(outError, [&] {
    return addEntryOrThrow(std::make_unique<DirectoryEntry>(std::move(name), std::move(parentId)));
  });
}

std::optional<std::string> ImageBuilder::addDirectory(const Mapping &fields,
                                                      std::optional<std::string> parentId,
                                                      ErrorInfo *outError) {
  return guarded<std::string>(outError, [&] {
    return addEntryOrThrow(std::make_unique<DirectoryEntry>(fields, std::move(parentId)));
  });
}

std::optional<std::string> ImageBuilder::addMapping(Mapping fields, std::string mimeType,
                                                    std::optional<std::string> parentId,
                                                    ErrorInfo *outError) {
  return guarded<std::string>(outError, [&] {
    return addEntryOrThrow(std::make_unique<MappingEntry>(std::move(fields), std::move(mimeType),
                                                          std::move(parentId)));
  });
}

std::optional<std::string> ImageBuilder::addEntry(std::unique_ptr<Entry> entry,
                                                  ErrorInfo *outError) {
  return guarded<std::string>(outError, [&] { return addEntryOrThrow(std::move(entry)); });
}

std::string ImageBuilder::addEntryOrThrow(std::unique_ptr<Entry> entry) {
  if (sealed_) {
    throw Error(ErrorCode::InvalidArgument, "Image already saved; no further entries accepted");
  }
  size_t before = tree_->size();
  std::string id = tree_->add(std::move(entry));
  NLI_LOG(Info) << "Added " << id << " (" << tree_->size() - before << " entries)";
  return id;
}

bool ImageBuilder::addField(std::string_view id, const Field &field, ErrorInfo *outError) {
  return guarded<bool>(outError, [&] {
           mutableEntry(id)->addField(field.clone());
           return true;
         })
      .has_value();
}

bool ImageBuilder::replaceField(std::string_view id, const Field &field, ErrorInfo *outError) {
  return guarded<bool>(outError, [&] {
           mutableEntry(id)->replaceField(field.clone());
           return true;
         })
      .has_value();
}

Entry *ImageBuilder::mutableEntry(std::string_view id) {
  if (sealed_) {
    throw Error(ErrorCode::InvalidArgument, "Image already saved; entries can no longer change");
  }
  Entry *entry = tree_->find(id);
  if (!entry) {
    throw Error(ErrorCode::InvalidArgument, std::format("No entry with id {}", id));
  }
  return entry;
}

const Entry *ImageBuilder::findEntry(std::string_view id) const { return tree_->find(id); }

size_t ImageBuilder::entryCount() const { return tree_->size(); }

const BuildConfig &ImageBuilder::config() const { return tree_->config(); }

std::optional<std::string> ImageBuilder::buildManifest(ErrorInfo *outError) const {
  return guarded<std::string>(outError, [&] {
    ArchiveLayout layout = ArchiveLayout::plan(*tree_);
    return ManifestBuilder(*tree_, layout, tree_->config()).build();
  });
}

bool ImageBuilder::save(const std::filesystem::path &destPath, ErrorInfo *outError) {
  NLI_LOG(Info) << "Saving " << tree_->size() << " entries to " << destPath.string();
  bool ok = guarded<bool>(outError, [&] {
              Packager(*tree_, tree_->config()).write(destPath);
              return true;
            })
                .has_value();
  if (ok) {
    sealed_ = true;
  }
  return ok;
}

} // namespace nli
