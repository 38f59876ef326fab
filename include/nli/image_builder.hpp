#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "config.hpp"
#include "field.hpp"
#include "mapping_entry.hpp"
#include "types.hpp"

namespace nli {

// Forward declarations
class Entry;
class EntryTree;

// Builds one logical image: register entries, attach fields, then save the container.
//
// Every operation reports failure through its return value and an optional ErrorInfo; no
// exception escapes. Exceptions other than nli::Error, such as one thrown by a row generator,
// are reported as UnhandledException. Entries registered before a failure stay registered.
// After a successful save() the session is sealed: registrations and field changes fail with
// InvalidArgument, while buildManifest() and save() keep working.
//
// Not thread-safe; use one builder per thread.
class ImageBuilder {
public:
  ImageBuilder();
  explicit ImageBuilder(BuildConfig config);
  ~ImageBuilder();

  // Delete copy, enable move
  ImageBuilder(const ImageBuilder &) = delete;
  ImageBuilder &operator=(const ImageBuilder &) = delete;
  ImageBuilder(ImageBuilder &&) noexcept;
  ImageBuilder &operator=(ImageBuilder &&) noexcept;

  // Builder configured from a JSON settings file (see ConfigLoader)
  // Returns std::nullopt on failure, with the reason in outError if provided
  static std::optional<ImageBuilder> fromConfigFile(const std::filesystem::path &path,
                                                    ErrorInfo *outError = nullptr);

  // Register a native file; its bytes are hashed now and copied during save()
  std::optional<std::string> addFile(const std::filesystem::path &path, std::string mimeType,
                                     std::optional<std::string> parentId = std::nullopt,
                                     ErrorInfo *outError = nullptr);

  std::optional<std::string> addDirectory(std::string name,
                                          std::optional<std::string> parentId = std::nullopt,
                                          ErrorInfo *outError = nullptr);

  // Directory named by the mapping naming rule, carrying the mapping as fields
  std::optional<std::string> addDirectory(const Mapping &fields,
                                          std::optional<std::string> parentId = std::nullopt,
                                          ErrorInfo *outError = nullptr);

  std::optional<std::string> addMapping(Mapping fields, std::string mimeType,
                                        std::optional<std::string> parentId = std::nullopt,
                                        ErrorInfo *outError = nullptr);

  // Register any entry, including composites (CSV, JSON) and custom types
  std::optional<std::string> addEntry(std::unique_ptr<Entry> entry, ErrorInfo *outError = nullptr);

  // Attach a copy of field to entry id; fails on duplicate or standard names
  bool addField(std::string_view id, const Field &field, ErrorInfo *outError = nullptr);

  // Insert or overwrite a copy of field, standard names included
  bool replaceField(std::string_view id, const Field &field, ErrorInfo *outError = nullptr);

  // nullptr if id is unknown
  const Entry *findEntry(std::string_view id) const;

  size_t entryCount() const;

  bool isSealed() const { return sealed_; }

  // Manifest text without writing a container
  std::optional<std::string> buildManifest(ErrorInfo *outError = nullptr) const;

  // Write the container to destPath; destPath is left untouched on failure
  bool save(const std::filesystem::path &destPath, ErrorInfo *outError = nullptr);

  const EntryTree &tree() const { return *tree_; }
  const BuildConfig &config() const;

private:
  std::string addEntryOrThrow(std::unique_ptr<Entry> entry);
  Entry *mutableEntry(std::string_view id);

  std::unique_ptr<EntryTree> tree_;
  bool sealed_ = false;
};

} // namespace nli
