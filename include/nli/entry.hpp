#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "config.hpp"
#include "field.hpp"
#include "types.hpp"

namespace nli {

class EntryTree;

// How an entry's payload appears in the container
enum class NativeKind {
  None,      // Manifest record only
  File,      // Bytes copied from nativePath()
  Text,      // Generated text artifact holding text()
  Directory, // Directory member, no bytes
};

// Names of the fields every entry receives at registration
namespace standard_fields {
inline constexpr std::string_view Name = "Name";
inline constexpr std::string_view ItemDate = "Item Date";
inline constexpr std::string_view Sha1 = "SHA-1";
inline constexpr std::string_view MimeType = "MIME Type";
inline constexpr std::string_view PathName = "Path Name";
inline constexpr std::string_view FileAccessed = "File Accessed";
inline constexpr std::string_view FileCreated = "File Created";
inline constexpr std::string_view FileModified = "File Modified";
inline constexpr std::string_view FileOwner = "File Owner";
inline constexpr std::string_view FileSize = "File Size";
} // namespace standard_fields

// One item of the case hierarchy.
//
// Concrete entries override the hooks below; everything else (fields, id, parent link) is
// managed here. An entry is registered exactly once with an EntryTree, which assigns its id,
// fills the standard fields and, for composite entries, registers the children produced by
// addChildren().
//
// Fields keep insertion order. Standard fields are written at registration; a caller field
// with a standard name is only kept when it was put there through replaceField().
class Entry {
public:
  explicit Entry(std::string mimeType, std::optional<std::string> parentId = std::nullopt);
  virtual ~Entry() = default;

  Entry(const Entry &) = delete;
  Entry &operator=(const Entry &) = delete;

  // Empty until registered
  const std::string &id() const { return id_; }
  bool isRegistered() const { return !id_.empty(); }

  const std::optional<std::string> &parentId() const { return parentId_; }

  // Only allowed before registration; throws Error(InvalidArgument) afterwards
  void setParentId(std::optional<std::string> parentId);

  const std::string &mimeType() const { return mimeType_; }

  // Raw display name before sanitation
  virtual std::string getName() const = 0;

  // Effective, filesystem-safe name; falls back to the id when nothing usable remains
  std::string name() const;

  // Field whose value is the entry's natural identifier, if any
  virtual std::optional<std::string> identifierField() const { return std::nullopt; }

  // Full-text content
  virtual std::optional<std::string> text() const { return std::nullopt; }

  // Timeline date; may throw Error(DateParseError)
  virtual std::optional<Timestamp> itemDate() const { return std::nullopt; }

  // Path seen by descendants: containers prepend their own name, other entries return it as is
  virtual std::string addAsParentPath(const std::string &existingPath) const {
    return existingPath;
  }

  virtual NativeKind nativeKind() const { return NativeKind::None; }

  // Source of NativeKind::File bytes
  virtual std::filesystem::path nativePath() const { return {}; }

  // MD5 (hex) of the native payload, written as the ExternalFile hash
  virtual std::string nativeMd5() const { return {}; }

  // SHA-1 (hex) stored in the SHA-1 field
  virtual std::string digest() const;

  const std::vector<Field> &fields() const { return fields_; }

  // nullptr when absent
  const Field *findField(std::string_view name) const;

  bool hasField(std::string_view name) const { return findField(name) != nullptr; }

  // Append a new field; throws Error(DuplicateField) when the name exists or is a standard name
  void addField(Field field);

  // Insert or overwrite explicitly; survives standard field population
  void replaceField(Field field);

  // Throws Error(UnknownField) or Error(InvalidFieldType)
  void setFieldValue(std::string_view name, FieldValue value);

  static bool isStandardFieldName(std::string_view name);

protected:
  // Called once the id is assigned; fills the standard fields
  virtual void populateStandardFields(const BuildConfig &config);

  // Composite entries register their children here; called after this entry is stored
  virtual void addChildren(EntryTree &tree);

  // Insert or overwrite in place, unless the field was replaced explicitly
  void putField(Field field);

private:
  friend class EntryTree;

  std::string id_;
  std::optional<std::string> parentId_;
  std::string mimeType_;
  std::vector<Field> fields_;
  std::unordered_set<std::string> replaced_;
};

} // namespace nli
