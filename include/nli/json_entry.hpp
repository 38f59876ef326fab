#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "file_entry.hpp"
#include "mapping_entry.hpp"

namespace nli {

// A JSON scalar: one field holding the value, text is the value itself
class JsonValueEntry : public MappingEntry {
public:
  JsonValueEntry(std::string name, std::string key, FieldValue value,
                 std::optional<std::string> parentId = std::nullopt,
                 std::string mimeType = "application/x-json-value");

  std::string getName() const override { return name_; }
  std::optional<std::string> text() const override;

private:
  std::string name_;
  std::string key_;
};

// A JSON array: scalar elements as fields "0", "1", ...; nested elements become children
class JsonArrayEntry : public MappingEntry {
public:
  JsonArrayEntry(std::string name, Mapping scalars,
                 std::optional<std::string> parentId = std::nullopt,
                 std::string mimeType = "application/x-json-array");

  std::string getName() const override { return name_; }

  // Scalar elements joined with ", "
  std::optional<std::string> text() const override;

  std::string addAsParentPath(const std::string &existingPath) const override;

private:
  std::string name_;
};

// A JSON object: scalar members as fields; nested members become children
class JsonObjectEntry : public MappingEntry {
public:
  JsonObjectEntry(std::string name, Mapping scalars,
                  std::optional<std::string> parentId = std::nullopt,
                  std::string mimeType = "application/x-json-object");

  std::string getName() const override { return name_; }

  std::string addAsParentPath(const std::string &existingPath) const override;

private:
  std::string name_;
};

// Factories substituting custom types for each structural variant
using JsonValueGenerator = std::function<std::unique_ptr<Entry>(
    std::string name, std::string key, FieldValue value, std::string parentId)>;
using JsonArrayGenerator =
    std::function<std::unique_ptr<Entry>(std::string name, Mapping scalars, std::string parentId)>;
using JsonObjectGenerator =
    std::function<std::unique_ptr<Entry>(std::string name, Mapping scalars, std::string parentId)>;

// A JSON document and, once registered, its decomposition.
//
// The document is parsed at registration; invalid JSON fails with
// Error(MalformedSourceDocument). The root becomes a child named "JSON Object", "JSON Array"
// or "JSON Value" (single field "Value"). Nested objects and arrays become children named by
// their key or index, registered depth-first in document order. The walk uses an explicit
// stack, so nesting depth is limited by memory only.
class JsonFileEntry : public FileEntry {
public:
  explicit JsonFileEntry(const std::filesystem::path &path,
                         std::optional<std::string> parentId = std::nullopt,
                         std::string mimeType = "application/json");
  ~JsonFileEntry() override;

  void setValueGenerator(JsonValueGenerator generator) { valueGenerator_ = std::move(generator); }
  void setArrayGenerator(JsonArrayGenerator generator) { arrayGenerator_ = std::move(generator); }
  void setObjectGenerator(JsonObjectGenerator generator) {
    objectGenerator_ = std::move(generator);
  }

  // nullptr before registration
  const nlohmann::ordered_json *document() const { return document_.get(); }

  std::string addAsParentPath(const std::string &existingPath) const override;

protected:
  void populateStandardFields(const BuildConfig &config) override;
  void addChildren(EntryTree &tree) override;

private:
  std::unique_ptr<nlohmann::ordered_json> document_;
  JsonValueGenerator valueGenerator_;
  JsonArrayGenerator arrayGenerator_;
  JsonObjectGenerator objectGenerator_;
};

} // namespace nli
