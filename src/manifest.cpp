#include <sstream>
#include <unordered_map>
#include <vector>

#include <pugixml.hpp>

#include <nli/log.hpp>
#include <nli/manifest.hpp>
#include <nli/names.hpp>

namespace nli {

namespace {

using FieldKeys = std::unordered_map<std::string, std::string>;

void setAttribute(pugi::xml_node node, const char *name, std::string_view value) {
  node.append_attribute(name).set_value(sanitizeXmlText(value).c_str());
}

void setText(pugi::xml_node node, std::string_view value) {
  node.text().set(sanitizeXmlText(value).c_str());
}

void writeFieldDefinitions(pugi::xml_node root, const std::vector<const Entry *> &entries,
                           FieldKeys &keys) {
  pugi::xml_node fieldList = root.append_child("Fields");
  for (const Entry *entry : entries) {
    for (const Field &field : entry->fields()) {
      if (keys.contains(field.name())) {
        continue;
      }
      std::string key = "field_" + std::to_string(keys.size());
      pugi::xml_node definition = fieldList.append_child("Field");
      setAttribute(definition, "Name", field.name());
      setAttribute(definition, "DataType", toString(field.type()));
      setAttribute(definition, "Key", key);
      keys.emplace(field.name(), std::move(key));
    }
  }
}

void writeFiles(pugi::xml_node document, const Entry &entry, const std::string *archivePath) {
  NativeKind kind = entry.nativeKind();
  bool hasNative = archivePath && (kind == NativeKind::File || kind == NativeKind::Text);
  std::optional<std::string> text = entry.text();
  if (!hasNative && !text) {
    return;
  }

  pugi::xml_node files = document.append_child("Files");

  if (hasNative) {
    size_t slash = archivePath->rfind('/');
    std::string_view directory;
    std::string_view leaf = *archivePath;
    if (slash != std::string::npos) {
      directory = std::string_view(*archivePath).substr(0, slash);
      leaf = std::string_view(*archivePath).substr(slash + 1);
    }

    pugi::xml_node native = files.append_child("File");
    native.append_attribute("FileType").set_value("Native");
    pugi::xml_node external = native.append_child("ExternalFile");
    setAttribute(external, "FilePath", directory);
    setAttribute(external, "FileName", leaf);
    setAttribute(external, "Hash", entry.nativeMd5());
    external.append_attribute("HashType").set_value("MD5");
  }

  if (text) {
    pugi::xml_node textFile = files.append_child("File");
    textFile.append_attribute("FileType").set_value("Text");
    setText(textFile.append_child("InlineContent"), *text);
  }
}

void writeLocation(pugi::xml_node document, const std::string *archivePath,
                   const BuildConfig &config) {
  pugi::xml_node location = document.append_child("Locations").append_child("Location");
  setText(location.append_child("Custodian"), config.custodian);
  setText(location.append_child("Description"), "Location within Nuix case file");

  if (archivePath) {
    std::string_view path = *archivePath;
    if (path.ends_with('/')) {
      path.remove_suffix(1);
    }
    setText(location.append_child("LocationURI"), percentEncodePath(path));
  }
}

void writeDocument(pugi::xml_node documents, const Entry &entry, const FieldKeys &keys,
                   const ArchiveLayout &layout, const BuildConfig &config) {
  pugi::xml_node document = documents.append_child("Document");
  setAttribute(document, "DocID", entry.id());
  document.append_attribute("DocType").set_value("File");
  setAttribute(document, "MimeType", entry.mimeType());

  pugi::xml_node values = document.append_child("FieldValues");
  for (const Field &field : entry.fields()) {
    setText(values.append_child(keys.at(field.name()).c_str()),
            field.toString(config.timeZoneSuffix));
  }

  const std::string *archivePath = layout.pathFor(entry.id());
  writeFiles(document, entry, archivePath);
  writeLocation(document, archivePath, config);
}

// Folder elements nest like the tree; every non-root entry is listed in its parent's folder
void writeFolders(pugi::xml_node batch, const EntryTree &tree) {
  pugi::xml_node folders = batch.append_child("Folders");

  struct Pending {
    const std::string *id;
    pugi::xml_node container;
  };

  for (const std::string &root : tree.roots()) {
    std::vector<Pending> stack{{&root, folders}};
    while (!stack.empty()) {
      Pending current = stack.back();
      stack.pop_back();

      if (tree.find(*current.id)->parentId()) {
        setAttribute(current.container.append_child("Document"), "DocId", *current.id);
      }

      const auto &kids = tree.children(*current.id);
      if (kids.empty()) {
        continue;
      }

      pugi::xml_node folder = current.container.append_child("Folder");
      setAttribute(folder, "FolderName", *current.id);
      for (auto it = kids.rbegin(); it != kids.rend(); ++it) {
        stack.push_back({&*it, folder});
      }
    }
  }
}

} // namespace

ManifestBuilder::ManifestBuilder(const EntryTree &tree, const ArchiveLayout &layout,
                                 const BuildConfig &config)
    : tree_(tree), layout_(layout), config_(config) {}

std::string ManifestBuilder::build() const {
  tree_.validate();
  std::vector<const Entry *> entries = tree_.depthFirst();
  NLI_LOG(Info) << "Building manifest with " << entries.size() << " entries";

  pugi::xml_document doc;
  pugi::xml_node declaration = doc.append_child(pugi::node_declaration);
  declaration.append_attribute("version").set_value("1.0");
  declaration.append_attribute("encoding").set_value("UTF-8");
  declaration.append_attribute("standalone").set_value("yes");

  pugi::xml_node root = doc.append_child("Root");
  root.append_attribute("MajorVersion").set_value("1");
  root.append_attribute("MinorVersion").set_value("2");
  root.append_attribute("Description").set_value("EDRM XML Load File");
  setAttribute(root, "Locale", config_.locale);
  root.append_attribute("DataInterchangeType").set_value("Update");

  FieldKeys keys;
  writeFieldDefinitions(root, entries, keys);

  pugi::xml_node batch = root.append_child("Batch");
  pugi::xml_node documents = batch.append_child("Documents");
  for (const Entry *entry : entries) {
    NLI_LOG(Debug) << "Serializing " << entry->id() << ": " << entry->name();
    writeDocument(documents, *entry, keys, layout_, config_);
  }

  pugi::xml_node relationships = batch.append_child("Relationships");
  for (const Entry *entry : entries) {
    for (const std::string &child : tree_.children(entry->id())) {
      pugi::xml_node relationship = relationships.append_child("Relationship");
      relationship.append_attribute("Type").set_value("Container");
      setAttribute(relationship, "ParentDocId", entry->id());
      setAttribute(relationship, "ChildDocId", child);
    }
  }

  writeFolders(batch, tree_);

  std::ostringstream out;
  doc.save(out, "  ", pugi::format_default, pugi::encoding_utf8);
  return out.str();
}

} // namespace nli
