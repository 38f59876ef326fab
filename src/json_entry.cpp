#include <format>
#include <fstream>
#include <limits>
#include <vector>

#include <nlohmann/json.hpp>

#include <nli/entry_tree.hpp>
#include <nli/json_entry.hpp>
#include <nli/log.hpp>

namespace nli {

namespace {

using ordered_json = nlohmann::ordered_json;

FieldValue scalarValue(const ordered_json &node) {
  switch (node.type()) {
  case ordered_json::value_t::string:
    return node.get<std::string>();
  case ordered_json::value_t::boolean:
    return node.get<bool>();
  case ordered_json::value_t::number_integer:
    return node.get<int64_t>();
  case ordered_json::value_t::number_unsigned: {
    auto value = node.get<uint64_t>();
    if (value <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
      return static_cast<int64_t>(value);
    }
    return static_cast<double>(value);
  }
  case ordered_json::value_t::number_float:
    return node.get<double>();
  default:
    return std::monostate{};
  }
}

// JSON null renders as "null" rather than an empty string
std::string renderScalar(const FieldValue &value) {
  if (std::holds_alternative<std::monostate>(value)) {
    return "null";
  }
  return renderValue(value);
}

std::unique_ptr<Entry> checked(std::unique_ptr<Entry> entry, const std::string &name) {
  if (!entry) {
    throw Error(ErrorCode::InvalidArgument,
                std::format("JSON entry generator returned no entry for '{}'", name));
  }
  return entry;
}

// Object or array still to be registered
struct PendingNode {
  const ordered_json *node = nullptr;
  std::string name;
  std::string parentId;
};

} // namespace

JsonValueEntry::JsonValueEntry(std::string name, std::string key, FieldValue value,
                               std::optional<std::string> parentId, std::string mimeType)
    : MappingEntry(Mapping{{key, std::move(value)}}, std::move(mimeType), std::move(parentId)),
      name_(std::move(name)), key_(std::move(key)) {}

std::optional<std::string> JsonValueEntry::text() const {
  const FieldValue *stored = value(key_);
  return stored ? renderScalar(*stored) : std::string("null");
}

JsonArrayEntry::JsonArrayEntry(std::string name, Mapping scalars,
                               std::optional<std::string> parentId, std::string mimeType)
    : MappingEntry(std::move(scalars), std::move(mimeType), std::move(parentId)),
      name_(std::move(name)) {}

std::optional<std::string> JsonArrayEntry::text() const {
  std::string joined;
  for (const auto &[index, element] : data()) {
    if (!joined.empty()) {
      joined += ", ";
    }
    joined += renderScalar(element);
  }
  return joined;
}

std::string JsonArrayEntry::addAsParentPath(const std::string &existingPath) const {
  return std::format("{}/{}", name(), existingPath);
}

JsonObjectEntry::JsonObjectEntry(std::string name, Mapping scalars,
                                 std::optional<std::string> parentId, std::string mimeType)
    : MappingEntry(std::move(scalars), std::move(mimeType), std::move(parentId)),
      name_(std::move(name)) {}

std::string JsonObjectEntry::addAsParentPath(const std::string &existingPath) const {
  return std::format("{}/{}", name(), existingPath);
}

JsonFileEntry::JsonFileEntry(const std::filesystem::path &path,
                             std::optional<std::string> parentId, std::string mimeType)
    : FileEntry(path, std::move(mimeType), std::move(parentId)) {}

JsonFileEntry::~JsonFileEntry() = default;

std::string JsonFileEntry::addAsParentPath(const std::string &existingPath) const {
  return std::format("{}/{}", name(), existingPath);
}

void JsonFileEntry::populateStandardFields(const BuildConfig &config) {
  FileEntry::populateStandardFields(config);

  std::ifstream in(filePath());
  if (!in) {
    throw Error(ErrorCode::MalformedSourceDocument,
                std::format("Failed to open JSON file: {}", filePath().string()));
  }

  try {
    document_ = std::make_unique<ordered_json>(ordered_json::parse(in));
  } catch (const nlohmann::json::exception &e) {
    throw Error(ErrorCode::MalformedSourceDocument,
                std::format("Invalid JSON in {}: {}", filePath().string(), e.what()));
  }
}

void JsonFileEntry::addChildren(EntryTree &tree) {
  if (!document_) {
    return;
  }

  auto makeValue = [this](std::string name, std::string key, FieldValue value,
                          std::string parentId) -> std::unique_ptr<Entry> {
    if (valueGenerator_) {
      return checked(valueGenerator_(name, std::move(key), std::move(value), std::move(parentId)),
                     name);
    }
    return std::make_unique<JsonValueEntry>(std::move(name), std::move(key), std::move(value),
                                            std::move(parentId));
  };
  auto makeStructure = [this](bool isObject, std::string name, Mapping scalars,
                              std::string parentId) -> std::unique_ptr<Entry> {
    if (isObject && objectGenerator_) {
      return checked(objectGenerator_(name, std::move(scalars), std::move(parentId)), name);
    }
    if (!isObject && arrayGenerator_) {
      return checked(arrayGenerator_(name, std::move(scalars), std::move(parentId)), name);
    }
    if (isObject) {
      return std::make_unique<JsonObjectEntry>(std::move(name), std::move(scalars),
                                               std::move(parentId));
    }
    return std::make_unique<JsonArrayEntry>(std::move(name), std::move(scalars),
                                            std::move(parentId));
  };

  const ordered_json &root = *document_;
  if (!root.is_structured()) {
    tree.add(makeValue("JSON Value", "Value", scalarValue(root), id()));
    return;
  }

  std::vector<PendingNode> stack;
  stack.push_back({&root, root.is_object() ? "JSON Object" : "JSON Array", id()});
  size_t registered = 0;

  while (!stack.empty()) {
    PendingNode current = std::move(stack.back());
    stack.pop_back();

    const ordered_json &node = *current.node;
    Mapping scalars;
    std::vector<PendingNode> nested;

    if (node.is_object()) {
      for (auto it = node.begin(); it != node.end(); ++it) {
        if (it->is_structured()) {
          nested.push_back({&*it, it.key(), {}});
        } else {
          scalars.emplace_back(it.key(), scalarValue(*it));
        }
      }
    } else {
      for (size_t index = 0; index < node.size(); ++index) {
        const ordered_json &element = node[index];
        if (element.is_structured()) {
          nested.push_back({&element, std::to_string(index), {}});
        } else {
          scalars.emplace_back(std::to_string(index), scalarValue(element));
        }
      }
    }

    std::string entryId = tree.add(makeStructure(node.is_object(), std::move(current.name),
                                                 std::move(scalars), std::move(current.parentId)));
    ++registered;

    // Reverse push keeps document order when popping
    for (auto it = nested.rbegin(); it != nested.rend(); ++it) {
      it->parentId = entryId;
      stack.push_back(std::move(*it));
    }
  }

  NLI_LOG(Debug) << "Decomposed " << filePath().string() << " into " << registered << " entries";
}

} // namespace nli
