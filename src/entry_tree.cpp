#include <format>
#include <unordered_set>

#include <nli/digest.hpp>
#include <nli/entry_tree.hpp>
#include <nli/log.hpp>
#include <nli/names.hpp>

namespace nli {

EntryTree::EntryTree(BuildConfig config) : config_(std::move(config)) {}

EntryTree::~EntryTree() = default;

EntryTree::EntryTree(EntryTree &&) noexcept = default;

EntryTree &EntryTree::operator=(EntryTree &&) noexcept = default;

std::string EntryTree::assignId(const Entry &entry) {
  if (auto key = entry.identifierField()) {
    const Field *field = entry.findField(*key);
    if (field && field->hasValue()) {
      std::string natural = field->toString(config_.timeZoneSuffix);
      if (!natural.empty() && !entries_.contains(natural)) {
        return natural;
      }
      NLI_LOG(Warning) << "Identifier '" << natural << "' from field '" << *key
                       << "' is empty or already in use; generating an id";
    } else {
      NLI_LOG(Debug) << "Identifier field '" << *key << "' has no value; generating an id";
    }
  }

  std::string material = sanitizeName(entry.getName(), "");
  material += '\0';
  material += entry.parentId().value_or("");
  material += '\0';

  for (;;) {
    std::string id = sha1Hex(material + std::to_string(sequence_++));
    if (!entries_.contains(id)) {
      return id;
    }
    NLI_LOG(Warning) << "Generated id " << id << " already in use; retrying";
  }
}

std::string EntryTree::add(std::unique_ptr<Entry> entry) {
  if (!entry) {
    throw Error(ErrorCode::InvalidArgument, "Cannot register a null entry");
  }
  if (entry->isRegistered()) {
    throw Error(ErrorCode::InvalidArgument,
                std::format("Entry {} is already registered", entry->id()));
  }

  std::string id = assignId(*entry);

  // The new entry must not appear among its own ancestors
  std::optional<std::string> cursor = entry->parentId();
  for (size_t hops = 0; cursor && hops <= order_.size(); ++hops) {
    if (*cursor == id) {
      throw Error(ErrorCode::CyclicParentReference,
                  std::format("Entry {} would be its own ancestor", id));
    }
    const Entry *ancestor = find(*cursor);
    if (!ancestor) {
      break;
    }
    cursor = ancestor->parentId();
  }

  entry->id_ = id;
  entry->populateStandardFields(config_);

  Entry *stored = entry.get();
  entries_.emplace(id, std::move(entry));
  order_.push_back(id);
  if (stored->parentId()) {
    children_[*stored->parentId()].push_back(id);
  } else {
    roots_.push_back(id);
  }
  NLI_LOG(Debug) << "Registered " << id << ": " << stored->name();

  stored->addChildren(*this);
  return id;
}

Entry *EntryTree::find(std::string_view id) {
  auto it = entries_.find(std::string(id));
  return it == entries_.end() ? nullptr : it->second.get();
}

const Entry *EntryTree::find(std::string_view id) const {
  auto it = entries_.find(std::string(id));
  return it == entries_.end() ? nullptr : it->second.get();
}

const std::vector<std::string> &EntryTree::children(std::string_view id) const {
  static const std::vector<std::string> none;
  auto it = children_.find(std::string(id));
  return it == children_.end() ? none : it->second;
}

void EntryTree::validate() const {
  for (const auto &id : order_) {
    const Entry *entry = find(id);
    if (entry->parentId() && !contains(*entry->parentId())) {
      throw Error(ErrorCode::DanglingParentReference,
                  std::format("Entry {} ({}) references unknown parent {}", id, entry->name(),
                              *entry->parentId()));
    }
  }

  for (const auto &id : order_) {
    std::unordered_set<std::string> seen{id};
    const Entry *cursor = find(id);
    while (cursor->parentId()) {
      if (!seen.insert(*cursor->parentId()).second) {
        throw Error(ErrorCode::CyclicParentReference,
                    std::format("Entry {} is part of a parent cycle", id));
      }
      cursor = find(*cursor->parentId());
    }
  }
}

std::vector<const Entry *> EntryTree::depthFirst() const {
  std::vector<const Entry *> result;
  result.reserve(order_.size());

  std::vector<const std::string *> stack;
  for (auto it = roots_.rbegin(); it != roots_.rend(); ++it) {
    stack.push_back(&*it);
  }

  while (!stack.empty()) {
    const std::string *id = stack.back();
    stack.pop_back();
    result.push_back(find(*id));

    const auto &kids = children(*id);
    for (auto it = kids.rbegin(); it != kids.rend(); ++it) {
      stack.push_back(&*it);
    }
  }
  return result;
}

std::string EntryTree::relativePath(const Entry &entry) const {
  std::string path = entry.name();
  const Entry *cursor = &entry;
  size_t hops = 0;

  while (cursor->parentId()) {
    const Entry *parent = find(*cursor->parentId());
    if (!parent) {
      throw Error(ErrorCode::DanglingParentReference,
                  std::format("Entry {} references unknown parent {}", cursor->id(),
                              *cursor->parentId()));
    }
    if (++hops > order_.size()) {
      throw Error(ErrorCode::CyclicParentReference,
                  std::format("Entry {} is part of a parent cycle", entry.id()));
    }
    path = parent->addAsParentPath(path);
    cursor = parent;
  }
  return path;
}

} // namespace nli
