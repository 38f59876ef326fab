#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "config.hpp"
#include "entry.hpp"

namespace nli {

// Owns the registered entries and their parent/child structure.
//
// Ids are unique for the lifetime of the tree. An entry's natural identifier is used when it
// names one that is non-empty and unused; otherwise the id is the SHA-1 of the effective name,
// the parent id and a registration sequence number. Ids are opaque and not reproducible across
// sessions.
//
// A parent may be registered after its children; validate() reports parents that never
// appeared. Siblings keep registration order.
class EntryTree {
public:
  explicit EntryTree(BuildConfig config = {});
  ~EntryTree();

  EntryTree(const EntryTree &) = delete;
  EntryTree &operator=(const EntryTree &) = delete;
  EntryTree(EntryTree &&) noexcept;
  EntryTree &operator=(EntryTree &&) noexcept;

  // Register entry and, for composites, its children. Returns the assigned id.
  // Throws Error (InvalidArgument, CyclicParentReference, or whatever population raises);
  // an entry whose registration fails is not stored.
  std::string add(std::unique_ptr<Entry> entry);

  Entry *find(std::string_view id);
  const Entry *find(std::string_view id) const;

  bool contains(std::string_view id) const { return find(id) != nullptr; }

  size_t size() const { return order_.size(); }
  bool empty() const { return order_.empty(); }

  // Ids in registration order
  const std::vector<std::string> &ids() const { return order_; }

  // Ids of entries without a parent, in registration order
  const std::vector<std::string> &roots() const { return roots_; }

  // Registered children of id, in registration order
  const std::vector<std::string> &children(std::string_view id) const;

  // Throws Error(DanglingParentReference) or Error(CyclicParentReference)
  void validate() const;

  // Roots in registration order, each followed by its descendants (pre-order)
  std::vector<const Entry *> depthFirst() const;

  // Container path: the entry's name wrapped by each ancestor's addAsParentPath, nearest first
  std::string relativePath(const Entry &entry) const;

  const BuildConfig &config() const { return config_; }

private:
  std::string assignId(const Entry &entry);

  BuildConfig config_;
  uint64_t sequence_ = 0;
  std::unordered_map<std::string, std::unique_ptr<Entry>> entries_;
  std::vector<std::string> order_;
  std::vector<std::string> roots_;
  std::unordered_map<std::string, std::vector<std::string>> children_;
};

} // namespace nli
