#pragma once

#include <string>

#include "config.hpp"
#include "entry_tree.hpp"
#include "layout.hpp"

namespace nli {

// Serializes an entry tree as an EDRM XML 1.2 load file.
//
// Documents are emitted depth-first from the roots in registration order. Field definitions get
// keys field_0, field_1, ... in the order their names are first seen; the first definition of a
// name fixes its DataType. Natives and LocationURIs refer to the container paths of layout.
class ManifestBuilder {
public:
  ManifestBuilder(const EntryTree &tree, const ArchiveLayout &layout, const BuildConfig &config);

  // UTF-8 document text; throws Error(DanglingParentReference) or Error(CyclicParentReference)
  std::string build() const;

private:
  const EntryTree &tree_;
  const ArchiveLayout &layout_;
  const BuildConfig &config_;
};

} // namespace nli
