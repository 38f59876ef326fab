#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "entry.hpp"

namespace nli {

// Ordered key/value record; a repeated key overwrites the earlier value in place
using Mapping = std::vector<std::pair<std::string, FieldValue>>;

// Display name of a record: the value of the first key containing "name" (any case),
// otherwise the first value
std::string mappingDisplayName(const Mapping &data);

// Key/value record such as a database row or a JSON object.
//
// Each key becomes a field whose type is inferred from its value. The record has no native file;
// its text (one "key: value" line per data field) is written to the container as a generated
// text artifact. Subclasses override getName(), timeField() or itemDateFormat() when the generic
// rules do not fit the data.
class MappingEntry : public Entry {
public:
  MappingEntry(Mapping data, std::string mimeType,
               std::optional<std::string> parentId = std::nullopt);

  const Mapping &data() const { return data_; }

  // nullptr when the key is absent
  const FieldValue *value(std::string_view key) const;

  std::string getName() const override;
  std::optional<std::string> text() const override;

  // Parses timeField() with itemDateFormat(); throws Error(DateParseError) on mismatch
  std::optional<Timestamp> itemDate() const override;

  // Key holding the record's timeline date
  virtual std::optional<std::string> timeField() const { return std::nullopt; }

  // strptime-style format of timeField(); fractional seconds and a zone suffix are accepted
  virtual std::string itemDateFormat() const { return "%Y-%m-%d %H:%M:%S"; }

  NativeKind nativeKind() const override { return NativeKind::Text; }
  std::string nativeMd5() const override;
  std::string digest() const override;

protected:
  // "key: value" lines over the data fields, joined with '\n'
  std::string renderData() const;

private:
  Mapping data_;
};

} // namespace nli
