#include <algorithm>
#include <cctype>
#include <format>

#include <nli/datetime.hpp>
#include <nli/digest.hpp>
#include <nli/mapping_entry.hpp>

namespace nli {

namespace {

bool containsNameCaseInsensitive(std::string_view key) {
  static constexpr std::string_view needle = "name";
  auto it = std::search(key.begin(), key.end(), needle.begin(), needle.end(), [](char a, char b) {
    return std::tolower(static_cast<unsigned char>(a)) == b;
  });
  return it != key.end();
}

// Later duplicates overwrite earlier values, keeping the first position
Mapping collapseDuplicates(Mapping data) {
  Mapping result;
  result.reserve(data.size());
  for (auto &[key, value] : data) {
    auto it = std::find_if(result.begin(), result.end(),
                           [&key](const auto &existing) { return existing.first == key; });
    if (it != result.end()) {
      it->second = std::move(value);
    } else {
      result.emplace_back(std::move(key), std::move(value));
    }
  }
  return result;
}

} // namespace

std::string mappingDisplayName(const Mapping &data) {
  if (data.empty()) {
    return {};
  }
  auto it = std::find_if(data.begin(), data.end(),
                         [](const auto &item) { return containsNameCaseInsensitive(item.first); });
  if (it == data.end()) {
    it = data.begin();
  }
  return renderValue(it->second);
}

MappingEntry::MappingEntry(Mapping data, std::string mimeType, std::optional<std::string> parentId)
    : Entry(std::move(mimeType), std::move(parentId)), data_(collapseDuplicates(std::move(data))) {
  for (const auto &[key, value] : data_) {
    putField(FieldFactory::infer(key, value));
  }
}

const FieldValue *MappingEntry::value(std::string_view key) const {
  auto it = std::find_if(data_.begin(), data_.end(),
                         [key](const auto &item) { return item.first == key; });
  return it == data_.end() ? nullptr : &it->second;
}

std::string MappingEntry::getName() const {
  return mappingDisplayName(data_);
}

std::optional<std::string> MappingEntry::text() const {
  return renderData();
}

std::optional<Timestamp> MappingEntry::itemDate() const {
  auto key = timeField();
  if (!key) {
    return std::nullopt;
  }

  const FieldValue *raw = value(*key);
  if (!raw) {
    throw Error(ErrorCode::DateParseError,
                std::format("Time field '{}' is not present in the record", *key));
  }

  if (const auto *ts = std::get_if<Timestamp>(raw)) {
    return *ts;
  }
  if (std::holds_alternative<std::monostate>(*raw)) {
    return std::nullopt;
  }
  if (const auto *text = std::get_if<std::string>(raw)) {
    if (text->empty()) {
      return std::nullopt;
    }
    if (auto parsed = parseTimestamp(*text, itemDateFormat())) {
      return parsed;
    }
    throw Error(ErrorCode::DateParseError,
                std::format("Time field '{}' value '{}' does not match format '{}'", *key, *text,
                            itemDateFormat()));
  }

  throw Error(ErrorCode::DateParseError,
              std::format("Time field '{}' does not hold a date or a string", *key));
}

std::string MappingEntry::nativeMd5() const {
  Digest md5(DigestAlgorithm::Md5);
  md5.update(text().value_or(std::string()));
  return md5.finishHex();
}

std::string MappingEntry::digest() const {
  return sha1Hex(renderData());
}

std::string MappingEntry::renderData() const {
  std::string rendered;
  for (const auto &[key, value] : data_) {
    if (!rendered.empty()) {
      rendered += '\n';
    }
    rendered += key;
    rendered += ": ";
    rendered += renderValue(value);
  }
  return rendered;
}

} // namespace nli
