#include <algorithm>
#include <array>
#include <format>

#include <nli/digest.hpp>
#include <nli/entry.hpp>
#include <nli/names.hpp>

namespace nli {

namespace {

constexpr std::array<std::string_view, 10> kStandardFieldNames = {
    standard_fields::Name,         standard_fields::ItemDate,     standard_fields::Sha1,
    standard_fields::MimeType,     standard_fields::PathName,     standard_fields::FileAccessed,
    standard_fields::FileCreated,  standard_fields::FileModified, standard_fields::FileOwner,
    standard_fields::FileSize,
};

} // namespace

Entry::Entry(std::string mimeType, std::optional<std::string> parentId)
    : parentId_(std::move(parentId)), mimeType_(std::move(mimeType)) {}

void Entry::setParentId(std::optional<std::string> parentId) {
  if (isRegistered()) {
    throw Error(ErrorCode::InvalidArgument,
                std::format("Cannot change the parent of registered entry {}", id_));
  }
  parentId_ = std::move(parentId);
}

std::string Entry::name() const {
  return sanitizeName(getName(), id_);
}

std::string Entry::digest() const {
  return sha1Hex(text().value_or(getName()));
}

const Field *Entry::findField(std::string_view name) const {
  auto it = std::find_if(fields_.begin(), fields_.end(),
                         [name](const Field &field) { return field.name() == name; });
  return it == fields_.end() ? nullptr : &*it;
}

void Entry::addField(Field field) {
  if (isStandardFieldName(field.name())) {
    throw Error(ErrorCode::DuplicateField,
                std::format("'{}' is a standard field; use replaceField to override it",
                            field.name()));
  }
  if (hasField(field.name())) {
    throw Error(ErrorCode::DuplicateField,
                std::format("Field '{}' already exists on this entry", field.name()));
  }
  fields_.push_back(std::move(field));
}

void Entry::replaceField(Field field) {
  replaced_.insert(field.name());
  auto it = std::find_if(fields_.begin(), fields_.end(),
                         [&field](const Field &existing) { return existing.name() == field.name(); });
  if (it != fields_.end()) {
    *it = std::move(field);
  } else {
    fields_.push_back(std::move(field));
  }
}

void Entry::setFieldValue(std::string_view name, FieldValue value) {
  auto it = std::find_if(fields_.begin(), fields_.end(),
                         [name](const Field &field) { return field.name() == name; });
  if (it == fields_.end()) {
    throw Error(ErrorCode::UnknownField, std::format("Field '{}' does not exist on this entry", name));
  }
  it->setValue(std::move(value));
}

bool Entry::isStandardFieldName(std::string_view name) {
  return std::find(kStandardFieldNames.begin(), kStandardFieldNames.end(), name) !=
         kStandardFieldNames.end();
}

void Entry::putField(Field field) {
  if (replaced_.contains(field.name())) {
    return;
  }
  auto it = std::find_if(fields_.begin(), fields_.end(),
                         [&field](const Field &existing) { return existing.name() == field.name(); });
  if (it != fields_.end()) {
    *it = std::move(field);
  } else {
    fields_.push_back(std::move(field));
  }
}

void Entry::populateStandardFields(const BuildConfig &) {
  putField(Field(std::string(standard_fields::MimeType), FieldType::Text, mimeType_));
  putField(Field(std::string(standard_fields::Sha1), FieldType::Text, digest()));
  putField(Field(std::string(standard_fields::Name), FieldType::Text, getName()));
  if (auto date = itemDate()) {
    putField(Field(std::string(standard_fields::ItemDate), FieldType::DateTime, *date));
  }
}

void Entry::addChildren(EntryTree &) {}

} // namespace nli
