#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

#include "types.hpp"

namespace nli {

// EDRM field data types
enum class FieldType { Text, LongText, DateTime, LongInteger, Decimal, Boolean };

// Name used for the DataType attribute ("Text", "LongInteger", ...)
std::string_view toString(FieldType type) noexcept;

// Typed scalar; std::monostate means "no value"
using FieldValue = std::variant<std::monostate, std::string, int64_t, double, bool, Timestamp>;

// Named, typed value attached to an entry.
//
// Fields are plain values: copying a Field copies its value, so the same Field added to two
// entries yields two independent values. Assignments are checked against the declared type and
// coerced where the conversion is lossless ("42" into LongInteger, an integer into Decimal, a
// parseable date string into DateTime). Anything else throws Error(InvalidFieldType).
class Field {
public:
  Field(std::string name, FieldType type);
  Field(std::string name, FieldType type, FieldValue value);

  const std::string &name() const { return name_; }
  FieldType type() const { return type_; }
  const FieldValue &value() const { return value_; }

  bool hasValue() const { return !std::holds_alternative<std::monostate>(value_); }

  // Throws Error(InvalidFieldType) when value cannot be coerced to type()
  void setValue(FieldValue value);

  // Independent copy, for attaching the same definition to another entry
  Field clone() const { return *this; }

  // Text form used in the manifest and in text artifacts
  std::string toString(std::string_view zoneSuffix = "+00:00") const;

private:
  std::string name_;
  FieldType type_;
  FieldValue value_;
};

// Text form of a bare value (decimals rounded to 4 places, timestamps ISO-8601)
std::string renderValue(const FieldValue &value, std::string_view zoneSuffix = "+00:00");

class FieldFactory {
public:
  // New field of the given type holding initial (coerced); throws Error(InvalidFieldType)
  static Field generate(std::string name, FieldType type, FieldValue initial = {});

  // Type chosen from the value: bool -> Boolean, integer -> LongInteger, floating -> Decimal,
  // timestamp -> DateTime, anything else -> Text
  static Field infer(std::string name, FieldValue value);
};

} // namespace nli
