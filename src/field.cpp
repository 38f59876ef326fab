#include <cctype>
#include <charconv>
#include <cmath>
#include <format>
#include <limits>
#include <optional>

#include <nli/datetime.hpp>
#include <nli/field.hpp>

namespace nli {

namespace {

std::string_view trim(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
    text.remove_suffix(1);
  }
  return text;
}

std::optional<int64_t> parseInteger(std::string_view text) {
  text = trim(text);
  if (!text.empty() && text.front() == '+') {
    text.remove_prefix(1);
  }
  int64_t result = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), result);
  if (text.empty() || ec != std::errc() || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return result;
}

std::optional<double> parseDecimal(std::string_view text) {
  text = trim(text);
  if (!text.empty() && text.front() == '+') {
    text.remove_prefix(1);
  }
  double result = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), result);
  if (text.empty() || ec != std::errc() || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return result;
}

std::optional<bool> parseBoolean(std::string_view text) {
  text = trim(text);
  std::string lower;
  lower.reserve(text.size());
  for (char c : text) {
    lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  if (lower == "true" || lower == "1") {
    return true;
  }
  if (lower == "false" || lower == "0") {
    return false;
  }
  return std::nullopt;
}

[[noreturn]] void reject(const std::string &name, FieldType type, const FieldValue &value) {
  throw Error(ErrorCode::InvalidFieldType,
              std::format("Field '{}' of type {} cannot hold value '{}'", name, toString(type),
                          renderValue(value)));
}

FieldValue coerce(const std::string &name, FieldType type, FieldValue value) {
  if (std::holds_alternative<std::monostate>(value)) {
    return value;
  }

  switch (type) {
  case FieldType::Text:
  case FieldType::LongText:
    if (std::holds_alternative<std::string>(value)) {
      return value;
    }
    return renderValue(value);

  case FieldType::LongInteger:
    if (std::holds_alternative<int64_t>(value)) {
      return value;
    }
    if (const auto *d = std::get_if<double>(&value)) {
      // Only integral doubles inside the int64 range
      if (std::isfinite(*d) && std::trunc(*d) == *d && *d >= -9.2e18 && *d <= 9.2e18) {
        return static_cast<int64_t>(*d);
      }
    } else if (const auto *s = std::get_if<std::string>(&value)) {
      if (auto parsed = parseInteger(*s)) {
        return *parsed;
      }
    }
    break;

  case FieldType::Decimal:
    if (std::holds_alternative<double>(value)) {
      return value;
    }
    if (const auto *i = std::get_if<int64_t>(&value)) {
      return static_cast<double>(*i);
    }
    if (const auto *s = std::get_if<std::string>(&value)) {
      if (auto parsed = parseDecimal(*s)) {
        return *parsed;
      }
    }
    break;

  case FieldType::Boolean:
    if (std::holds_alternative<bool>(value)) {
      return value;
    }
    if (const auto *i = std::get_if<int64_t>(&value)) {
      if (*i == 0 || *i == 1) {
        return *i == 1;
      }
    } else if (const auto *s = std::get_if<std::string>(&value)) {
      if (auto parsed = parseBoolean(*s)) {
        return *parsed;
      }
    }
    break;

  case FieldType::DateTime:
    if (std::holds_alternative<Timestamp>(value)) {
      return value;
    }
    if (const auto *s = std::get_if<std::string>(&value)) {
      if (auto parsed = parseAnyTimestamp(*s)) {
        return *parsed;
      }
    }
    break;
  }

  reject(name, type, value);
}

std::string renderDecimal(double value) {
  if (!std::isfinite(value)) {
    return std::format("{}", value);
  }

  std::string text = std::format("{:.4f}", value);
  // Drop trailing zeros but keep one fractional digit: 1.5000 -> 1.5, 2.0000 -> 2.0
  size_t dot = text.find('.');
  if (dot != std::string::npos) {
    size_t last = text.find_last_not_of('0');
    if (last == dot) {
      last = dot + 1;
    }
    text.erase(last + 1);
  }
  if (text == "-0.0") {
    text = "0.0";
  }
  return text;
}

} // namespace

std::string_view toString(FieldType type) noexcept {
  switch (type) {
  case FieldType::Text:
    return "Text";
  case FieldType::LongText:
    return "LongText";
  case FieldType::DateTime:
    return "DateTime";
  case FieldType::LongInteger:
    return "LongInteger";
  case FieldType::Decimal:
    return "Decimal";
  case FieldType::Boolean:
    return "Boolean";
  }
  return "Text";
}

std::string renderValue(const FieldValue &value, std::string_view zoneSuffix) {
  if (const auto *s = std::get_if<std::string>(&value)) {
    return *s;
  }
  if (const auto *i = std::get_if<int64_t>(&value)) {
    return std::to_string(*i);
  }
  if (const auto *d = std::get_if<double>(&value)) {
    return renderDecimal(*d);
  }
  if (const auto *b = std::get_if<bool>(&value)) {
    return *b ? "true" : "false";
  }
  if (const auto *ts = std::get_if<Timestamp>(&value)) {
    return formatTimestamp(*ts, zoneSuffix);
  }
  return {};
}

Field::Field(std::string name, FieldType type) : name_(std::move(name)), type_(type) {}

Field::Field(std::string name, FieldType type, FieldValue value)
    : name_(std::move(name)), type_(type) {
  setValue(std::move(value));
}

void Field::setValue(FieldValue value) {
  value_ = coerce(name_, type_, std::move(value));
}

std::string Field::toString(std::string_view zoneSuffix) const {
  return renderValue(value_, zoneSuffix);
}

Field FieldFactory::generate(std::string name, FieldType type, FieldValue initial) {
  return Field(std::move(name), type, std::move(initial));
}

Field FieldFactory::infer(std::string name, FieldValue value) {
  FieldType type = FieldType::Text;
  if (std::holds_alternative<bool>(value)) {
    type = FieldType::Boolean;
  } else if (std::holds_alternative<int64_t>(value)) {
    type = FieldType::LongInteger;
  } else if (std::holds_alternative<double>(value)) {
    type = FieldType::Decimal;
  } else if (std::holds_alternative<Timestamp>(value)) {
    type = FieldType::DateTime;
  }
  return Field(std::move(name), type, std::move(value));
}

} // namespace nli
