#include <cctype>
#include <format>
#include <optional>

#include <nli/names.hpp>
#include <nli/types.hpp>

namespace nli {

namespace {

constexpr std::string_view kReplacementCharacter = "\xEF\xBF\xBD"; // U+FFFD

// Decode the UTF-8 sequence at text[pos] and advance past it. Overlong forms, surrogates,
// truncated sequences and stray continuation bytes yield std::nullopt and advance one byte.
std::optional<char32_t> decodeUtf8(std::string_view text, size_t &pos) {
  auto lead = static_cast<unsigned char>(text[pos]);
  if (lead < 0x80) {
    ++pos;
    return lead;
  }

  size_t length = 0;
  char32_t minimum = 0;
  char32_t codePoint = 0;
  if (lead >= 0xC2 && lead <= 0xDF) {
    length = 2;
    minimum = 0x80;
    codePoint = lead & 0x1F;
  } else if (lead >= 0xE0 && lead <= 0xEF) {
    length = 3;
    minimum = 0x800;
    codePoint = lead & 0x0F;
  } else if (lead >= 0xF0 && lead <= 0xF4) {
    length = 4;
    minimum = 0x10000;
    codePoint = lead & 0x07;
  } else {
    ++pos;
    return std::nullopt;
  }

  if (pos + length > text.size()) {
    ++pos;
    return std::nullopt;
  }
  for (size_t k = 1; k < length; ++k) {
    auto next = static_cast<unsigned char>(text[pos + k]);
    if ((next & 0xC0) != 0x80) {
      ++pos;
      return std::nullopt;
    }
    codePoint = (codePoint << 6) | (next & 0x3F);
  }

  if (codePoint < minimum || (codePoint >= 0xD800 && codePoint <= 0xDFFF) ||
      codePoint > 0x10FFFF) {
    ++pos;
    return std::nullopt;
  }
  pos += length;
  return codePoint;
}

// Char production of XML 1.0
bool isXmlChar(char32_t c) {
  return c == 0x9 || c == 0xA || c == 0xD || (c >= 0x20 && c <= 0xD7FF) ||
         (c >= 0xE000 && c <= 0xFFFD) || (c >= 0x10000 && c <= 0x10FFFF);
}

bool isIllegalInSegment(unsigned char c) {
  switch (c) {
  case '/':
  case '\\':
  case ':':
  case '*':
  case '?':
  case '"':
  case '<':
  case '>':
  case '|':
    return true;
  default:
    return c < 0x20 || c == 0x7F;
  }
}

std::string cleanSegment(std::string_view raw) {
  std::string result;
  result.reserve(raw.size());
  for (char c : toValidUtf8(raw)) {
    result += isIllegalInSegment(static_cast<unsigned char>(c)) ? '_' : c;
  }

  size_t begin = 0;
  while (begin < result.size() && std::isspace(static_cast<unsigned char>(result[begin]))) {
    ++begin;
  }
  size_t end = result.size();
  while (end > begin && (std::isspace(static_cast<unsigned char>(result[end - 1])) ||
                         result[end - 1] == '.')) {
    --end;
  }
  result = result.substr(begin, end - begin);

  if (result.size() > kMaxNameLength) {
    size_t cut = kMaxNameLength;
    // Back off to the start of a UTF-8 sequence
    while (cut > 0 && (static_cast<unsigned char>(result[cut]) & 0xC0) == 0x80) {
      --cut;
    }
    result.resize(cut);
  }
  return result;
}

} // namespace

std::string sanitizeName(std::string_view raw, std::string_view fallback) {
  std::string name = cleanSegment(raw);
  if (!name.empty()) {
    return name;
  }

  name = cleanSegment(fallback);
  if (!name.empty()) {
    return name;
  }
  return "unnamed";
}

std::string percentEncodePath(std::string_view path) {
  std::string result;
  result.reserve(path.size());
  for (char ch : path) {
    auto c = static_cast<unsigned char>(ch);
    if (std::isalnum(c) || c == '/' || c == '_' || c == '.' || c == '-' || c == '~') {
      result += ch;
    } else if (c == ' ') {
      result += '+';
    } else {
      result += std::format("%{:02X}", c);
    }
  }
  return result;
}

bool isValidUtf8(std::string_view text) {
  size_t pos = 0;
  while (pos < text.size()) {
    if (!decodeUtf8(text, pos)) {
      return false;
    }
  }
  return true;
}

std::string toValidUtf8(std::string_view text) {
  if (isValidUtf8(text)) {
    return std::string(text);
  }

  std::string result;
  result.reserve(text.size() + 8);
  size_t pos = 0;
  while (pos < text.size()) {
    size_t start = pos;
    if (decodeUtf8(text, pos)) {
      result.append(text.substr(start, pos - start));
    } else {
      result.append(kReplacementCharacter);
    }
  }
  return result;
}

std::string sanitizeXmlText(std::string_view text) {
  std::string result;
  result.reserve(text.size());
  size_t pos = 0;
  while (pos < text.size()) {
    size_t start = pos;
    std::optional<char32_t> c = decodeUtf8(text, pos);
    if (!c) {
      result.append(kReplacementCharacter);
    } else if (isXmlChar(*c)) {
      result.append(text.substr(start, pos - start));
    }
  }
  return result;
}

std::string normalizeArchivePath(std::string_view path) {
  std::string result;
  result.reserve(path.size());

  for (char c : path) {
    if (c == '\\') {
      result += '/';
    } else {
      result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
  }

  return result;
}

} // namespace nli
