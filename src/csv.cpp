#include <format>
#include <fstream>
#include <iterator>
#include <sstream>

#include <nli/csv.hpp>
#include <nli/types.hpp>

namespace nli {

namespace {

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

bool isBlank(const std::vector<std::string> &record) {
  return record.size() == 1 && record.front().empty();
}

} // namespace

CsvTable CsvReader::parse(std::string_view text) {
  if (text.starts_with(kUtf8Bom)) {
    text.remove_prefix(kUtf8Bom.size());
  }

  std::vector<std::vector<std::string>> records;
  std::vector<std::string> record;
  std::string field;
  bool inQuotes = false;
  bool fieldWasQuoted = false;
  size_t line = 1;

  auto endField = [&]() {
    record.push_back(std::move(field));
    field.clear();
    fieldWasQuoted = false;
  };
  auto endRecord = [&]() {
    endField();
    if (!isBlank(record)) {
      records.push_back(std::move(record));
    }
    record.clear();
  };

  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];

    if (inQuotes) {
      if (c == '"') {
        if (i + 1 < text.size() && text[i + 1] == '"') {
          field += '"';
          ++i;
        } else {
          inQuotes = false;
        }
      } else {
        if (c == '\n') {
          ++line;
        }
        field += c;
      }
      continue;
    }

    switch (c) {
    case '"':
      if (!field.empty() || fieldWasQuoted) {
        throw Error(ErrorCode::MalformedSourceDocument,
                    std::format("Unexpected quote inside an unquoted CSV field on line {}", line));
      }
      inQuotes = true;
      fieldWasQuoted = true;
      break;
    case ',':
      endField();
      break;
    case '\r':
      if (i + 1 < text.size() && text[i + 1] == '\n') {
        ++i;
      }
      endRecord();
      ++line;
      break;
    case '\n':
      endRecord();
      ++line;
      break;
    default:
      if (fieldWasQuoted) {
        throw Error(ErrorCode::MalformedSourceDocument,
                    std::format("Unexpected character after a closing quote on line {}", line));
      }
      field += c;
      break;
    }
  }

  if (inQuotes) {
    throw Error(ErrorCode::MalformedSourceDocument,
                std::format("Unterminated quoted CSV field starting before line {}", line));
  }
  if (!field.empty() || fieldWasQuoted || !record.empty()) {
    endRecord();
  }

  if (records.empty()) {
    throw Error(ErrorCode::MalformedSourceDocument, "CSV document has no header row");
  }

  CsvTable table;
  table.header = std::move(records.front());
  table.rows.assign(std::make_move_iterator(records.begin() + 1),
                    std::make_move_iterator(records.end()));
  return table;
}

CsvTable CsvReader::readFile(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw Error(ErrorCode::MalformedSourceDocument,
                std::format("Failed to open CSV file: {}", path.string()));
  }

  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    throw Error(ErrorCode::MalformedSourceDocument,
                std::format("Failed to read CSV file: {}", path.string()));
  }

  try {
    return parse(buffer.str());
  } catch (const Error &e) {
    throw Error(e.code(), std::format("{}: {}", path.string(), e.what()));
  }
}

} // namespace nli
