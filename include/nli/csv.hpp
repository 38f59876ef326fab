#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace nli {

// Parsed CSV document: the first record is the header
struct CsvTable {
  std::vector<std::string> header;
  std::vector<std::vector<std::string>> rows;
};

// RFC 4180 reader.
//
// Fields are separated by ',' and records by LF or CRLF. Quoted fields may contain separators,
// line breaks and doubled quotes. A leading UTF-8 byte order mark is skipped and blank records
// are ignored. Throws Error(MalformedSourceDocument) on an unterminated quote, a stray quote
// inside an unquoted field or a document without a header.
class CsvReader {
public:
  static CsvTable parse(std::string_view text);

  // Throws Error(MalformedSourceDocument) when the file cannot be read
  static CsvTable readFile(const std::filesystem::path &path);
};

} // namespace nli
