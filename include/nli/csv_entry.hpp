#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "csv.hpp"
#include "file_entry.hpp"
#include "mapping_entry.hpp"

namespace nli {

class CsvEntry;

// Builds the entry for one data row; the default produces a CsvRowEntry
using RowGenerator = std::function<std::unique_ptr<Entry>(const CsvEntry &csv, size_t rowIndex)>;

// A CSV file and, once registered, one child entry per data row.
//
// The file is parsed at registration (after hashing). Rows are registered in file order, each
// produced by the row generator; the children's text artifacts land under a directory named
// after the CSV file.
class CsvEntry : public FileEntry {
public:
  explicit CsvEntry(const std::filesystem::path &path,
                    std::optional<std::string> parentId = std::nullopt,
                    RowGenerator rowGenerator = {});

  // Column names from the header row
  const std::vector<std::string> &rowFields() const { return table_.header; }

  size_t rowCount() const { return table_.rows.size(); }

  // Data row as a record in header order: missing cells are empty, extra cells dropped.
  // Throws Error(InvalidArgument) for an index past the last row.
  Mapping row(size_t rowIndex) const;

  std::string addAsParentPath(const std::string &existingPath) const override;

protected:
  void populateStandardFields(const BuildConfig &config) override;
  void addChildren(EntryTree &tree) override;

private:
  CsvTable table_;
  RowGenerator rowGenerator_;
};

// Default row entry: the row's cells as Text fields, parented to the CSV unless told otherwise
class CsvRowEntry : public MappingEntry {
public:
  CsvRowEntry(const CsvEntry &csv, size_t rowIndex,
              std::optional<std::string> parentId = std::nullopt);

  const CsvEntry &csv() const { return csv_; }
  size_t rowIndex() const { return rowIndex_; }

private:
  const CsvEntry &csv_;
  size_t rowIndex_;
};

} // namespace nli
