#include <format>

#include <nli/csv_entry.hpp>
#include <nli/entry_tree.hpp>
#include <nli/log.hpp>

namespace nli {

namespace {

std::optional<std::string> rowParent(const CsvEntry &csv, std::optional<std::string> parentId) {
  if (parentId) {
    return parentId;
  }
  if (csv.isRegistered()) {
    return csv.id();
  }
  return std::nullopt;
}

} // namespace

CsvEntry::CsvEntry(const std::filesystem::path &path, std::optional<std::string> parentId,
                   RowGenerator rowGenerator)
    : FileEntry(path, "text/csv", std::move(parentId)), rowGenerator_(std::move(rowGenerator)) {}

Mapping CsvEntry::row(size_t rowIndex) const {
  if (rowIndex >= table_.rows.size()) {
    throw Error(ErrorCode::InvalidArgument,
                std::format("Row {} is out of range ({} rows)", rowIndex, table_.rows.size()));
  }

  const auto &cells = table_.rows[rowIndex];
  Mapping data;
  data.reserve(table_.header.size());
  for (size_t column = 0; column < table_.header.size(); ++column) {
    data.emplace_back(table_.header[column],
                      column < cells.size() ? cells[column] : std::string());
  }
  return data;
}

std::string CsvEntry::addAsParentPath(const std::string &existingPath) const {
  return std::format("{}/{}", name(), existingPath);
}

void CsvEntry::populateStandardFields(const BuildConfig &config) {
  FileEntry::populateStandardFields(config);

  table_ = CsvReader::readFile(filePath());
  for (size_t i = 0; i < table_.rows.size(); ++i) {
    if (table_.rows[i].size() > table_.header.size()) {
      NLI_LOG(Warning) << filePath().string() << ": row " << i << " has "
                       << table_.rows[i].size() << " cells for " << table_.header.size()
                       << " columns; extra cells are ignored";
    }
  }
  NLI_LOG(Debug) << "Parsed " << table_.rows.size() << " rows from " << filePath().string();
}

void CsvEntry::addChildren(EntryTree &tree) {
  for (size_t i = 0; i < table_.rows.size(); ++i) {
    std::unique_ptr<Entry> rowEntry =
        rowGenerator_ ? rowGenerator_(*this, i) : std::make_unique<CsvRowEntry>(*this, i);
    if (!rowEntry) {
      throw Error(ErrorCode::InvalidArgument,
                  std::format("Row generator returned no entry for row {} of {}", i,
                              filePath().string()));
    }
    tree.add(std::move(rowEntry));
  }
}

CsvRowEntry::CsvRowEntry(const CsvEntry &csv, size_t rowIndex, std::optional<std::string> parentId)
    : MappingEntry(csv.row(rowIndex), "application/x-database-table-row",
                   rowParent(csv, std::move(parentId))),
      csv_(csv), rowIndex_(rowIndex) {}

} // namespace nli
