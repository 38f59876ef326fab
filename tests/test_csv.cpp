#include <filesystem>
#include <fstream>
#include <memory>

#include <nli/csv.hpp>
#include <nli/csv_entry.hpp>
#include <nli/entry_tree.hpp>

#include <gtest/gtest.h>

namespace fs = std::filesystem;

class CsvTest : public ::testing::Test {
protected:
  void SetUp() override {
    tempDir_ = fs::temp_directory_path() / "nli_test_csv";
    fs::create_directories(tempDir_);
  }

  void TearDown() override { fs::remove_all(tempDir_); }

  // Create a test file with specified content
  fs::path createTestFile(const std::string &name, const std::string &content) {
    fs::path filePath = tempDir_ / name;
    std::ofstream file(filePath, std::ios::binary);
    file.write(content.data(), content.size());
    return filePath;
  }

  fs::path tempDir_;
};

namespace {

nli::ErrorCode parseError(std::string_view text) {
  try {
    nli::CsvReader::parse(text);
  } catch (const nli::Error &e) {
    return e.code();
  }
  return nli::ErrorCode::None;
}

// Row type keyed by the "user" column
class AccountRow : public nli::CsvRowEntry {
public:
  AccountRow(const nli::CsvEntry &csv, size_t rowIndex) : CsvRowEntry(csv, rowIndex) {}

  std::string getName() const override { return "account " + nli::renderValue(*value("user")); }
  std::optional<std::string> identifierField() const override { return "user"; }
};

} // namespace

TEST_F(CsvTest, ParseQuotedFields) {
  auto table = nli::CsvReader::parse("name,notes\r\n"
                                     "\"Doe, J\",\"said \"\"hi\"\"\"\r\n"
                                     "x,\"two\nlines\"\n");
  ASSERT_EQ(table.header, (std::vector<std::string>{"name", "notes"}));
  ASSERT_EQ(table.rows.size(), 2u);
  EXPECT_EQ(table.rows[0][0], "Doe, J");
  EXPECT_EQ(table.rows[0][1], "said \"hi\"");
  EXPECT_EQ(table.rows[1][1], "two\nlines");
}

TEST_F(CsvTest, ParseSkipsBomAndBlankLines) {
  auto table = nli::CsvReader::parse("\xEF\xBB\xBF" "a,b\n\n1,2\n\n");
  EXPECT_EQ(table.header, (std::vector<std::string>{"a", "b"}));
  ASSERT_EQ(table.rows.size(), 1u);
  EXPECT_EQ(table.rows[0], (std::vector<std::string>{"1", "2"}));

  // Last record without a line break
  table = nli::CsvReader::parse("a\n1");
  ASSERT_EQ(table.rows.size(), 1u);
  EXPECT_EQ(table.rows[0][0], "1");
}

TEST_F(CsvTest, ParseMalformed) {
  EXPECT_EQ(parseError("a,b\n\"open,2\n"), nli::ErrorCode::MalformedSourceDocument);
  EXPECT_EQ(parseError("a,b\n1,x\"y\n"), nli::ErrorCode::MalformedSourceDocument);
  EXPECT_EQ(parseError("a,b\n\"1\"x,2\n"), nli::ErrorCode::MalformedSourceDocument);
  EXPECT_EQ(parseError(""), nli::ErrorCode::MalformedSourceDocument);
  EXPECT_EQ(parseError("a,b\n"), nli::ErrorCode::None);
}

// Test one child per row with fields in header order
TEST_F(CsvTest, RowsBecomeChildren) {
  fs::path path = createTestFile("table.csv", "a,b\n1,2\n");

  nli::EntryTree tree;
  std::string csvId = tree.add(std::make_unique<nli::CsvEntry>(path));
  ASSERT_EQ(tree.size(), 2u);

  const auto &kids = tree.children(csvId);
  ASSERT_EQ(kids.size(), 1u);
  const nli::Entry *row = tree.find(kids[0]);

  EXPECT_EQ(row->mimeType(), "application/x-database-table-row");
  ASSERT_GE(row->fields().size(), 2u);
  EXPECT_EQ(row->fields()[0].name(), "a");
  EXPECT_EQ(row->fields()[0].toString(), "1");
  EXPECT_EQ(row->fields()[1].name(), "b");
  EXPECT_EQ(row->fields()[1].toString(), "2");
  EXPECT_EQ(row->text().value_or(""), "a: 1\nb: 2");

  EXPECT_EQ(tree.relativePath(*row), "table.csv/1");
}

TEST_F(CsvTest, CsvFileFields) {
  fs::path path = createTestFile("people.csv", "name,age\nann,31\nbob,42\n");

  nli::EntryTree tree;
  std::string csvId = tree.add(std::make_unique<nli::CsvEntry>(path));
  const auto *csv = dynamic_cast<const nli::CsvEntry *>(tree.find(csvId));
  ASSERT_NE(csv, nullptr);

  EXPECT_EQ(csv->mimeType(), "text/csv");
  EXPECT_EQ(csv->rowFields(), (std::vector<std::string>{"name", "age"}));
  EXPECT_EQ(csv->rowCount(), 2u);
  EXPECT_EQ(csv->findField("Name")->toString(), "people.csv");
  EXPECT_EQ(csv->findField("File Size")->toString(), "23");
  EXPECT_EQ(csv->nativeKind(), nli::NativeKind::File);

  std::vector<std::string> names;
  for (const auto &id : tree.children(csvId)) {
    names.push_back(tree.find(id)->name());
  }
  EXPECT_EQ(names, (std::vector<std::string>{"ann", "bob"}));
}

TEST_F(CsvTest, RaggedRows) {
  fs::path path = createTestFile("ragged.csv", "a,b,c\n1\n4,5,6,7\n");

  nli::EntryTree tree;
  std::string csvId = tree.add(std::make_unique<nli::CsvEntry>(path));
  const auto *csv = dynamic_cast<const nli::CsvEntry *>(tree.find(csvId));

  nli::Mapping shortRow = csv->row(0);
  ASSERT_EQ(shortRow.size(), 3u);
  EXPECT_EQ(std::get<std::string>(shortRow[2].second), "");

  nli::Mapping longRow = csv->row(1);
  ASSERT_EQ(longRow.size(), 3u);
  EXPECT_EQ(std::get<std::string>(longRow[2].second), "6");

  EXPECT_THROW(csv->row(2), nli::Error);
}

// Test custom row types through the generator
TEST_F(CsvTest, RowGenerator) {
  fs::path path = createTestFile("accounts.csv", "user,role\nroot,admin\nalice,dev\n");

  nli::RowGenerator generator = [](const nli::CsvEntry &csv, size_t rowIndex) {
    return std::make_unique<AccountRow>(csv, rowIndex);
  };

  nli::EntryTree tree;
  std::string csvId = tree.add(std::make_unique<nli::CsvEntry>(path, std::nullopt, generator));

  EXPECT_EQ(tree.children(csvId), (std::vector<std::string>{"root", "alice"}));
  EXPECT_EQ(tree.find("alice")->name(), "account alice");
  EXPECT_EQ(tree.find("alice")->parentId().value_or(""), csvId);
}

TEST_F(CsvTest, NullFromGenerator) {
  fs::path path = createTestFile("one.csv", "a\n1\n");

  nli::RowGenerator generator = [](const nli::CsvEntry &, size_t) {
    return std::unique_ptr<nli::Entry>();
  };

  nli::EntryTree tree;
  try {
    tree.add(std::make_unique<nli::CsvEntry>(path, std::nullopt, generator));
    FAIL() << "Expected InvalidArgument";
  } catch (const nli::Error &e) {
    EXPECT_EQ(e.code(), nli::ErrorCode::InvalidArgument);
  }
}

TEST_F(CsvTest, MalformedFileFailsRegistration) {
  fs::path path = createTestFile("broken.csv", "a,b\n\"never closed\n");

  nli::EntryTree tree;
  try {
    tree.add(std::make_unique<nli::CsvEntry>(path));
    FAIL() << "Expected MalformedSourceDocument";
  } catch (const nli::Error &e) {
    EXPECT_EQ(e.code(), nli::ErrorCode::MalformedSourceDocument);
    EXPECT_NE(std::string(e.what()).find("broken.csv"), std::string::npos);
  }
  EXPECT_TRUE(tree.empty());
}
