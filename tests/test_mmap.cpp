#include <algorithm>
#include <filesystem>
#include <fstream>
#include <vector>

#include <nli/mmap.hpp>

#include <gtest/gtest.h>

namespace fs = std::filesystem;

class MappedFileTest : public ::testing::Test {
protected:
  void SetUp() override {
    tempDir_ = fs::temp_directory_path() / "nli_test_mmap";
    fs::create_directories(tempDir_);
  }

  void TearDown() override { fs::remove_all(tempDir_); }

  fs::path createTestFile(const std::string &name, const std::vector<uint8_t> &content) {
    fs::path filePath = tempDir_ / name;
    std::ofstream file(filePath, std::ios::binary);
    file.write(reinterpret_cast<const char *>(content.data()), content.size());
    return filePath;
  }

  fs::path tempDir_;
};

TEST_F(MappedFileTest, ReadMapping) {
  std::vector<uint8_t> content = {'P', 'K', 5, 6, 0, 0};
  fs::path filePath = createTestFile("tail.bin", content);

  nli::MappedFile mapped;
  std::string error;
  ASSERT_TRUE(mapped.openRead(filePath, &error)) << error;
  EXPECT_TRUE(mapped.isOpen());
  ASSERT_EQ(mapped.size(), content.size());

  auto view = mapped.data();
  EXPECT_TRUE(std::equal(view.begin(), view.end(), content.begin()));

  mapped.close();
  EXPECT_FALSE(mapped.isOpen());
}

TEST_F(MappedFileTest, ReadFailures) {
  nli::MappedFile mapped;
  std::string error;

  EXPECT_FALSE(mapped.openRead(tempDir_ / "absent.bin", &error));
  EXPECT_FALSE(error.empty());

  // Nothing to map
  createTestFile("empty.bin", {});
  error.clear();
  EXPECT_FALSE(mapped.openRead(tempDir_ / "empty.bin", &error));
  EXPECT_FALSE(mapped.isOpen());
}

TEST_F(MappedFileTest, MoveTransfersMapping) {
  fs::path first = createTestFile("first.bin", {1, 2, 3});
  fs::path second = createTestFile("second.bin", {4, 5});

  nli::MappedFile a;
  ASSERT_TRUE(a.openRead(first));
  nli::MappedFile b(std::move(a));
  EXPECT_FALSE(a.isOpen());
  ASSERT_TRUE(b.isOpen());
  EXPECT_EQ(b.size(), 3u);

  nli::MappedFile c;
  ASSERT_TRUE(c.openRead(second));
  b = std::move(c);
  EXPECT_FALSE(c.isOpen());
  EXPECT_EQ(b.size(), 2u);
  EXPECT_EQ(b.data()[0], 4);
}
