#include <filesystem>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

#include <nli/config.hpp>
#include <nli/log.hpp>

#include <gtest/gtest.h>

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
  void SetUp() override {
    tempDir_ = fs::temp_directory_path() / "nli_test_config";
    fs::create_directories(tempDir_);
  }

  void TearDown() override { fs::remove_all(tempDir_); }

  fs::path createSettings(const std::string &name, const std::string &content) {
    fs::path filePath = tempDir_ / name;
    std::ofstream file(filePath);
    file << content;
    return filePath;
  }

  fs::path tempDir_;
};

TEST_F(ConfigTest, MissingKeysKeepDefaults) {
  fs::path path = createSettings("partial.json", R"({"custodian": "J. Doe", "locale": "GB"})");

  std::string error;
  auto config = nli::ConfigLoader::load(path, &error);
  ASSERT_TRUE(config.has_value()) << error;

  EXPECT_EQ(config->custodian, "J. Doe");
  EXPECT_EQ(config->locale, "GB");
  EXPECT_EQ(config->timeZoneSuffix, "+00:00");
  EXPECT_EQ(config->hashBufferSize, 65536u);
  EXPECT_EQ(config->compressionLevel, -1);
  EXPECT_EQ(config->caseNumber, "01");
}

TEST_F(ConfigTest, SaveThenLoad) {
  nli::BuildConfig config;
  config.custodian = "Lab 4";
  config.timeZoneSuffix = "Z";
  config.hashBufferSize = 4096;
  config.compressionLevel = 9;
  config.examinerName = "R. Analyst";

  fs::path path = tempDir_ / "settings.json";
  std::string error;
  ASSERT_TRUE(nli::ConfigLoader::save(config, path, &error)) << error;

  auto loaded = nli::ConfigLoader::load(path, &error);
  ASSERT_TRUE(loaded.has_value()) << error;
  EXPECT_EQ(loaded->custodian, "Lab 4");
  EXPECT_EQ(loaded->timeZoneSuffix, "Z");
  EXPECT_EQ(loaded->hashBufferSize, 4096u);
  EXPECT_EQ(loaded->compressionLevel, 9);
  EXPECT_EQ(loaded->examinerName, "R. Analyst");
}

TEST_F(ConfigTest, WrongValueType) {
  fs::path path = createSettings("bad_type.json", R"({"hash_buffer_size": "large"})");

  std::string error;
  EXPECT_FALSE(nli::ConfigLoader::load(path, &error).has_value());
  EXPECT_FALSE(error.empty());
}

TEST_F(ConfigTest, InvalidDocuments) {
  std::string error;
  EXPECT_FALSE(
      nli::ConfigLoader::load(createSettings("broken.json", "{ custodian"), &error).has_value());
  EXPECT_FALSE(error.empty());

  error.clear();
  EXPECT_FALSE(
      nli::ConfigLoader::load(createSettings("array.json", "[1, 2]"), &error).has_value());
  EXPECT_FALSE(error.empty());

  error.clear();
  fs::path level = createSettings("level.json", R"({"compression_level": 12})");
  EXPECT_FALSE(nli::ConfigLoader::load(level, &error).has_value());
  EXPECT_NE(error.find("compression_level"), std::string::npos);

  error.clear();
  EXPECT_FALSE(nli::ConfigLoader::load(tempDir_ / "missing.json", &error).has_value());
  EXPECT_FALSE(error.empty());
}

// Test the threshold and the replaceable sink
TEST(LogTest, SinkReceivesLinesAtOrAboveThreshold) {
  std::vector<std::pair<nli::log::Level, std::string>> lines;
  nli::log::setSink([&lines](nli::log::Level level, std::string_view message) {
    lines.emplace_back(level, std::string(message));
  });
  nli::log::setLevel(nli::log::Level::Info);

  NLI_LOG(Debug) << "hidden";
  NLI_LOG(Info) << "entry " << 3;
  NLI_LOG(Error) << "failed";

  nli::log::setLevel(nli::log::Level::Warning);
  nli::log::setSink({});

  ASSERT_EQ(lines.size(), 2u);
  EXPECT_EQ(lines[0].first, nli::log::Level::Info);
  EXPECT_EQ(lines[0].second, "entry 3");
  EXPECT_EQ(lines[1].first, nli::log::Level::Error);
  EXPECT_EQ(nli::log::toString(nli::log::Level::Warning), "warning");
}
