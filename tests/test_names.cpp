#include <string>

#include <nli/names.hpp>
#include <nli/types.hpp>

#include <gtest/gtest.h>

// Test that path-illegal characters never reach an effective name
TEST(NamesTest, SanitizeReplacesIllegalCharacters) {
  std::string name = nli::sanitizeName("a/b:c", "fallback");
  EXPECT_EQ(name, "a_b_c");

  name = nli::sanitizeName("x\\y*z?\"<>|", "fallback");
  for (char c : std::string("/\\:*?\"<>|")) {
    EXPECT_EQ(name.find(c), std::string::npos) << "Found '" << c << "' in " << name;
  }
  EXPECT_FALSE(name.empty());
}

TEST(NamesTest, SanitizeTrimsWhitespaceAndTrailingDots) {
  EXPECT_EQ(nli::sanitizeName("  report.txt  ", "x"), "report.txt");
  EXPECT_EQ(nli::sanitizeName("folder...", "x"), "folder");
  EXPECT_EQ(nli::sanitizeName("tab\there", "x"), "tab_here");
}

// Test that a name is never empty
TEST(NamesTest, SanitizeFallsBack) {
  EXPECT_EQ(nli::sanitizeName("", "abc123"), "abc123");
  EXPECT_EQ(nli::sanitizeName("   ", "abc123"), "abc123");
  EXPECT_EQ(nli::sanitizeName("..", "abc123"), "abc123");
  EXPECT_EQ(nli::sanitizeName("", ""), "unnamed");
}

TEST(NamesTest, SanitizeCapsLength) {
  std::string longName(400, 'n');
  EXPECT_EQ(nli::sanitizeName(longName, "x").size(), nli::kMaxNameLength);

  // Two-byte sequences straddling the limit are not split
  std::string accented;
  for (int i = 0; i < 200; ++i) {
    accented += "\xC3\xA9";
  }
  std::string capped = nli::sanitizeName(accented, "x");
  EXPECT_LE(capped.size(), nli::kMaxNameLength);
  EXPECT_EQ(capped.size() % 2, 0u);
}

TEST(NamesTest, PercentEncodePath) {
  EXPECT_EQ(nli::percentEncodePath("docs/My File.txt"), "docs/My+File.txt");
  EXPECT_EQ(nli::percentEncodePath("a&b/c%d"), "a%26b/c%25d");
  EXPECT_EQ(nli::percentEncodePath("caf\xC3\xA9"), "caf%C3%A9");
}

TEST(NamesTest, SanitizeXmlTextDropsControlCharacters) {
  EXPECT_EQ(nli::sanitizeXmlText(std::string("a\x01" "b\tc\nd", 7)), "ab\tc\nd");
  EXPECT_EQ(nli::sanitizeXmlText("plain"), "plain");
}

// Test that bytes which are not UTF-8 never reach the manifest
TEST(NamesTest, SanitizeXmlTextRepairsInvalidUtf8) {
  const std::string replacement = "\xEF\xBF\xBD";

  // Latin-1 e-acute
  EXPECT_EQ(nli::sanitizeXmlText("caf\xE9"), "caf" + replacement);
  // CESU-8 surrogate: the lead byte and both continuation bytes are rejected
  EXPECT_EQ(nli::sanitizeXmlText("\xED\xA0\x80"), replacement + replacement + replacement);
  // Overlong '/'
  EXPECT_EQ(nli::sanitizeXmlText("\xC0\xAF"), replacement + replacement);
  // Truncated sequence at the end
  EXPECT_EQ(nli::sanitizeXmlText("ab\xE2\x82"), "ab" + replacement + replacement);

  // Valid multi-byte text is kept, U+FFFE is removed
  EXPECT_EQ(nli::sanitizeXmlText("\xE2\x82\xAC \xF0\x9F\x98\x80"), "\xE2\x82\xAC \xF0\x9F\x98\x80");
  EXPECT_EQ(nli::sanitizeXmlText("x\xEF\xBF\xBEy"), "xy");

  EXPECT_TRUE(nli::isValidUtf8(nli::sanitizeXmlText("caf\xE9\xFF\x80")));
}

TEST(NamesTest, EffectiveNamesAreValidUtf8) {
  EXPECT_EQ(nli::sanitizeName("caf\xE9.txt", "x"), "caf\xEF\xBF\xBD.txt");
  EXPECT_TRUE(nli::isValidUtf8(nli::sanitizeName("\xFF\xFE", "x")));
  EXPECT_FALSE(nli::isValidUtf8("caf\xE9"));
  EXPECT_TRUE(nli::isValidUtf8("caf\xC3\xA9"));
}

TEST(NamesTest, NormalizeArchivePath) {
  EXPECT_EQ(nli::normalizeArchivePath("Data\\Sub/FILE.TXT"), "data/sub/file.txt");
}
