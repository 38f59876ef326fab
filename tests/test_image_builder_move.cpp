// ImageBuilder keeps its tree behind a pointer to an incomplete type; these tests make sure
// destruction and moves are instantiated where EntryTree is complete

#include <memory>
#include <unordered_map>
#include <vector>

#include <nli/image_builder.hpp>

#include <gtest/gtest.h>

TEST(ImageBuilderMoveTest, UniquePtr) {
  auto builder = std::make_unique<nli::ImageBuilder>();
  ASSERT_NE(builder, nullptr);
  EXPECT_EQ(builder->entryCount(), 0u);
}

TEST(ImageBuilderMoveTest, Containers) {
  std::unordered_map<std::string, nli::ImageBuilder> byCase;
  byCase.emplace("case-1", nli::ImageBuilder());

  std::vector<nli::ImageBuilder> builders;
  builders.push_back(nli::ImageBuilder());
  builders.emplace_back(nli::BuildConfig{});
  EXPECT_EQ(builders.size(), 2u);
  EXPECT_FALSE(byCase.empty());
}

// Test that moved builders keep their entries
TEST(ImageBuilderMoveTest, MoveKeepsEntries) {
  nli::ImageBuilder a;
  auto id = a.addDirectory("kept");
  ASSERT_TRUE(id.has_value());

  nli::ImageBuilder b = std::move(a);
  EXPECT_EQ(b.entryCount(), 1u);
  EXPECT_NE(b.findEntry(*id), nullptr);

  a = nli::ImageBuilder();
  a = std::move(b);
  EXPECT_EQ(a.entryCount(), 1u);
}
