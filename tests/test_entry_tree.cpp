#include <functional>
#include <memory>
#include <set>
#include <string>

#include <nli/entry_tree.hpp>
#include <nli/file_entry.hpp>
#include <nli/mapping_entry.hpp>

#include <gtest/gtest.h>

namespace {

// Record whose PID doubles as its id, like a process list row
class ProcessEntry : public nli::MappingEntry {
public:
  ProcessEntry(nli::Mapping data, std::optional<std::string> parentId = std::nullopt)
      : MappingEntry(std::move(data), "application/x-process", std::move(parentId)) {}

  std::optional<std::string> identifierField() const override { return "PID"; }
};

// Record with a timeline date in a custom format
class LogLineEntry : public nli::MappingEntry {
public:
  explicit LogLineEntry(nli::Mapping data)
      : MappingEntry(std::move(data), "application/x-log-line") {}

  std::optional<std::string> timeField() const override { return "When"; }
  std::string itemDateFormat() const override { return "%d/%m/%Y %H:%M"; }
};

std::unique_ptr<nli::Entry> directory(std::string name,
                                      std::optional<std::string> parent = std::nullopt) {
  return std::make_unique<nli::DirectoryEntry>(std::move(name), std::move(parent));
}

nli::ErrorCode codeOf(const std::function<void()> &op) {
  try {
    op();
  } catch (const nli::Error &e) {
    return e.code();
  }
  return nli::ErrorCode::None;
}

} // namespace

TEST(EntryTreeTest, IdsAreUnique) {
  nli::EntryTree tree;
  std::set<std::string> ids;

  // Same name, same parent: still distinct ids
  std::string root = tree.add(directory("root"));
  ids.insert(root);
  for (int i = 0; i < 50; ++i) {
    ids.insert(tree.add(directory("same", root)));
  }

  EXPECT_EQ(ids.size(), 51u);
  EXPECT_EQ(tree.size(), 51u);
  for (const auto &id : ids) {
    EXPECT_EQ(id.size(), 40u);
  }
}

TEST(EntryTreeTest, StructureQueries) {
  nli::EntryTree tree;
  std::string a = tree.add(directory("a"));
  std::string b = tree.add(directory("b"));
  std::string a1 = tree.add(directory("a1", a));
  std::string a2 = tree.add(directory("a2", a));
  std::string a1x = tree.add(directory("x", a1));

  EXPECT_EQ(tree.roots(), (std::vector<std::string>{a, b}));
  EXPECT_EQ(tree.children(a), (std::vector<std::string>{a1, a2}));
  EXPECT_TRUE(tree.children(b).empty());
  EXPECT_TRUE(tree.contains(a1x));
  EXPECT_FALSE(tree.contains("nope"));

  std::vector<std::string> order;
  for (const nli::Entry *entry : tree.depthFirst()) {
    order.push_back(entry->name());
  }
  EXPECT_EQ(order, (std::vector<std::string>{"a", "a1", "x", "a2", "b"}));

  EXPECT_EQ(tree.relativePath(*tree.find(a1x)), "a/a1/x");
}

// Test that a parent may arrive after its children, but must arrive
TEST(EntryTreeTest, DanglingParentReported) {
  nli::EntryTree tree;
  tree.add(directory("orphan", std::string("missing-parent")));

  EXPECT_EQ(codeOf([&] { tree.validate(); }), nli::ErrorCode::DanglingParentReference);
}

TEST(EntryTreeTest, LateParentResolves) {
  nli::EntryTree tree;
  std::string child = tree.add(std::make_unique<ProcessEntry>(
      nli::Mapping{{"PID", std::string("200")}, {"PPID", std::string("100")}},
      std::string("100")));
  EXPECT_EQ(child, "200");

  std::string parent = tree.add(std::make_unique<ProcessEntry>(
      nli::Mapping{{"PID", std::string("100")}, {"PPID", std::string("1")}}));
  EXPECT_EQ(parent, "100");

  EXPECT_NO_THROW(tree.validate());
  EXPECT_EQ(tree.relativePath(*tree.find(child)), "200");
}

TEST(EntryTreeTest, SelfParentIsCyclic) {
  nli::EntryTree tree;
  auto entry = std::make_unique<ProcessEntry>(nli::Mapping{{"PID", std::string("7")}},
                                              std::string("7"));

  EXPECT_EQ(codeOf([&] { tree.add(std::move(entry)); }), nli::ErrorCode::CyclicParentReference);
  EXPECT_TRUE(tree.empty());
}

// Test natural identifiers falling back to generated ids on collision
TEST(EntryTreeTest, NaturalIdentifierCollision) {
  nli::EntryTree tree;
  std::string first = tree.add(std::make_unique<ProcessEntry>(nli::Mapping{{"PID", int64_t{42}}}));
  std::string second =
      tree.add(std::make_unique<ProcessEntry>(nli::Mapping{{"PID", int64_t{42}}}));
  std::string third = tree.add(std::make_unique<ProcessEntry>(nli::Mapping{{"PID", std::string()}}));

  EXPECT_EQ(first, "42");
  EXPECT_NE(second, "42");
  EXPECT_EQ(second.size(), 40u);
  EXPECT_NE(third, "");
}

TEST(EntryTreeTest, RejectsNullEntry) {
  nli::EntryTree tree;
  EXPECT_EQ(codeOf([&] { tree.add(nullptr); }), nli::ErrorCode::InvalidArgument);
}

TEST(EntryTreeTest, ParentFrozenAfterRegistration) {
  nli::EntryTree tree;
  std::string id = tree.add(directory("fixed"));
  nli::Entry *entry = tree.find(id);
  ASSERT_NE(entry, nullptr);

  EXPECT_TRUE(entry->isRegistered());
  EXPECT_EQ(codeOf([&] { entry->setParentId(std::string("elsewhere")); }),
            nli::ErrorCode::InvalidArgument);
}

// Test standard fields and the rules for caller fields
TEST(EntryTreeTest, StandardFields) {
  nli::EntryTree tree;
  std::string id = tree.add(std::make_unique<nli::MappingEntry>(
      nli::Mapping{{"Host Name", std::string("ws-01")}, {"Ports", int64_t{3}}},
      "application/x-host"));
  const nli::Entry *entry = tree.find(id);

  ASSERT_NE(entry->findField("Host Name"), nullptr);
  EXPECT_EQ(entry->findField("Ports")->type(), nli::FieldType::LongInteger);
  EXPECT_EQ(entry->findField("MIME Type")->toString(), "application/x-host");
  EXPECT_EQ(entry->findField("Name")->toString(), "ws-01");
  EXPECT_EQ(entry->findField("SHA-1")->toString().size(), 40u);
  EXPECT_FALSE(entry->hasField("Item Date"));

  // Data fields come first, in mapping order
  EXPECT_EQ(entry->fields()[0].name(), "Host Name");
  EXPECT_EQ(entry->fields()[1].name(), "Ports");
}

TEST(EntryTreeTest, FieldRules) {
  nli::DirectoryEntry entry("case");

  entry.addField(nli::Field("Note", nli::FieldType::Text, std::string("one")));
  EXPECT_EQ(codeOf([&] { entry.addField(nli::Field("Note", nli::FieldType::Text)); }),
            nli::ErrorCode::DuplicateField);
  EXPECT_EQ(codeOf([&] { entry.addField(nli::Field("Name", nli::FieldType::Text)); }),
            nli::ErrorCode::DuplicateField);
  EXPECT_EQ(codeOf([&] { entry.setFieldValue("Missing", std::string("x")); }),
            nli::ErrorCode::UnknownField);
  EXPECT_EQ(codeOf([&] { entry.setFieldValue("Note", nli::Timestamp{}); }), nli::ErrorCode::None);

  nli::Field count("Count", nli::FieldType::LongInteger);
  entry.addField(count);
  EXPECT_EQ(codeOf([&] { entry.setFieldValue("Count", std::string("many")); }),
            nli::ErrorCode::InvalidFieldType);
}

// Test that an explicit replacement survives standard population
TEST(EntryTreeTest, ReplacedStandardFieldSurvives) {
  auto entry = std::make_unique<nli::DirectoryEntry>("evidence");
  entry->replaceField(nli::Field("Name", nli::FieldType::Text, std::string("Exhibit A")));

  nli::EntryTree tree;
  std::string id = tree.add(std::move(entry));
  EXPECT_EQ(tree.find(id)->findField("Name")->toString(), "Exhibit A");
  EXPECT_EQ(tree.find(id)->name(), "evidence");
}

TEST(EntryTreeTest, EffectiveNameFallsBackToId) {
  nli::EntryTree tree;
  std::string id = tree.add(std::make_unique<nli::MappingEntry>(
      nli::Mapping{{"name", std::string("///")}}, "application/x-test"));
  EXPECT_EQ(tree.find(id)->name(), "___");

  id = tree.add(std::make_unique<nli::MappingEntry>(nli::Mapping{{"name", std::string("  ")}},
                                                    "application/x-test"));
  EXPECT_EQ(tree.find(id)->name(), id);
}

TEST(EntryTreeTest, MappingNamingRule) {
  EXPECT_EQ(nli::mappingDisplayName({{"pid", int64_t{4}}, {"ProcessName", std::string("init")}}),
            "init");
  EXPECT_EQ(nli::mappingDisplayName({{"pid", int64_t{4}}, {"cmd", std::string("init")}}), "4");
  EXPECT_EQ(nli::mappingDisplayName({}), "");
}

TEST(EntryTreeTest, MappingItemDate) {
  nli::EntryTree tree;
  std::string id = tree.add(std::make_unique<LogLineEntry>(
      nli::Mapping{{"Message", std::string("boot")}, {"When", std::string("01/03/2024 12:30")}}));
  EXPECT_EQ(tree.find(id)->findField("Item Date")->toString(), "2024-03-01T12:30:00.000+00:00");

  auto bad = std::make_unique<LogLineEntry>(
      nli::Mapping{{"Message", std::string("boot")}, {"When", std::string("2024-03-01")}});
  EXPECT_EQ(codeOf([&] { tree.add(std::move(bad)); }), nli::ErrorCode::DateParseError);
  EXPECT_EQ(tree.size(), 1u);

  auto missing = std::make_unique<LogLineEntry>(nli::Mapping{{"Message", std::string("x")}});
  EXPECT_EQ(codeOf([&] { tree.add(std::move(missing)); }), nli::ErrorCode::DateParseError);
}

TEST(EntryTreeTest, MappingText) {
  nli::MappingEntry entry({{"a", std::string("1")}, {"b", 2.5}, {"c", true}}, "x/y");
  EXPECT_EQ(entry.text().value_or(""), "a: 1\nb: 2.5\nc: true");
  EXPECT_EQ(entry.nativeKind(), nli::NativeKind::Text);
}

TEST(EntryTreeTest, DirectoryFromMapping) {
  nli::EntryTree tree;
  std::string id = tree.add(std::make_unique<nli::DirectoryEntry>(
      nli::Mapping{{"Volume", std::string("C")}, {"Label Name", std::string("System")}}));
  const nli::Entry *entry = tree.find(id);

  EXPECT_EQ(entry->name(), "System");
  EXPECT_EQ(entry->mimeType(), "filesystem/directory");
  EXPECT_EQ(entry->findField("Volume")->toString(), "C");
  EXPECT_EQ(entry->addAsParentPath("child"), "System/child");
}
