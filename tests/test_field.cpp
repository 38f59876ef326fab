#include <chrono>

#include <nli/datetime.hpp>
#include <nli/field.hpp>

#include <gtest/gtest.h>

using namespace std::chrono_literals;

// Test type names written as DataType attributes
TEST(FieldTest, TypeNames) {
  EXPECT_EQ(nli::toString(nli::FieldType::Text), "Text");
  EXPECT_EQ(nli::toString(nli::FieldType::LongText), "LongText");
  EXPECT_EQ(nli::toString(nli::FieldType::DateTime), "DateTime");
  EXPECT_EQ(nli::toString(nli::FieldType::LongInteger), "LongInteger");
  EXPECT_EQ(nli::toString(nli::FieldType::Decimal), "Decimal");
  EXPECT_EQ(nli::toString(nli::FieldType::Boolean), "Boolean");
}

TEST(FieldTest, EmptyByDefault) {
  nli::Field field("Comment", nli::FieldType::Text);
  EXPECT_EQ(field.name(), "Comment");
  EXPECT_FALSE(field.hasValue());
  EXPECT_EQ(field.toString(), "");
}

// Test lossless coercions
TEST(FieldTest, CoercesCompatibleValues) {
  nli::Field count("Count", nli::FieldType::LongInteger);
  count.setValue(std::string("42"));
  EXPECT_EQ(std::get<int64_t>(count.value()), 42);

  count.setValue(7.0);
  EXPECT_EQ(std::get<int64_t>(count.value()), 7);

  nli::Field ratio("Ratio", nli::FieldType::Decimal);
  ratio.setValue(int64_t{3});
  EXPECT_DOUBLE_EQ(std::get<double>(ratio.value()), 3.0);

  nli::Field flag("Flag", nli::FieldType::Boolean);
  flag.setValue(std::string("TRUE"));
  EXPECT_TRUE(std::get<bool>(flag.value()));
  flag.setValue(int64_t{0});
  EXPECT_FALSE(std::get<bool>(flag.value()));

  nli::Field label("Label", nli::FieldType::Text);
  label.setValue(int64_t{12});
  EXPECT_EQ(std::get<std::string>(label.value()), "12");
}

TEST(FieldTest, RejectsIncompatibleValues) {
  nli::Field count("Count", nli::FieldType::LongInteger);
  try {
    count.setValue(std::string("forty-two"));
    FAIL() << "Expected InvalidFieldType";
  } catch (const nli::Error &e) {
    EXPECT_EQ(e.code(), nli::ErrorCode::InvalidFieldType);
  }
  EXPECT_FALSE(count.hasValue());

  nli::Field flag("Flag", nli::FieldType::Boolean);
  EXPECT_THROW(flag.setValue(int64_t{2}), nli::Error);

  nli::Field when("When", nli::FieldType::DateTime);
  EXPECT_THROW(when.setValue(std::string("yesterday")), nli::Error);
  EXPECT_THROW(when.setValue(1.5), nli::Error);
}

TEST(FieldTest, ClearWithMonostate) {
  nli::Field count("Count", nli::FieldType::LongInteger, int64_t{5});
  ASSERT_TRUE(count.hasValue());
  count.setValue(std::monostate{});
  EXPECT_FALSE(count.hasValue());
}

// Test decimals rounded to 4 places
TEST(FieldTest, DecimalRendering) {
  EXPECT_EQ(nli::renderValue(1.5), "1.5");
  EXPECT_EQ(nli::renderValue(2.0), "2.0");
  EXPECT_EQ(nli::renderValue(3.14159265), "3.1416");
  EXPECT_EQ(nli::renderValue(true), "true");
  EXPECT_EQ(nli::renderValue(int64_t{-9}), "-9");
}

TEST(FieldTest, DateTimeRendering) {
  auto ts = nli::Timestamp(std::chrono::sys_days(std::chrono::year{2024} / 3 / 1)) + 12h + 30min +
            5s + 250ms;
  nli::Field when("When", nli::FieldType::DateTime, ts);
  EXPECT_EQ(when.toString(), "2024-03-01T12:30:05.250+00:00");
  EXPECT_EQ(when.toString("Z"), "2024-03-01T12:30:05.250Z");

  nli::Field parsed("Parsed", nli::FieldType::DateTime, std::string("2024-03-01 12:30:05"));
  EXPECT_EQ(parsed.toString(), "2024-03-01T12:30:05.000+00:00");
}

// Test inference for mapping values
TEST(FieldTest, FactoryInfersTypes) {
  EXPECT_EQ(nli::FieldFactory::infer("a", true).type(), nli::FieldType::Boolean);
  EXPECT_EQ(nli::FieldFactory::infer("b", int64_t{1}).type(), nli::FieldType::LongInteger);
  EXPECT_EQ(nli::FieldFactory::infer("c", 0.25).type(), nli::FieldType::Decimal);
  EXPECT_EQ(nli::FieldFactory::infer("d", nli::now()).type(), nli::FieldType::DateTime);
  EXPECT_EQ(nli::FieldFactory::infer("e", std::string("x")).type(), nli::FieldType::Text);
  EXPECT_EQ(nli::FieldFactory::infer("f", std::monostate{}).type(), nli::FieldType::Text);
}

TEST(FieldTest, FactoryGenerateCoercesInitialValue) {
  nli::Field field = nli::FieldFactory::generate("Size", nli::FieldType::LongInteger,
                                                 std::string("1024"));
  EXPECT_EQ(std::get<int64_t>(field.value()), 1024);

  EXPECT_THROW(nli::FieldFactory::generate("Size", nli::FieldType::LongInteger,
                                           std::string("big")),
               nli::Error);
}

// Test that a clone never shares its value with the original
TEST(FieldTest, CloneIsIndependent) {
  nli::Field original("Tag", nli::FieldType::Text, std::string("first"));
  nli::Field copy = original.clone();

  original.setValue(std::string("second"));
  EXPECT_EQ(copy.toString(), "first");
  EXPECT_EQ(original.toString(), "second");
}
