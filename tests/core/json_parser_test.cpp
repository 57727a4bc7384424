// Tests for core/json_parser.h -- document parsing and accessors.

#include "core/json_parser.h"

#include <gtest/gtest.h>

#include <limits>
#include <string>

namespace liftpack {
namespace {

// ---------------------------------------------------------------------------
// Scalars
// ---------------------------------------------------------------------------

TEST(JsonParserTest, ParsesScalars) {
  JsonValue value;
  std::string error;

  ASSERT_TRUE(parseJson("42", value, error)) << error;
  EXPECT_TRUE(value.isNumber());
  EXPECT_EQ(value.asInt(), 42);

  ASSERT_TRUE(parseJson("-2.5e1", value, error)) << error;
  EXPECT_DOUBLE_EQ(value.number_val, -25.0);

  ASSERT_TRUE(parseJson("true", value, error)) << error;
  EXPECT_TRUE(value.asBool(false));

  ASSERT_TRUE(parseJson("null", value, error)) << error;
  EXPECT_EQ(value.type, JsonValue::Null);

  ASSERT_TRUE(parseJson(R"("hello")", value, error)) << error;
  EXPECT_EQ(value.asString(), "hello");
}

TEST(JsonParserTest, StringEscapes) {
  JsonValue value;
  std::string error;
  ASSERT_TRUE(parseJson(R"("a\"b\\c\ndA")", value, error)) << error;
  EXPECT_EQ(value.string_val, "a\"b\\c\ndA");
}

TEST(JsonParserTest, AccessorsFallBackOnTypeMismatch) {
  JsonValue value;
  std::string error;
  ASSERT_TRUE(parseJson(R"("text")", value, error));
  EXPECT_EQ(value.asInt(7), 7);
  EXPECT_TRUE(value.asBool(true));
  EXPECT_TRUE(value.asStringList().empty());
  EXPECT_EQ(value.find("key"), nullptr);
}

TEST(JsonParserTest, LargeTimestampAsInt64) {
  JsonValue value;
  std::string error;
  ASSERT_TRUE(parseJson("1700000000123", value, error));
  EXPECT_EQ(value.asInt64(), 1700000000123LL);
}

TEST(JsonParserTest, IntegerAccessorsSaturate) {
  JsonValue value;
  std::string error;
  ASSERT_TRUE(parseJson("1e12", value, error));
  EXPECT_EQ(value.asInt(), std::numeric_limits<int>::max());
  ASSERT_TRUE(parseJson("-1e12", value, error));
  EXPECT_EQ(value.asInt(), std::numeric_limits<int>::min());
  ASSERT_TRUE(parseJson("1e30", value, error));
  EXPECT_EQ(value.asInt64(), std::numeric_limits<int64_t>::max());
  ASSERT_TRUE(parseJson("-7.9", value, error));
  EXPECT_EQ(value.asInt(), -7);
}

// ---------------------------------------------------------------------------
// Containers
// ---------------------------------------------------------------------------

TEST(JsonParserTest, NestedObjectKeepsMemberOrder) {
  JsonValue root;
  std::string error;
  ASSERT_TRUE(parseJson(R"({"z": 1, "a": {"inner": [1, 2, 3]}, "m": "x"})", root, error))
      << error;
  ASSERT_TRUE(root.isObject());
  ASSERT_EQ(root.object_val.size(), 3u);
  EXPECT_EQ(root.object_val[0].first, "z");
  EXPECT_EQ(root.object_val[1].first, "a");
  EXPECT_EQ(root.object_val[2].first, "m");

  const JsonValue* inner = root.find("a");
  ASSERT_NE(inner, nullptr);
  const JsonValue* list = inner->find("inner");
  ASSERT_NE(list, nullptr);
  ASSERT_TRUE(list->isArray());
  ASSERT_EQ(list->array_val.size(), 3u);
  EXPECT_EQ(list->array_val[2].asInt(), 3);
}

TEST(JsonParserTest, StringListSkipsNonStrings) {
  JsonValue root;
  std::string error;
  ASSERT_TRUE(parseJson(R"(["dumbbell", 3, "bench", null])", root, error));
  auto items = root.asStringList();
  ASSERT_EQ(items.size(), 2u);
  EXPECT_EQ(items[0], "dumbbell");
  EXPECT_EQ(items[1], "bench");
}

TEST(JsonParserTest, EmptyContainers) {
  JsonValue root;
  std::string error;
  ASSERT_TRUE(parseJson(R"({"a": [], "b": {}})", root, error)) << error;
  EXPECT_TRUE(root.find("a")->array_val.empty());
  EXPECT_TRUE(root.find("b")->object_val.empty());
}

// ---------------------------------------------------------------------------
// Errors
// ---------------------------------------------------------------------------

TEST(JsonParserTest, RejectsMalformedInput) {
  JsonValue root;
  std::string error;

  EXPECT_FALSE(parseJson("", root, error));
  EXPECT_FALSE(parseJson(R"({"a": 1,})", root, error));
  EXPECT_FALSE(parseJson(R"({"a" 1})", root, error));
  EXPECT_FALSE(parseJson(R"([1, 2)", root, error));
  EXPECT_FALSE(parseJson(R"("unterminated)", root, error));
  EXPECT_FALSE(parseJson("tru", root, error));
}

TEST(JsonParserTest, ErrorReportsOffset) {
  JsonValue root;
  std::string error;
  EXPECT_FALSE(parseJson("[1, ?]", root, error));
  EXPECT_NE(error.find("offset 4"), std::string::npos) << error;
}

TEST(JsonParserTest, RejectsTrailingCharacters) {
  JsonValue root;
  std::string error;
  EXPECT_FALSE(parseJson("{} x", root, error));
  EXPECT_NE(error.find("trailing"), std::string::npos) << error;
}

TEST(JsonParserTest, RejectsExcessiveNesting) {
  std::string deep(100, '[');
  deep += std::string(100, ']');
  JsonValue root;
  std::string error;
  EXPECT_FALSE(parseJson(deep, root, error));
  EXPECT_NE(error.find("nesting"), std::string::npos) << error;
}

TEST(JsonParserTest, ReadTextFileMissing) {
  std::string out;
  std::string error;
  EXPECT_FALSE(readTextFile("/nonexistent/liftpack/catalog.json", out, error));
  EXPECT_NE(error.find("cannot open"), std::string::npos);
}

}  // namespace
}  // namespace liftpack
