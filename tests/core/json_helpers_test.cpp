/**
 * @file json_helpers_test.cpp
 * @brief Tests for JSON helpers.
 */

#include "core/json_helpers.h"

#include <gtest/gtest.h>

#include <sstream>

namespace fretvoice {
namespace json {
namespace {

// ============================================================================
// escape() tests
// ============================================================================

TEST(JsonEscapeTest, PlainString) {
  EXPECT_EQ(escape("X02210"), "X02210");
  EXPECT_EQ(escape(""), "");
}

TEST(JsonEscapeTest, QuoteAndBackslash) {
  EXPECT_EQ(escape("say \"hi\""), "say \\\"hi\\\"");
  EXPECT_EQ(escape("a\\b"), "a\\\\b");
}

TEST(JsonEscapeTest, ControlCharacters) {
  EXPECT_EQ(escape("line1\nline2"), "line1\\nline2");
  EXPECT_EQ(escape("col1\tcol2"), "col1\\tcol2");
  EXPECT_EQ(escape("text\r\n"), "text\\r\\n");
}

// ============================================================================
// Writer - compact mode tests
// ============================================================================

TEST(JsonWriterTest, EmptyObject) {
  std::ostringstream oss;
  Writer w(oss);
  w.beginObject().endObject();
  EXPECT_EQ(oss.str(), "{}");
}

TEST(JsonWriterTest, ObjectWithAllTypes) {
  std::ostringstream oss;
  Writer w(oss);
  w.beginObject()
      .write("chord", "Am")
      .write("score", 19)
      .write("open", true)
      .write("ratio", 2.5)
      .writeNull("bass")
      .endObject();
  EXPECT_EQ(oss.str(), R"({"chord":"Am","score":19,"open":true,"ratio":2.5,"bass":null})");
}

TEST(JsonWriterTest, ArrayOfObjects) {
  std::ostringstream oss;
  Writer w(oss);
  w.beginArray()
      .beginObject()
      .write("capo", 0)
      .endObject()
      .beginObject()
      .write("capo", 1)
      .endObject()
      .endArray();
  EXPECT_EQ(oss.str(), R"([{"capo":0},{"capo":1}])");
}

TEST(JsonWriterTest, NestedArrayInObject) {
  std::ostringstream oss;
  Writer w(oss);
  w.beginObject()
      .write("chord", "C")
      .beginArray("voicings")
      .value("X32010")
      .value("332010")
      .endArray()
      .endObject();
  EXPECT_EQ(oss.str(), R"({"chord":"C","voicings":["X32010","332010"]})");
}

// ============================================================================
// Writer - pretty mode tests
// ============================================================================

TEST(JsonWriterPrettyTest, EmptyObject) {
  std::ostringstream oss;
  Writer w(oss, true);
  w.beginObject().endObject();
  EXPECT_EQ(oss.str(), "{\n}");
}

TEST(JsonWriterPrettyTest, SimpleObject) {
  std::ostringstream oss;
  Writer w(oss, true);
  w.beginObject().write("min_fret", 0).write("root_in_bass", true).endObject();
  EXPECT_EQ(oss.str(), "{\n  \"min_fret\": 0,\n  \"root_in_bass\": true\n}");
}

TEST(JsonWriterPrettyTest, ObjectsInArrayAreIndented) {
  std::ostringstream oss;
  Writer w(oss, true);
  w.beginArray().beginObject().write("capo", 2).endObject().endArray();
  EXPECT_EQ(oss.str(), "[\n  {\n    \"capo\": 2\n  }\n]");
}

// ============================================================================
// Scope tests
// ============================================================================

TEST(JsonScopeTest, NestedScopes) {
  std::ostringstream oss;
  Writer w(oss);
  {
    ObjectScope obj(w);
    w.write("chord", "G");
    ArrayScope arr(w, "shapes");
    w.value("G").value("D");
  }
  EXPECT_EQ(oss.str(), R"({"chord":"G","shapes":["G","D"]})");
}

TEST(JsonScopeTest, ScopeWriterAccess) {
  std::ostringstream oss;
  Writer w(oss);
  {
    ObjectScope obj(w);
    obj.writer().write("limit", 5);
  }
  EXPECT_EQ(oss.str(), R"({"limit":5})");
}

// ============================================================================
// Parser tests
// ============================================================================

TEST(JsonParserTest, EmptyObject) {
  Parser p("{}");
  EXPECT_TRUE(p.isValid());
  EXPECT_FALSE(p.has("anything"));
}

TEST(JsonParserTest, SimpleValues) {
  Parser p(R"({"max_fret_span": 5, "root_in_bass": false, "max_difficulty": "beginner"})");
  EXPECT_TRUE(p.isValid());
  EXPECT_EQ(p.getInt("max_fret_span"), 5);
  EXPECT_FALSE(p.getBool("root_in_bass", true));
  EXPECT_EQ(p.getString("max_difficulty"), "beginner");
}

TEST(JsonParserTest, DefaultValues) {
  Parser p("{}");
  EXPECT_EQ(p.getInt("missing", 99), 99);
  EXPECT_TRUE(p.getBool("missing", true));
  EXPECT_EQ(p.getString("missing", "default"), "default");
}

TEST(JsonParserTest, NegativeAndZero) {
  Parser p(R"({"a":-3,"b":0})");
  EXPECT_EQ(p.getInt("a"), -3);
  EXPECT_EQ(p.getInt("b", 7), 0);
}

TEST(JsonParserTest, MalformedNumberFallsBackToDefault) {
  Parser p(R"({"span":"wide","fret":12abc,"huge":99999999999999999999})");
  EXPECT_EQ(p.getInt("span", 4), 4);
  EXPECT_EQ(p.getInt("fret", 12), 12);
  EXPECT_EQ(p.getInt("huge", 1), 1);
}

TEST(JsonParserTest, NonBooleanFallsBackToDefault) {
  Parser p(R"({"flag":1})");
  EXPECT_TRUE(p.getBool("flag", true));
  EXPECT_FALSE(p.getBool("flag", false));
}

TEST(JsonParserTest, NestedStructuresAreSkipped) {
  Parser p(R"({"nested":{"x":1,"y":[1,2]},"list":["a","}"],"after":3})");
  EXPECT_TRUE(p.isValid());
  EXPECT_TRUE(p.has("nested"));
  EXPECT_FALSE(p.has("x"));
  EXPECT_EQ(p.getInt("after"), 3);
}

TEST(JsonParserTest, StringWithEscapes) {
  Parser p(R"({"text":"hello\"world"})");
  EXPECT_EQ(p.getString("text"), "hello\"world");
}

TEST(JsonParserTest, NotAnObject) {
  EXPECT_FALSE(Parser("[1,2]").isValid());
  EXPECT_FALSE(Parser("").isValid());
  EXPECT_FALSE(Parser(R"({"unterminated": 1)").isValid());
}

// ============================================================================
// Visitor tests
// ============================================================================

struct Sample {
  uint8_t span = 4;
  bool flag = true;
  int count = 0;

  template <typename Self, typename V>
  static void visitFields(Self&& self, V&& v) {
    v("span", self.span);
    v("flag", self.flag);
    v("count", self.count);
  }
};

TEST(JsonVisitorTest, WriteVisitorWritesEveryField) {
  std::ostringstream oss;
  Writer w(oss);
  Sample s;
  s.count = -2;
  w.beginObject();
  WriteVisitor v{w};
  Sample::visitFields(s, v);
  w.endObject();
  EXPECT_EQ(oss.str(), R"({"span":4,"flag":true,"count":-2})");
}

TEST(JsonVisitorTest, ReadVisitorKeepsMissingAndOutOfRange) {
  Parser p(R"({"span":300,"count":7})");
  Sample s;
  ReadVisitor v{p};
  Sample::visitFields(s, v);
  EXPECT_EQ(s.span, 4);  // 300 does not fit
  EXPECT_TRUE(s.flag);
  EXPECT_EQ(s.count, 7);
}

}  // namespace
}  // namespace json
}  // namespace fretvoice
