#include <algorithm>
#include <gtest/gtest.h>
#include <jsonport/jsonport.hpp>
#include <string>
#include <vector>

using namespace jsonport;

// ============================================================================
// Typed array conversions
// ============================================================================

TEST(Arrays, IntArray) {
  EXPECT_EQ(parse("[1, -2, 3.9, 4e2]").int_array(),
            (std::vector<int64_t>{1, -2, 3, 400}));
  EXPECT_TRUE(parse("[]").int_array().empty());
}

TEST(Arrays, DoubleArray) {
  std::vector<double> d = parse("[0.5, 1, -2e-1]").double_array();
  ASSERT_EQ(d.size(), 3u);
  EXPECT_DOUBLE_EQ(d[0], 0.5);
  EXPECT_DOUBLE_EQ(d[1], 1.0);
  EXPECT_DOUBLE_EQ(d[2], -0.2);
}

TEST(Arrays, BoolArray) {
  EXPECT_EQ(parse("[true, false, true]").bool_array(),
            (std::vector<bool>{true, false, true}));
  Value mixed = parse("[true, 0, \"\", [1], null]");
  EXPECT_THROW(mixed.bool_array(), TypeMismatchError);
  mixed.set_all_as_bool();
  EXPECT_EQ(mixed.bool_array(),
            (std::vector<bool>{true, false, false, true, false}));
}

TEST(Arrays, StringArray) {
  EXPECT_EQ(parse(R"(["a", "", "c\nd"])").string_array(),
            (std::vector<std::string>{"a", "", "c\nd"}));
  EXPECT_THROW(parse(R"(["a", 1])").string_array(), TypeMismatchError);
}

// NOTE: string-as-number does not turn numbers into strings.
TEST(Arrays, StringArrayIgnoresStringAsNumber) {
  Value v = parse("[1]");
  v.set_string_as_number();
  EXPECT_THROW(v.string_array(), TypeMismatchError);
}

TEST(Arrays, ConversionFailsAtomicallyOnFirstBadElement) {
  Value v = parse("[1, 2e9999, 3]");
  EXPECT_THROW(v.double_array(), ConversionOverflowError);
  EXPECT_THROW(v.int_array(), ConversionOverflowError);

  try {
    parse(R"([1, "two", null])").int_array();
    FAIL();
  } catch (const TypeMismatchError &e) {
    EXPECT_STREQ(e.what(),
                 "type mismatch: expected NUMBER, found STRING \"two\"");
  }
}

TEST(Arrays, NonArrayReceiver) {
  try {
    parse(R"({"a":1})").int_array();
    FAIL();
  } catch (const TypeMismatchError &e) {
    EXPECT_EQ(e.expected(), Type::Array);
    EXPECT_EQ(e.found(), Type::Object);
  }
  EXPECT_THROW(parse("null").string_array(), TypeMismatchError);
}

TEST(Arrays, StringAsNumberElements) {
  Value v = parse(R"(["1", 2, "3.5"])");
  v.set_string_as_number();
  EXPECT_EQ(v.int_array(), (std::vector<int64_t>{1, 2, 3}));
}

// ============================================================================
// each_of
// ============================================================================

TEST(EachOf, OverArrayElements) {
  Value ids = parse(R"([{"id":1},{"id":2}])").each_of("id");
  ASSERT_TRUE(ids.is_array());
  EXPECT_EQ(ids.int_array(), (std::vector<int64_t>{1, 2}));
}

TEST(EachOf, OverObjectValues) {
  Value v = parse(R"({"x":{"v":1},"y":{"v":2},"z":{"v":3}})");
  std::vector<int64_t> got = v.each_of("v").int_array();
  std::sort(got.begin(), got.end());
  EXPECT_EQ(got, (std::vector<int64_t>{1, 2, 3}));
}

TEST(EachOf, IndexPath) {
  Value v = parse("[[1,2],[3,4],[5]]");
  Value second = v.each_of(1);
  EXPECT_EQ(second.size(), 3u);
  EXPECT_EQ(second.get(0).as_int(), 2);
  EXPECT_TRUE(second.get(2).is_null());
}

TEST(EachOf, DeepPath) {
  Value v = parse(R"([{"a":{"b":[0,"p"]}},{"a":{"b":[0,"q"]}}])");
  EXPECT_EQ(v.each_of("a", "b", 1).string_array(),
            (std::vector<std::string>{"p", "q"}));
  EXPECT_EQ(v.each_of(Path{"a", "b", 1}), v.each_of("a", "b", 1));
}

TEST(EachOf, MissingMembersAreNull) {
  Value ids = parse(R"([{"id":1},{}])").each_of("id");
  ASSERT_TRUE(ids.is_array());
  EXPECT_TRUE(ids.get(1).is_null());
  try {
    ids.int_array();
    FAIL();
  } catch (const TypeMismatchError &e) {
    EXPECT_EQ(e.found(), Type::Null);
  }
}

TEST(EachOf, FirstFailureStops) {
  Value r = parse(R"([{"id":1}, 2, "three"])").each_of("id");
  ASSERT_FALSE(r.is_valid());
  EXPECT_EQ(r.error_message(),
            "type mismatch: expected OBJECT, found NUMBER 2");
}

TEST(EachOf, UnsupportedKeyFails) {
  Value r = parse(R"([{"id":1}])").each_of(true);
  EXPECT_EQ(r.error_message(), "key type bool not supported");
}

TEST(EachOf, EmptyPathCopiesElements) {
  Value v = parse("[1, \"a\"]");
  EXPECT_EQ(v.each_of(), v);
  EXPECT_EQ(parse("[]").each_of("x"), parse("[]"));
  EXPECT_EQ(parse("{}").each_of("x"), parse("[]"));
}

TEST(EachOf, ScalarReceiverUnsupported) {
  for (const char *json : {"1", "\"s\"", "true", "null"}) {
    Value r = parse(json).each_of("x");
    ASSERT_FALSE(r.is_valid()) << json;
    EXPECT_THROW(std::rethrow_exception(r.error()),
                 UnsupportedOperationError);
  }
  EXPECT_EQ(parse("1").each_of("x").error_message(),
            "type NUMBER does not support each_of()");
}
