#include <cstdint>
#include <gtest/gtest.h>
#include <jsonport/jsonport.hpp>
#include <limits>
#include <sstream>
#include <string>
#include <tuple>

using namespace jsonport;

// parse(json, path) must equal parse(json).get(path): same value, or the
// same error at the same position.

static size_t error_offset(const Value &v) {
  if (v.is_valid())
    return 0;
  try {
    std::rethrow_exception(v.error());
  } catch (const ParseError &e) {
    return e.offset;
  } catch (const Error &) {
    return 0;
  }
}

static void expect_identical(const std::string &json, const Path &path,
                             const ParseOptions &opts = {}) {
  const Value guided = try_parse(json, path, opts);
  const Value full = try_parse(json, opts);
  const Value navigated = full.get(path);
  EXPECT_EQ(guided, navigated) << json;
  EXPECT_EQ(error_offset(guided), error_offset(navigated)) << json;
}

class PathDecodeIdentity
    : public ::testing::TestWithParam<std::tuple<std::string, Path>> {};

TEST_P(PathDecodeIdentity, MatchesParseThenGet) {
  const auto &[json, path] = GetParam();
  expect_identical(json, path);
}

TEST_P(PathDecodeIdentity, MatchesUnderStrictDuplicates) {
  const auto &[json, path] = GetParam();
  ParseOptions strict;
  strict.allow_duplicate_keys = false;
  expect_identical(json, path, strict);
}

const std::string kDoc = R"({"a":1,"b":[2,3],"c":{"d":[{"e":"x"}]},"n":null})";

INSTANTIATE_TEST_SUITE_P(
    Navigation, PathDecodeIdentity,
    ::testing::Values(
        std::make_tuple(kDoc, Path{}), std::make_tuple(kDoc, Path{"a"}),
        std::make_tuple(kDoc, Path{"b", 1}),
        std::make_tuple(kDoc, Path{"c", "d", 0, "e"}),
        std::make_tuple(kDoc, Path{"missing"}),
        std::make_tuple(kDoc, Path{"missing", "deeper", 3}),
        std::make_tuple(kDoc, Path{"b", 7}),
        std::make_tuple(kDoc, Path{"b", -1}),
        std::make_tuple(kDoc, Path{"b", "x"}),
        std::make_tuple(kDoc, Path{"a", "x"}),
        std::make_tuple(kDoc, Path{0}),
        std::make_tuple(kDoc, Path{"n", "x"}),
        std::make_tuple(kDoc, Path{"c", "d", 0, "e", 0}),
        std::make_tuple(kDoc, Path{1.5}),
        std::make_tuple(kDoc, Path{"missing", true}),
        std::make_tuple(kDoc, Path{"a", nullptr}),
        std::make_tuple(std::string("[[1,2],[3,[4,5]]]"), Path{1, 1, 0}),
        std::make_tuple(std::string("[]"), Path{0}),
        std::make_tuple(std::string("{}"), Path{"a"}),
        std::make_tuple(std::string("[ ]"), Path{0, "x"}),
        std::make_tuple(std::string("\"str\""), Path{"a"})));

INSTANTIATE_TEST_SUITE_P(
    Duplicates, PathDecodeIdentity,
    ::testing::Values(
        std::make_tuple(std::string(R"({"a":{"x":1},"a":{"y":2}})"),
                        Path{"a", "x"}),
        std::make_tuple(std::string(R"({"a":{"x":1},"a":{"y":2}})"),
                        Path{"a", "y"}),
        std::make_tuple(std::string(R"({"a":1,"b":2,"a":3})"), Path{"a"})));

INSTANTIATE_TEST_SUITE_P(
    Errors, PathDecodeIdentity,
    ::testing::Values(
        // failure after the target has been decoded
        std::make_tuple(std::string(R"({"a":1,"b":tru})"), Path{"a"}),
        // failure inside a skipped sibling
        std::make_tuple(std::string(R"({"z":[1 2],"a":1})"), Path{"a"}),
        std::make_tuple(std::string(R"({"a":1} x)"), Path{"a"}),
        std::make_tuple(std::string(R"([1,2,3)"), Path{0}),
        std::make_tuple(std::string(R"({"a":"\q"})"), Path{"b"}),
        std::make_tuple(std::string(""), Path{"a"}),
        std::make_tuple(std::string("{\"a\":1,}"), Path{"a"}),
        // failure inside an aggregate whose kind does not match the key
        std::make_tuple(std::string(R"({"big":[1,2,}})"), Path{"big", "x"}),
        std::make_tuple(std::string(R"({"big":{"k":tru}})"), Path{"big", 0}),
        std::make_tuple(std::string(R"({"big":[1],"a":{"k":1,"k":2}})"),
                        Path{"big", "x"}),
        std::make_tuple(std::string(R"([{"x":[1,]}])"), Path{0, 1.5})));

TEST(PathDecode, ScenarioValues) {
  const std::string json = R"({"a":1,"b":[2,3]})";
  EXPECT_EQ(parse(json, Path{"b", 1}).as_int(), 3);
  EXPECT_TRUE(parse(json, Path{"nope"}).is_null());
  EXPECT_EQ(parse(json, Path{"b"}), parse("[2,3]"));
}

TEST(PathDecode, KindMismatchIsTypeError) {
  Value v = parse(R"({"b":[2,3]})", Path{"b", "x"});
  ASSERT_FALSE(v.is_valid());
  EXPECT_THROW(std::rethrow_exception(v.error()), TypeMismatchError);
  EXPECT_EQ(v.error_message(),
            "type mismatch: expected OBJECT, found ARRAY [...]");
}

TEST(PathDecode, KindMismatchOnLargeAggregate) {
  std::string json = R"({"big":[)";
  for (int i = 0; i < 300000; ++i) {
    if (i)
      json += ",";
    json += R"({"id":)" + std::to_string(i) + "}";
  }
  json += R"(],"other":1})";

  Value v = parse(json, Path{"big", "x"});
  EXPECT_EQ(v.error_message(),
            "type mismatch: expected OBJECT, found ARRAY [...]");
  EXPECT_EQ(try_parse(json, Path{"big", true}).error_message(),
            "key type bool not supported");
  expect_identical(json, Path{"big", "x"});

  // The skipped aggregate is still validated to its end.
  std::string broken = json;
  broken.replace(broken.rfind("}]"), 2, "]]");
  expect_identical(broken, Path{"big", "x"});
  EXPECT_THROW(parse(broken, Path{"big", "x"}), SyntaxError);
}

TEST(PathDecode, UnsupportedKeyIsKeyTypeError) {
  Value v = parse(R"({"a":1})", Path{1.5});
  EXPECT_EQ(v.error_message(), "key type double not supported");
  EXPECT_THROW(v.as_int(), KeyTypeError);
}

TEST(PathDecode, TrailingDataCheckedAfterEarlyMatch) {
  EXPECT_THROW(parse(R"({"a":1,"b":2} 3)", Path{"a"}), TrailingDataError);
  EXPECT_THROW(parse(R"([1,2,3] ])", Path{0}), TrailingDataError);
}

TEST(PathDecode, StrictDuplicatesFailOnGuidedPath) {
  ParseOptions strict;
  strict.allow_duplicate_keys = false;
  EXPECT_THROW(parse(R"({"a":1,"a":2})", Path{"a"}, strict), SyntaxError);
  EXPECT_THROW(parse(R"({"x":{"q":1,"q":2},"a":1})", Path{"a"}, strict),
               SyntaxError);
}

TEST(PathDecode, HugeIndexIsOutOfRange) {
  const uint64_t huge = std::numeric_limits<uint64_t>::max();
  EXPECT_TRUE(parse("[1,2]", Path{huge}).is_null());
  expect_identical("[1,2]", Path{huge});
}

TEST(PathDecode, EscapedKeysMatchDecodedName) {
  const std::string json = R"({"caf\u00e9":1,"a\"b":2})";
  EXPECT_EQ(parse(json, Path{"caf\xC3\xA9"}).as_int(), 1);
  EXPECT_EQ(parse(json, Path{"a\"b"}).as_int(), 2);
}

TEST(PathDecode, DepthLimitAppliesAlongPath) {
  ParseOptions shallow;
  shallow.max_depth = 2;
  EXPECT_EQ(parse("[[1]]", Path{0, 0}, shallow).as_int(), 1);
  EXPECT_THROW(parse("[[[1]]]", Path{0}, shallow), DepthExceededError);
  expect_identical("[0,[[1]]]", Path{0}, shallow);
}

TEST(PathDecode, StreamOverload) {
  std::istringstream in(R"({"k":{"v":[10,20]}})");
  EXPECT_EQ(decode_from(in, Path{"k", "v", 1}).as_int(), 20);
}
