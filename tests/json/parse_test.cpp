#include "json/parse.hpp"
#include "json/render.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <thread>
#include <vector>

using jsoncomb::json::Parse;
using jsoncomb::json::ParseError;
using jsoncomb::json::ParseErrorKind;
using jsoncomb::json::ParseOptions;
using jsoncomb::json::ToJson;
using jsoncomb::json::Value;

namespace {

Value ParseOrFail(const std::string& text) {
  Value root;
  ParseError error;
  INFO(text);
  REQUIRE(Parse(text, root, error));
  return root;
}

ParseError ExpectFailure(const std::string& text, const ParseOptions& options = {}) {
  Value root;
  ParseError error;
  INFO(text);
  REQUIRE_FALSE(Parse(text, root, error, options));
  return error;
}

std::string NestedArrays(std::size_t depth) {
  return std::string(depth, '[') + std::string(depth, ']');
}

} // namespace

TEST_CASE("Parse accepts the literal values", "[json][parse]") {
  REQUIRE(ParseOrFail("null").IsNull());
  REQUIRE(ParseOrFail("true") == Value::Bool(true));
  REQUIRE(ParseOrFail("false") == Value::Bool(false));
}

TEST_CASE("Parse converts numbers to doubles", "[json][parse]") {
  REQUIRE(ParseOrFail("-0.5e2").AsNumber() == -50.0);
  REQUIRE(ParseOrFail("0").AsNumber() == 0.0);
  REQUIRE(ParseOrFail("-0").AsNumber() == 0.0);
  REQUIRE(ParseOrFail("123456789").AsNumber() == 123456789.0);
  REQUIRE(ParseOrFail("1.5E-3").AsNumber() == 0.0015);
}

TEST_CASE("Parse rejects a partial keyword at its first wrong character", "[json][parse]") {
  const ParseError error = ExpectFailure("tru");
  REQUIRE(error.kind == ParseErrorKind::kSyntax);
  REQUIRE(error.offset == 1U);
  REQUIRE(error.expected == "expected 'true'");
  REQUIRE(error.Message() == "expected 'true' at offset 1");
}

TEST_CASE("Parse rejects trailing commas and accepts proper lists", "[json][parse]") {
  const ParseError error = ExpectFailure("[1,2,]");
  REQUIRE(error.kind == ParseErrorKind::kSyntax);
  REQUIRE(error.offset == 5U);

  const Value list = ParseOrFail("[1,2]");
  REQUIRE(list.Size() == 2U);
  REQUIRE(list.AsArray()[0].AsNumber() == 1.0);
  REQUIRE(list.AsArray()[1].AsNumber() == 2.0);
}

TEST_CASE("Parse keeps the later of duplicate object keys", "[json][parse]") {
  const Value object = ParseOrFail(R"({"a":1,"a":2})");
  REQUIRE(object.Size() == 1U);
  REQUIRE(object.Find("a")->AsNumber() == 2.0);
}

TEST_CASE("Parse ignores insignificant whitespace", "[json][parse]") {
  const Value compact = ParseOrFail(R"({"a":[1,{"b":null}],"c":"x y"})");
  const Value spaced =
      ParseOrFail(" \r\n\t{ \"a\" :\n[ 1 ,\t{ \"b\" : null } ] ,\r\n \"c\" : \"x y\" }\n ");
  REQUIRE(compact == spaced);
}

TEST_CASE("Parse reports content after the document as trailing input", "[json][parse]") {
  const ParseError error = ExpectFailure("123abc");
  REQUIRE(error.kind == ParseErrorKind::kTrailingInput);
  REQUIRE(error.offset == 3U);
  REQUIRE(error.expected == "expected end of input");

  const ParseError two_values = ExpectFailure("{} {}");
  REQUIRE(two_values.kind == ParseErrorKind::kTrailingInput);
  REQUIRE(two_values.offset == 3U);
}

TEST_CASE("Parse rejects leading zeros", "[json][parse]") {
  const ParseError error = ExpectFailure("01");
  REQUIRE(error.kind == ParseErrorKind::kTrailingInput);
  REQUIRE(error.offset == 1U);

  const ParseError in_array = ExpectFailure("[007]");
  REQUIRE(in_array.kind == ParseErrorKind::kSyntax);
  REQUIRE(in_array.offset == 2U);
  REQUIRE(in_array.expected == "expected ',' or ']'");
}

TEST_CASE("Parse reports strings cut short or badly escaped", "[json][parse]") {
  const ParseError unterminated = ExpectFailure("\"ab");
  REQUIRE(unterminated.kind == ParseErrorKind::kSyntax);
  REQUIRE(unterminated.offset == 3U);

  const ParseError bad_escape = ExpectFailure(R"("\x")");
  REQUIRE(bad_escape.offset == 2U);
  REQUIRE(bad_escape.expected == "expected escape sequence");
}

TEST_CASE("Parse decodes surrogate pairs into one code point", "[json][parse]") {
  const Value emoji = ParseOrFail(R"(["\ud83d\ude00", "\u00e9"])");
  REQUIRE(emoji.AsArray()[0].AsString() == "\xF0\x9F\x98\x80");
  REQUIRE(emoji.AsArray()[1].AsString() == "\xC3\xA9");

  const ParseError lone_low = ExpectFailure(R"("\udc00")");
  REQUIRE(lone_low.kind == ParseErrorKind::kSyntax);
}

TEST_CASE("Parse names the open alternatives after a list item", "[json][parse]") {
  const ParseError error = ExpectFailure("[1}");
  REQUIRE(error.offset == 2U);
  REQUIRE(error.expected == "expected ',' or ']'");

  const ParseError object_error = ExpectFailure(R"({"a":1])");
  REQUIRE(object_error.offset == 6U);
  REQUIRE(object_error.expected == "expected ',' or '}'");
}

TEST_CASE("Parse rejects empty documents", "[json][parse]") {
  const ParseError empty = ExpectFailure("");
  REQUIRE(empty.kind == ParseErrorKind::kSyntax);
  REQUIRE(empty.offset == 0U);
  REQUIRE(empty.expected == "expected JSON value");

  const ParseError blank = ExpectFailure(" \n ");
  REQUIRE(blank.offset == 3U);
}

TEST_CASE("Parse leaves the root untouched on failure", "[json][parse]") {
  Value root = Value::String("previous");
  ParseError error;
  REQUIRE_FALSE(Parse("[1,", root, error));
  REQUIRE(root == Value::String("previous"));
  REQUIRE(error.offset == 3U);
}

TEST_CASE("Parse handles 1000 levels of nesting and renders them back", "[json][parse]") {
  const std::string text = "[" + NestedArrays(1000) + "]";
  const Value root = ParseOrFail(text);

  const Value* level = &root;
  for (int i = 0; i < 1000; ++i) {
    REQUIRE(level->IsArray());
    REQUIRE(level->Size() == 1U);
    level = &level->AsArray().front();
  }
  REQUIRE(level->IsArray());
  REQUIRE(level->Size() == 0U);

  REQUIRE(ToJson(root) == text);
  REQUIRE(ParseOrFail(ToJson(root)) == root);
}

TEST_CASE("Parse enforces the configured nesting bound", "[json][parse]") {
  const ParseOptions options{.max_depth = 8};

  Value root;
  ParseError error;
  REQUIRE(Parse(NestedArrays(8), root, error, options));

  const ParseError too_deep = ExpectFailure(NestedArrays(9), options);
  REQUIRE(too_deep.kind == ParseErrorKind::kSyntax);
  REQUIRE(too_deep.offset == 9U);
  REQUIRE(too_deep.expected == "expected at most 8 nesting levels");

  const ParseError over_default = ExpectFailure(NestedArrays(1025));
  REQUIRE(over_default.offset == 1025U);
  REQUIRE(over_default.expected == "expected at most 1024 nesting levels");

  REQUIRE(Parse(NestedArrays(1100), root, error, ParseOptions{.max_depth = 0}));
}

TEST_CASE("Rendered documents parse back to equal values", "[json][parse][render]") {
  const std::vector<Value> documents = {
      Value::Null(),
      Value::Number(0.1),
      Value::Number(-2.5e-8),
      Value::Number(1e300),
      Value::Number(5e-324),
      Value::Number(123456789012345.0),
      Value::String("quote \" backslash \\ newline \n tab \t bell \x07"),
      Value::String("\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80"),
      Value::MakeArray({}),
      Value::MakeObject({}),
      Value::MakeObject({{"z", Value::Number(1)},
                         {"a", Value::MakeArray({Value::Bool(true), Value::Null(),
                                                 Value::MakeObject({{"", Value::String("")}})})}}),
  };

  for (const auto& document : documents) {
    const std::string text = ToJson(document);
    INFO(text);
    REQUIRE(ParseOrFail(text) == document);
  }
}

TEST_CASE("Parse is safe to call from several threads at once", "[json][parse]") {
  const std::string text = R"({"items":[1,2,3],"name":"shared","nested":{"ok":true}})";
  const Value expected = ParseOrFail(text);

  std::vector<int> matches(4, 0);
  std::vector<std::thread> workers;
  for (std::size_t i = 0; i < matches.size(); ++i) {
    workers.emplace_back([&text, &expected, &matches, i] {
      for (int round = 0; round < 50; ++round) {
        Value root;
        ParseError error;
        if (Parse(text, root, error) && root == expected) {
          ++matches[i];
        }
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  for (const int count : matches) {
    REQUIRE(count == 50);
  }
}
