#include "combinator/cursor.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <string_view>

using jsoncomb::combinator::AppendUtf8;
using jsoncomb::combinator::Cursor;
using jsoncomb::combinator::DecodeUtf8;
using jsoncomb::combinator::kInvalidCodePoint;

TEST_CASE("Cursor peeks without moving and advances into a new cursor", "[combinator][cursor]") {
  const Cursor start("ab");
  REQUIRE(start.Offset() == 0U);
  REQUIRE(start.Peek() == U'a');

  const auto next = start.Advance();
  REQUIRE(next.has_value());
  REQUIRE(next->Offset() == 1U);
  REQUIRE(next->Peek() == U'b');
  REQUIRE(next->RemainingText() == "b");

  // The original cursor is unchanged.
  REQUIRE(start.Offset() == 0U);
  REQUIRE(start.Peek() == U'a');
}

TEST_CASE("Cursor reports end of input", "[combinator][cursor]") {
  const Cursor start("ab");
  const auto end = start.Advance(2);
  REQUIRE(end.has_value());
  REQUIRE(end->AtEnd());
  REQUIRE_FALSE(end->Peek().has_value());
  REQUIRE_FALSE(start.Advance(3).has_value());

  const Cursor empty("");
  REQUIRE(empty.AtEnd());
  REQUIRE_FALSE(empty.Advance().has_value());
}

TEST_CASE("Cursor steps over whole UTF-8 code points", "[combinator][cursor]") {
  // U+00E9 (2 bytes), U+20AC (3 bytes), U+1F600 (4 bytes), then '!'.
  const Cursor start("\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80!");
  REQUIRE(start.Peek() == U'\u00E9');

  const auto second = start.Advance();
  REQUIRE(second->Offset() == 2U);
  REQUIRE(second->Peek() == U'\u20AC');

  const auto third = second->Advance();
  REQUIRE(third->Offset() == 5U);
  REQUIRE(third->Peek() == U'\U0001F600');

  const auto last = start.Advance(3);
  REQUIRE(last->Offset() == 9U);
  REQUIRE(last->Peek() == U'!');
}

TEST_CASE("Cursor treats malformed UTF-8 as one invalid code point per byte",
          "[combinator][cursor]") {
  const Cursor stray_continuation("\x80x");
  REQUIRE(stray_continuation.Peek() == kInvalidCodePoint);
  REQUIRE(stray_continuation.Advance()->Offset() == 1U);

  const Cursor truncated("\xE2\x82");
  REQUIRE(truncated.Peek() == kInvalidCodePoint);

  std::size_t length = 0;
  // Overlong encoding of '/'.
  REQUIRE(DecodeUtf8("\xC0\xAF", 0, length) == kInvalidCodePoint);
  REQUIRE(length == 1U);
  // Encoded surrogate U+D800.
  REQUIRE(DecodeUtf8("\xED\xA0\x80", 0, length) == kInvalidCodePoint);
  // Past U+10FFFF.
  REQUIRE(DecodeUtf8("\xF4\x90\x80\x80", 0, length) == kInvalidCodePoint);

  REQUIRE(DecodeUtf8("\xF4\x8F\xBF\xBF", 0, length) == U'\U0010FFFF');
  REQUIRE(length == 4U);
}

TEST_CASE("Cursor slices the text consumed between two positions", "[combinator][cursor]") {
  const Cursor start("hello world");
  const auto later = start.Advance(5);
  REQUIRE(start.SliceTo(*later) == "hello");
  REQUIRE(later->SliceTo(start).empty());
  REQUIRE(later->Text() == "hello world");
}

TEST_CASE("Cursor tracks nesting depth independently of the offset", "[combinator][cursor]") {
  const Cursor start("[]");
  REQUIRE(start.Depth() == 0U);

  const Cursor inner = start.Descend().Descend();
  REQUIRE(inner.Depth() == 2U);
  REQUIRE(inner.Offset() == 0U);
  REQUIRE(inner.Advance()->Depth() == 2U);
  REQUIRE(inner.Ascend().Depth() == 1U);
  REQUIRE(start.Ascend().Depth() == 0U);
}

TEST_CASE("AppendUtf8 encodes scalar values and replaces invalid ones", "[combinator][cursor]") {
  std::string out;
  AppendUtf8(U'A', out);
  AppendUtf8(U'\u00E9', out);
  AppendUtf8(U'\u20AC', out);
  AppendUtf8(U'\U0001F600', out);
  REQUIRE(out == "A\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80");

  std::string replaced;
  AppendUtf8(0xD800, replaced);
  AppendUtf8(kInvalidCodePoint, replaced);
  REQUIRE(replaced == "\xEF\xBF\xBD\xEF\xBF\xBD");
}
