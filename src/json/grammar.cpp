#include "json/grammar.hpp"

#include "combinator/primitives.hpp"

#include <charconv>
#include <locale>
#include <optional>
#include <sstream>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace jsoncomb::json {

namespace {

using combinator::And;
using combinator::AndThen;
using combinator::Between;
using combinator::CharEq;
using combinator::CharMatching;
using combinator::Choice;
using combinator::Digit;
using combinator::Expect;
using combinator::HexDigit;
using combinator::Label;
using combinator::Left;
using combinator::Literal;
using combinator::Many;
using combinator::Many1;
using combinator::Map;
using combinator::Nested;
using combinator::NonZeroDigit;
using combinator::Or;
using combinator::Parser;
using combinator::Pure;
using combinator::Recognize;
using combinator::Right;
using combinator::SepByUntil;
using combinator::Unit;
using combinator::Whitespace;

template <typename T>
Parser<Unit> Skip(Parser<T> parser) {
  return Map(std::move(parser), [](T&&) { return Unit{}; });
}

// Keywords commit once their first character matches, so "tru" reports the
// broken keyword instead of falling through to the other productions.
Parser<Unit> Keyword(const std::string& word) {
  const std::string quoted = combinator::QuoteLiteral(word);
  auto rest = Label(Literal(word.substr(1)), quoted);
  return Label(Skip(Right(CharEq(static_cast<unsigned char>(word.front())), std::move(rest))),
               quoted);
}

Parser<Value> BuildNull() {
  return Map(Keyword("null"), [](Unit&&) { return Value::Null(); });
}

Parser<Value> BuildBool() {
  return Or(Map(Keyword("true"), [](Unit&&) { return Value::Bool(true); }),
            Map(Keyword("false"), [](Unit&&) { return Value::Bool(false); }));
}

// -? (0 | [1-9][0-9]*) (. [0-9]+)? ([eE] [+-]? [0-9]+)?
Parser<Value> BuildNumber() {
  auto sign = combinator::Optional(CharEq('-'));
  auto integer =
      Expect(Or(Skip(CharEq('0')), Skip(And(NonZeroDigit(), Many(Digit())))), "digit");
  auto fraction = combinator::Optional(And(CharEq('.'), Many1(Digit())));
  auto exponent_mark =
      CharMatching([](char32_t c) { return c == U'e' || c == U'E'; }, "exponent");
  auto exponent_sign = combinator::Optional(
      CharMatching([](char32_t c) { return c == U'+' || c == U'-'; }, "sign"));
  auto exponent = combinator::Optional(
      And(And(std::move(exponent_mark), std::move(exponent_sign)), Many1(Digit())));

  auto literal = Recognize(And(And(And(std::move(sign), std::move(integer)), std::move(fraction)),
                               std::move(exponent)));

  return Expect(AndThen(std::move(literal),
                        [](std::string_view text) -> Parser<Value> {
                          double number = 0.0;
                          if (!ConvertNumberLiteral(text, number)) {
                            return combinator::Fail<Value>("number within double range");
                          }
                          return Pure(Value::Number(number));
                        }),
                "number");
}

// Four hex digits as one UTF-16 code unit.
Parser<char32_t> BuildHexQuad() {
  auto digits = Recognize(And(And(And(HexDigit(), HexDigit()), HexDigit()), HexDigit()));
  return Map(std::move(digits), [](std::string_view text) {
    char32_t unit = 0;
    for (const char c : text) {
      unit = (unit << 4U) | combinator::HexValue(static_cast<unsigned char>(c));
    }
    return unit;
  });
}

// After the 'u' of a \u escape. A high surrogate must be followed by an
// escaped low surrogate; the pair decodes to one supplementary code point.
Parser<char32_t> BuildUnicodeEscape() {
  auto quad = BuildHexQuad();
  auto low_escape = Expect(Right(Literal("\\u"), quad), "low surrogate escape");

  return AndThen(Right(CharEq('u'), std::move(quad)),
                 [low_escape = std::move(low_escape)](char32_t unit) -> Parser<char32_t> {
                   if (unit >= 0xD800 && unit <= 0xDBFF) {
                     return AndThen(low_escape, [unit](char32_t low) -> Parser<char32_t> {
                       if (low < 0xDC00 || low > 0xDFFF) {
                         return combinator::Fail<char32_t>("low surrogate escape");
                       }
                       return Pure<char32_t>(0x10000 + ((unit - 0xD800) << 10U) +
                                             (low - 0xDC00));
                     });
                   }
                   if (unit >= 0xDC00 && unit <= 0xDFFF) {
                     return combinator::Fail<char32_t>("high surrogate before low surrogate");
                   }
                   return Pure<char32_t>(unit);
                 });
}

Parser<char32_t> BuildEscape() {
  auto simple = Map(CharMatching(
                        [](char32_t c) {
                          return c == U'"' || c == U'\\' || c == U'/' || c == U'b' ||
                                 c == U'f' || c == U'n' || c == U'r' || c == U't';
                        },
                        "escape character"),
                    [](char32_t c) -> char32_t {
                      switch (c) {
                      case U'b':
                        return U'\b';
                      case U'f':
                        return U'\f';
                      case U'n':
                        return U'\n';
                      case U'r':
                        return U'\r';
                      case U't':
                        return U'\t';
                      default:
                        return c;
                      }
                    });

  return Right(CharEq('\\'),
               Expect(Or(std::move(simple), BuildUnicodeEscape()), "escape sequence"));
}

Parser<std::string> BuildStringText() {
  auto plain = CharMatching(
      [](char32_t c) {
        return c >= 0x20 && c != U'"' && c != U'\\' && c != combinator::kInvalidCodePoint;
      },
      "string character");
  auto character = Expect(Or(std::move(plain), BuildEscape()), "string character");

  auto body = Map(Many(std::move(character)), [](std::vector<char32_t>&& code_points) {
    std::string text;
    text.reserve(code_points.size());
    for (const char32_t c : code_points) {
      combinator::AppendUtf8(c, text);
    }
    return text;
  });

  return Expect(Between(CharEq('"'), std::move(body), CharEq('"')), "string");
}

// ',' and the whitespace after it. Whitespace before it is skipped by the
// preceding element.
Parser<char32_t> Separator() {
  return Left(CharEq(','), Whitespace());
}

Parser<char32_t> Opener(char32_t bracket) {
  return Left(CharEq(bracket), Whitespace());
}

// `element` parses one value and the whitespace after it.
Parser<Value> BuildArray(const Parser<Value>& element, std::size_t max_depth) {
  auto body = Nested(SepByUntil(element, Separator(), CharEq(']')), max_depth);
  return Expect(Map(Right(Opener('['), std::move(body)),
                    [](std::vector<Value>&& elements) {
                      return Value::MakeArray(std::move(elements));
                    }),
                "array");
}

Parser<Value> BuildObject(const Parser<std::string>& key, const Parser<Value>& element,
                          std::size_t max_depth) {
  auto colon = Right(Whitespace(), Left(CharEq(':'), Whitespace()));
  auto member = And(Left(key, std::move(colon)), element);

  auto body = Nested(SepByUntil(std::move(member), Separator(), CharEq('}')), max_depth);
  return Expect(Map(Right(Opener('{'), std::move(body)),
                    [](std::vector<std::pair<std::string, Value>>&& members) {
                      return Value::MakeObject(std::move(members));
                    }),
                "object");
}

} // namespace

bool ConvertNumberLiteral(std::string_view literal, double& number) {
  const char* begin = literal.data();
  const char* end = begin + literal.size();
  double parsed = 0.0;
  const auto [stop, ec] = std::from_chars(begin, end, parsed);
  if (stop != end) {
    return false;
  }
  if (ec == std::errc()) {
    number = parsed;
    return true;
  }
  if (ec != std::errc::result_out_of_range) {
    return false;
  }

  // from_chars reports subnormal and underflowing literals as out of range
  // too. Redo those in the classic locale: overflow sets failbit, anything
  // smaller yields the nearest subnormal or a signed zero.
  std::istringstream in{std::string(literal)};
  in.imbue(std::locale::classic());
  in >> parsed;
  if (in.fail()) {
    return false;
  }
  number = parsed;
  return true;
}

Grammar::Grammar(std::size_t max_depth)
    : max_depth_(max_depth),
      null_(BuildNull()),
      bool_(BuildBool()),
      number_(BuildNumber()),
      string_text_(BuildStringText()),
      string_(Map(string_text_, [](std::string&& text) { return Value::String(std::move(text)); })),
      array_(BuildArray(element_cell_.Ref(), max_depth)),
      object_(BuildObject(string_text_, element_cell_.Ref(), max_depth)),
      element_(Left(Expect(Choice<Value>({object_, array_, string_, number_, bool_, null_}),
                           "JSON value"),
                    Whitespace())),
      value_(Right(Whitespace(), element_)) {
  element_cell_.Define(element_);
}

} // namespace jsoncomb::json
