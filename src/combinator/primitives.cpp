#include "combinator/primitives.hpp"

#include <cstdio>
#include <utility>

namespace jsoncomb::combinator {

namespace {

bool IsAsciiDigit(char32_t c) {
  return c >= U'0' && c <= U'9';
}

bool IsAsciiHexDigit(char32_t c) {
  return IsAsciiDigit(c) || (c >= U'a' && c <= U'f') || (c >= U'A' && c <= U'F');
}

} // namespace

bool IsJsonWhitespace(char32_t c) {
  return c == U' ' || c == U'\t' || c == U'\n' || c == U'\r';
}

unsigned HexValue(char32_t c) {
  if (IsAsciiDigit(c)) {
    return static_cast<unsigned>(c - U'0');
  }
  if (c >= U'a' && c <= U'f') {
    return static_cast<unsigned>(c - U'a') + 10U;
  }
  if (c >= U'A' && c <= U'F') {
    return static_cast<unsigned>(c - U'A') + 10U;
  }
  return 0U;
}

std::string DescribeCodePoint(char32_t c) {
  if (c >= 0x20 && c < 0x7F) {
    return std::string("'") + static_cast<char>(c) + "'";
  }
  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), "U+%04X", static_cast<unsigned>(c));
  return buffer;
}

std::string QuoteLiteral(std::string_view literal) {
  return "'" + std::string(literal) + "'";
}

Parser<char32_t> CharMatching(std::function<bool(char32_t)> predicate, std::string description) {
  return Parser<char32_t>([predicate = std::move(predicate),
                           description = std::move(description)](const Cursor& input) {
    const auto next = input.Peek();
    if (next.has_value() && predicate(*next)) {
      const auto advanced = input.Advance(1);
      if (advanced.has_value()) {
        return ParseResult<char32_t>::Success(*next, *advanced);
      }
    }

    ParseFailure failure{input.Offset(), {}};
    if (!description.empty()) {
      failure.expected.push_back(description);
    }
    return ParseResult<char32_t>::Failure(std::move(failure));
  });
}

Parser<char32_t> CharEq(char32_t expected) {
  return CharMatching([expected](char32_t c) { return c == expected; },
                      DescribeCodePoint(expected));
}

Parser<std::string_view> Literal(std::string literal) {
  return Parser<std::string_view>([literal = std::move(literal)](const Cursor& input) {
    const std::string_view rest = input.RemainingText();
    if (rest.substr(0, literal.size()) == literal) {
      // Walk code points so the new cursor stays on a boundary.
      Cursor end = input;
      while (end.Offset() < input.Offset() + literal.size()) {
        end = *end.Advance(1);
      }
      return ParseResult<std::string_view>::Success(input.SliceTo(end), end);
    }
    return ParseResult<std::string_view>::Failure(
        ParseFailure{input.Offset(), {QuoteLiteral(literal)}});
  });
}

Parser<Unit> Whitespace() {
  return Map(Many(CharMatching(IsJsonWhitespace, "")),
             [](std::vector<char32_t>&&) { return Unit{}; });
}

Parser<char32_t> Digit() {
  return CharMatching(IsAsciiDigit, "digit");
}

Parser<char32_t> NonZeroDigit() {
  return CharMatching([](char32_t c) { return c >= U'1' && c <= U'9'; }, "digit 1-9");
}

Parser<char32_t> HexDigit() {
  return CharMatching(IsAsciiHexDigit, "hex digit");
}

Parser<Unit> EndOfInput() {
  return Parser<Unit>([](const Cursor& input) {
    if (input.AtEnd()) {
      return ParseResult<Unit>::Success(Unit{}, input);
    }
    return ParseResult<Unit>::Failure(ParseFailure{input.Offset(), {"end of input"}});
  });
}

} // namespace jsoncomb::combinator
