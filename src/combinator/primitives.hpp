#pragma once

#include "combinator/parser.hpp"

#include <functional>
#include <string>
#include <string_view>

namespace jsoncomb::combinator {

// Leaf parsers. Every one of them either consumes at least one character on
// success or always succeeds (Whitespace, EndOfInput), and none of them
// consumes input when it fails, so they are safe under Or and Many.

// One code point satisfying `predicate`. `description` is the expectation
// reported on failure; an empty one keeps the matcher out of error messages.
Parser<char32_t> CharMatching(std::function<bool(char32_t)> predicate, std::string description);

// Exactly the code point `expected`.
Parser<char32_t> CharEq(char32_t expected);

// Exactly `literal`, all or nothing. The value is a view into the input.
Parser<std::string_view> Literal(std::string literal);

// Zero or more JSON whitespace characters (space, tab, line feed, carriage
// return). Never appears in error messages.
Parser<Unit> Whitespace();

Parser<char32_t> Digit();
Parser<char32_t> NonZeroDigit();
Parser<char32_t> HexDigit();

Parser<Unit> EndOfInput();

bool IsJsonWhitespace(char32_t c);

// Numeric value of an ASCII hex digit (0 for anything else).
unsigned HexValue(char32_t c);

// How a code point or literal is named in expectations: 'x' for printable
// ASCII, U+XXXX otherwise.
std::string DescribeCodePoint(char32_t c);
std::string QuoteLiteral(std::string_view literal);

} // namespace jsoncomb::combinator
