#pragma once

#include "combinator/parser.hpp"
#include "json/value.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace jsoncomb::json {

// Default bound on array/object nesting. Deeper documents fail with a syntax
// error instead of exhausting the stack.
inline constexpr std::size_t kDefaultMaxDepth = 1024;

// The JSON productions expressed as combinator parsers.
//
// Values refer to themselves through arrays and objects; the recursion goes
// through a Recursive cell owned by the grammar, so the parsers below stay
// valid only while the Grammar that built them is alive. A Grammar is
// immutable after construction and may be shared between threads.
class Grammar {
public:
  // `max_depth` == 0 disables the nesting bound.
  explicit Grammar(std::size_t max_depth = kDefaultMaxDepth);

  // Leading whitespace, one JSON value, trailing whitespace.
  const combinator::Parser<Value>& JsonValue() const {
    return value_;
  }

  const combinator::Parser<Value>& Null() const {
    return null_;
  }
  const combinator::Parser<Value>& Bool() const {
    return bool_;
  }
  const combinator::Parser<Value>& Number() const {
    return number_;
  }
  const combinator::Parser<Value>& String() const {
    return string_;
  }
  const combinator::Parser<Value>& Array() const {
    return array_;
  }
  const combinator::Parser<Value>& Object() const {
    return object_;
  }

  // Quoted string decoded to UTF-8; shared by string values and object keys.
  const combinator::Parser<std::string>& StringText() const {
    return string_text_;
  }

  std::size_t MaxDepth() const {
    return max_depth_;
  }

private:
  std::size_t max_depth_;
  combinator::Recursive<Value> element_cell_;
  combinator::Parser<Value> null_;
  combinator::Parser<Value> bool_;
  combinator::Parser<Value> number_;
  combinator::Parser<std::string> string_text_;
  combinator::Parser<Value> string_;
  combinator::Parser<Value> array_;
  combinator::Parser<Value> object_;
  // One value plus trailing whitespace; the unit arrays and objects repeat.
  combinator::Parser<Value> element_;
  combinator::Parser<Value> value_;
};

// Converts the text of a JSON number literal, independent of the C locale.
// Returns false when the magnitude does not fit a double; literals below the
// subnormal range become a signed zero.
bool ConvertNumberLiteral(std::string_view literal, double& number);

} // namespace jsoncomb::json
