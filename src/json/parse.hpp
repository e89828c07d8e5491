#pragma once

#include "json/grammar.hpp"
#include "json/value.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace jsoncomb::json {

struct ParseOptions {
  // Maximum array/object nesting; 0 disables the bound.
  std::size_t max_depth = kDefaultMaxDepth;
};

enum class ParseErrorKind {
  // The text is not a JSON value at `offset`.
  kSyntax,
  // A complete value was parsed but non-whitespace input follows it.
  kTrailingInput,
};

struct ParseError {
  ParseErrorKind kind = ParseErrorKind::kSyntax;
  // Byte offset into the original text.
  std::size_t offset = 0;
  // What the parser would have accepted, e.g. "expected ',' or ']'".
  std::string expected;

  // "<expected> at offset <n>".
  std::string Message() const;
};

const char* ToString(ParseErrorKind kind);

// Parses one complete JSON document.
//
// Contract:
// - Returns true and replaces `root` when the whole of `text` (ignoring
//   surrounding whitespace) is a single JSON value.
// - Returns false and populates `error` otherwise; `root` is left untouched.
// - Never throws on malformed input and keeps no state between calls.
bool Parse(std::string_view text, Value& root, ParseError& error,
           const ParseOptions& options = {});

} // namespace jsoncomb::json
