#include "json/parse.hpp"

#include "combinator/cursor.hpp"
#include "combinator/primitives.hpp"

#include <utility>

namespace jsoncomb::json {

std::string ParseError::Message() const {
  return expected + " at offset " + std::to_string(offset);
}

const char* ToString(ParseErrorKind kind) {
  switch (kind) {
  case ParseErrorKind::kSyntax:
    return "syntax error";
  case ParseErrorKind::kTrailingInput:
    return "trailing input";
  }
  return "syntax error";
}

bool Parse(std::string_view text, Value& root, ParseError& error, const ParseOptions& options) {
  const Grammar grammar(options.max_depth);
  const combinator::Cursor start(text);

  auto parsed = grammar.JsonValue().Run(start);
  if (!parsed.Succeeded()) {
    const auto& failure = parsed.Error();
    error = ParseError{ParseErrorKind::kSyntax, failure.offset, failure.Describe()};
    return false;
  }

  // The value parser already skipped trailing whitespace, so anything left is
  // content after the document.
  const auto end = combinator::EndOfInput().Run(parsed.Remaining());
  if (!end.Succeeded()) {
    const auto& failure = end.Error();
    error = ParseError{ParseErrorKind::kTrailingInput, failure.offset, failure.Describe()};
    return false;
  }

  root = parsed.TakeValue();
  return true;
}

} // namespace jsoncomb::json
