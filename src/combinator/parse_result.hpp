#pragma once

#include "combinator/cursor.hpp"

#include <cstddef>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace jsoncomb::combinator {

// Where a parser gave up and what it would have accepted there.
struct ParseFailure {
  std::size_t offset = 0;
  std::vector<std::string> expected;

  // "expected ',' or ']'", "expected digit", or "unexpected input" when no
  // expectation survived labelling.
  std::string Describe() const;
};

// Appends the entries of `from` that `into` does not already contain.
void MergeExpected(std::vector<std::string>& into, const std::vector<std::string>& from);

// True when a parser that started at `start` failed after consuming input.
// Alternation and repetition only recover from failures that consumed nothing.
inline bool ConsumedInput(const ParseFailure& failure, const Cursor& start) {
  return failure.offset > start.Offset();
}

// Outcome of running a Parser<T>.
//
// A success carries the value, the cursor after the consumed input, and a
// hint: expectations that were tried and rejected at that cursor without
// consuming anything (for example the ',' a repetition stopped on). Sequencing
// folds the hint into a following failure at the same offset so error messages
// list every alternative that was still open.
template <typename T>
class ParseResult {
public:
  static ParseResult Success(T value, Cursor remaining, std::vector<std::string> hint = {}) {
    return ParseResult(Ok{std::move(value), remaining, std::move(hint)});
  }

  static ParseResult Failure(ParseFailure failure) {
    return ParseResult(std::move(failure));
  }

  bool Succeeded() const {
    return std::holds_alternative<Ok>(state_);
  }

  const T& Value() const {
    return std::get<Ok>(state_).value;
  }

  T TakeValue() {
    return std::move(std::get<Ok>(state_).value);
  }

  const Cursor& Remaining() const {
    return std::get<Ok>(state_).remaining;
  }

  void SetRemaining(const Cursor& remaining) {
    std::get<Ok>(state_).remaining = remaining;
  }

  const std::vector<std::string>& Hint() const {
    return std::get<Ok>(state_).hint;
  }

  std::vector<std::string>& Hint() {
    return std::get<Ok>(state_).hint;
  }

  const ParseFailure& Error() const {
    return std::get<ParseFailure>(state_);
  }

  ParseFailure& Error() {
    return std::get<ParseFailure>(state_);
  }

private:
  struct Ok {
    T value;
    Cursor remaining;
    std::vector<std::string> hint;
  };

  explicit ParseResult(Ok ok) : state_(std::move(ok)) {}
  explicit ParseResult(ParseFailure failure) : state_(std::move(failure)) {}

  std::variant<Ok, ParseFailure> state_;
};

} // namespace jsoncomb::combinator
