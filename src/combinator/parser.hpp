#pragma once

#include "combinator/cursor.hpp"
#include "combinator/parse_result.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace jsoncomb::combinator {

// Value of parsers that only recognize input (whitespace, end of input).
using Unit = std::monostate;

// A reusable description of how to turn a Cursor into a T.
//
// Parsers are immutable once built and cheap to copy: every copy shares one
// type-erased run function. Combinators below take parsers by value and return
// new ones, so the same parser can appear in any number of grammars and run
// concurrently on different inputs.
template <typename T>
class Parser {
public:
  using ValueType = T;
  using Function = std::function<ParseResult<T>(const Cursor&)>;

  explicit Parser(Function run) : run_(std::make_shared<const Function>(std::move(run))) {}

  ParseResult<T> Run(const Cursor& input) const {
    return (*run_)(input);
  }

  ParseResult<T> Run(std::string_view text) const {
    return Run(Cursor(text));
  }

private:
  std::shared_ptr<const Function> run_;
};

namespace detail {

template <typename T, typename U>
ParseResult<U> Forward(ParseResult<T>& failed) {
  return ParseResult<U>::Failure(std::move(failed.Error()));
}

// Folds the hint left by the previous step of a sequence into the result of
// the next step when that step consumed nothing.
template <typename T>
void FoldHint(ParseResult<T>& next, const Cursor& middle, const std::vector<std::string>& hint) {
  if (hint.empty()) {
    return;
  }
  if (!next.Succeeded()) {
    if (next.Error().offset != middle.Offset()) {
      return;
    }
    std::vector<std::string> merged = hint;
    MergeExpected(merged, next.Error().expected);
    next.Error().expected = std::move(merged);
    return;
  }
  if (next.Remaining().Offset() == middle.Offset()) {
    std::vector<std::string> merged = hint;
    MergeExpected(merged, next.Hint());
    next.Hint() = std::move(merged);
  }
}

// Runs `first` then `second` and builds the result from both values.
template <typename A, typename B, typename Combine>
auto Sequence(Parser<A> first, Parser<B> second, Combine combine)
    -> Parser<std::invoke_result_t<const Combine&, A&&, B&&>> {
  using R = std::invoke_result_t<const Combine&, A&&, B&&>;
  return Parser<R>([first = std::move(first), second = std::move(second),
                    combine = std::move(combine)](const Cursor& input) -> ParseResult<R> {
    auto left = first.Run(input);
    if (!left.Succeeded()) {
      return Forward<A, R>(left);
    }
    const Cursor middle = left.Remaining();

    auto right = second.Run(middle);
    FoldHint(right, middle, left.Hint());
    if (!right.Succeeded()) {
      return Forward<B, R>(right);
    }

    const Cursor remaining = right.Remaining();
    std::vector<std::string> hint = std::move(right.Hint());
    return ParseResult<R>::Success(combine(left.TakeValue(), right.TakeValue()), remaining,
                                   std::move(hint));
  });
}

// Shared loop for Many/Many1. An iteration that succeeds without consuming
// input ends the loop (its value is dropped), so repetition always terminates.
template <typename T>
Parser<std::vector<T>> Repeat(Parser<T> parser, std::size_t min_count) {
  return Parser<std::vector<T>>(
      [parser = std::move(parser), min_count](const Cursor& input) -> ParseResult<std::vector<T>> {
        std::vector<T> values;
        Cursor current = input;
        std::vector<std::string> hint;

        while (true) {
          auto step = parser.Run(current);
          if (!step.Succeeded()) {
            if (ConsumedInput(step.Error(), current) || values.size() < min_count) {
              FoldHint(step, current, hint);
              return Forward<T, std::vector<T>>(step);
            }
            MergeExpected(hint, step.Error().expected);
            break;
          }
          if (step.Remaining().Offset() == current.Offset()) {
            MergeExpected(hint, step.Hint());
            break;
          }
          current = step.Remaining();
          hint = std::move(step.Hint());
          values.push_back(step.TakeValue());
        }

        return ParseResult<std::vector<T>>::Success(std::move(values), current, std::move(hint));
      });
}

} // namespace detail

// Always succeeds with `value` without consuming input.
template <typename T>
Parser<T> Pure(T value) {
  return Parser<T>([value = std::move(value)](const Cursor& input) {
    return ParseResult<T>::Success(value, input);
  });
}

// Always fails at the current position, expecting `description`.
template <typename T>
Parser<T> Fail(std::string description) {
  return Parser<T>([description = std::move(description)](const Cursor& input) {
    return ParseResult<T>::Failure(ParseFailure{input.Offset(), {description}});
  });
}

template <typename T, typename F>
auto Map(Parser<T> parser, F transform) -> Parser<std::invoke_result_t<const F&, T&&>> {
  using U = std::invoke_result_t<const F&, T&&>;
  return Parser<U>([parser = std::move(parser),
                    transform = std::move(transform)](const Cursor& input) -> ParseResult<U> {
    auto result = parser.Run(input);
    if (!result.Succeeded()) {
      return detail::Forward<T, U>(result);
    }
    const Cursor remaining = result.Remaining();
    std::vector<std::string> hint = std::move(result.Hint());
    return ParseResult<U>::Success(transform(result.TakeValue()), remaining, std::move(hint));
  });
}

// Feeds the value of `parser` into `next`, which picks the parser to run on
// the advanced cursor. This is the only combinator whose shape depends on
// previously parsed input.
template <typename T, typename F>
auto AndThen(Parser<T> parser, F next)
    -> Parser<typename std::invoke_result_t<const F&, T&&>::ValueType> {
  using NextParser = std::invoke_result_t<const F&, T&&>;
  using U = typename NextParser::ValueType;
  return Parser<U>(
      [parser = std::move(parser), next = std::move(next)](const Cursor& input) -> ParseResult<U> {
        auto first = parser.Run(input);
        if (!first.Succeeded()) {
          return detail::Forward<T, U>(first);
        }
        const Cursor middle = first.Remaining();
        const std::vector<std::string> hint = std::move(first.Hint());

        const NextParser follow = next(first.TakeValue());
        auto second = follow.Run(middle);
        detail::FoldHint(second, middle, hint);
        return second;
      });
}

template <typename A, typename B>
Parser<std::pair<A, B>> And(Parser<A> first, Parser<B> second) {
  return detail::Sequence(std::move(first), std::move(second),
                          [](A&& a, B&& b) { return std::pair<A, B>(std::move(a), std::move(b)); });
}

// Sequence keeping only the left value.
template <typename A, typename B>
Parser<A> Left(Parser<A> first, Parser<B> second) {
  return detail::Sequence(std::move(first), std::move(second),
                          [](A&& a, B&&) { return std::move(a); });
}

// Sequence keeping only the right value.
template <typename A, typename B>
Parser<B> Right(Parser<A> first, Parser<B> second) {
  return detail::Sequence(std::move(first), std::move(second),
                          [](A&&, B&& b) { return std::move(b); });
}

template <typename O, typename T, typename C>
Parser<T> Between(Parser<O> open, Parser<T> parser, Parser<C> close) {
  return Left(Right(std::move(open), std::move(parser)), std::move(close));
}

// Tries `first`; tries `second` on the same cursor only when `first` failed
// without consuming input. A failure after partial consumption is final, which
// keeps error positions precise and rules out exponential re-parsing.
template <typename T>
Parser<T> Or(Parser<T> first, Parser<T> second) {
  return Parser<T>([first = std::move(first),
                    second = std::move(second)](const Cursor& input) -> ParseResult<T> {
    auto left = first.Run(input);
    if (left.Succeeded() || ConsumedInput(left.Error(), input)) {
      return left;
    }

    auto right = second.Run(input);
    detail::FoldHint(right, input, left.Error().expected);
    return right;
  });
}

// N-way Or over a list of same-typed alternatives, tried in order.
template <typename T>
Parser<T> Choice(std::vector<Parser<T>> alternatives) {
  return Parser<T>(
      [alternatives = std::move(alternatives)](const Cursor& input) -> ParseResult<T> {
        std::vector<std::string> tried;
        for (const auto& alternative : alternatives) {
          auto result = alternative.Run(input);
          if (result.Succeeded() || ConsumedInput(result.Error(), input)) {
            detail::FoldHint(result, input, tried);
            return result;
          }
          MergeExpected(tried, result.Error().expected);
        }
        return ParseResult<T>::Failure(ParseFailure{input.Offset(), std::move(tried)});
      });
}

// Zero or more. Stops at the first failure that consumed nothing; a failure
// that consumed input fails the whole repetition.
template <typename T>
Parser<std::vector<T>> Many(Parser<T> parser) {
  return detail::Repeat(std::move(parser), 0);
}

template <typename T>
Parser<std::vector<T>> Many1(Parser<T> parser) {
  return detail::Repeat(std::move(parser), 1);
}

template <typename T>
Parser<std::optional<T>> Optional(Parser<T> parser) {
  return Parser<std::optional<T>>(
      [parser = std::move(parser)](const Cursor& input) -> ParseResult<std::optional<T>> {
        auto result = parser.Run(input);
        if (result.Succeeded()) {
          const Cursor remaining = result.Remaining();
          std::vector<std::string> hint = std::move(result.Hint());
          return ParseResult<std::optional<T>>::Success(std::optional<T>(result.TakeValue()),
                                                        remaining, std::move(hint));
        }
        if (ConsumedInput(result.Error(), input)) {
          return detail::Forward<T, std::optional<T>>(result);
        }
        return ParseResult<std::optional<T>>::Success(std::nullopt, input,
                                                      std::move(result.Error().expected));
      });
}

// One or more `item`s separated by `separator`. A separator must be followed
// by an item, so a trailing separator is a consumed failure.
template <typename T, typename S>
Parser<std::vector<T>> SepBy1(Parser<T> item, Parser<S> separator) {
  auto rest = Many(Right(std::move(separator), item));
  return Map(And(std::move(item), std::move(rest)), [](std::pair<T, std::vector<T>>&& parts) {
    std::vector<T> values;
    values.reserve(parts.second.size() + 1);
    values.push_back(std::move(parts.first));
    for (auto& value : parts.second) {
      values.push_back(std::move(value));
    }
    return values;
  });
}

template <typename T, typename S>
Parser<std::vector<T>> SepBy(Parser<T> item, Parser<S> separator) {
  return Map(Optional(SepBy1(std::move(item), std::move(separator))),
             [](std::optional<std::vector<T>>&& values) {
               return values.has_value() ? std::move(*values) : std::vector<T>{};
             });
}

// Zero or more `item`s separated by `separator`, then `close`. Equivalent to
// Left(SepBy(item, separator), close) but runs as one step, which keeps the
// stack shallow when items nest (bracketed lists inside bracketed lists).
template <typename T, typename S, typename C>
Parser<std::vector<T>> SepByUntil(Parser<T> item, Parser<S> separator, Parser<C> close) {
  return Parser<std::vector<T>>(
      [item = std::move(item), separator = std::move(separator),
       close = std::move(close)](const Cursor& input) -> ParseResult<std::vector<T>> {
        std::vector<T> values;
        Cursor current = input;
        std::vector<std::string> hint;

        auto first = item.Run(current);
        if (first.Succeeded()) {
          current = first.Remaining();
          hint = std::move(first.Hint());
          values.push_back(first.TakeValue());

          while (true) {
            auto sep = separator.Run(current);
            if (!sep.Succeeded()) {
              if (ConsumedInput(sep.Error(), current)) {
                detail::FoldHint(sep, current, hint);
                return detail::Forward<S, std::vector<T>>(sep);
              }
              MergeExpected(hint, sep.Error().expected);
              break;
            }
            const Cursor after_separator = sep.Remaining();
            std::vector<std::string> separator_hint = std::move(sep.Hint());
            if (after_separator.Offset() == current.Offset()) {
              MergeExpected(hint, separator_hint);
              separator_hint = std::move(hint);
            }

            // A separator must be followed by an item.
            auto next = item.Run(after_separator);
            detail::FoldHint(next, after_separator, separator_hint);
            if (!next.Succeeded()) {
              return detail::Forward<T, std::vector<T>>(next);
            }
            if (next.Remaining().Offset() == current.Offset()) {
              hint = std::move(next.Hint());
              break;
            }
            current = next.Remaining();
            hint = std::move(next.Hint());
            values.push_back(next.TakeValue());
          }
        } else if (ConsumedInput(first.Error(), current)) {
          return detail::Forward<T, std::vector<T>>(first);
        } else {
          hint = std::move(first.Error().expected);
        }

        auto end = close.Run(current);
        detail::FoldHint(end, current, hint);
        if (!end.Succeeded()) {
          return detail::Forward<C, std::vector<T>>(end);
        }
        const Cursor remaining = end.Remaining();
        std::vector<std::string> end_hint = std::move(end.Hint());
        return ParseResult<std::vector<T>>::Success(std::move(values), remaining,
                                                    std::move(end_hint));
      });
}

// Names what `parser` accepts. Applies only when `parser` consumed nothing, so
// deeper, more precise errors survive. An empty description hides the parser
// from error messages entirely.
template <typename T>
Parser<T> Expect(Parser<T> parser, std::string description) {
  return Parser<T>([parser = std::move(parser),
                    description = std::move(description)](const Cursor& input) -> ParseResult<T> {
    auto result = parser.Run(input);
    std::vector<std::string> replacement;
    if (!description.empty()) {
      replacement.push_back(description);
    }

    if (result.Succeeded()) {
      if (result.Remaining().Offset() == input.Offset() && !result.Hint().empty()) {
        result.Hint() = std::move(replacement);
      }
      return result;
    }
    if (!ConsumedInput(result.Error(), input)) {
      result.Error().expected = std::move(replacement);
    }
    return result;
  });
}

// Replaces the description of every failure of `parser` with `description`.
// The failure keeps its offset, so a failure after consumed input still
// points at the offending character. Success hints follow Expect.
template <typename T>
Parser<T> Label(Parser<T> parser, std::string description) {
  return Parser<T>([parser = std::move(parser),
                    description = std::move(description)](const Cursor& input) -> ParseResult<T> {
    auto result = parser.Run(input);
    std::vector<std::string> replacement;
    if (!description.empty()) {
      replacement.push_back(description);
    }

    if (result.Succeeded()) {
      if (result.Remaining().Offset() == input.Offset() && !result.Hint().empty()) {
        result.Hint() = std::move(replacement);
      }
      return result;
    }
    result.Error().expected = std::move(replacement);
    return result;
  });
}

// Reports any failure of `parser` at the starting position, so alternation
// can recover from it.
template <typename T>
Parser<T> Try(Parser<T> parser) {
  return Parser<T>([parser = std::move(parser)](const Cursor& input) {
    auto result = parser.Run(input);
    if (!result.Succeeded()) {
      result.Error().offset = input.Offset();
    }
    return result;
  });
}

// Succeeds with the text `parser` consumed. The view points into the input.
// The recognized text is treated as a single token: expectations left open
// inside it (another digit, an exponent) are not carried past it.
template <typename T>
Parser<std::string_view> Recognize(Parser<T> parser) {
  return Parser<std::string_view>(
      [parser = std::move(parser)](const Cursor& input) -> ParseResult<std::string_view> {
        auto result = parser.Run(input);
        if (!result.Succeeded()) {
          return detail::Forward<T, std::string_view>(result);
        }
        const Cursor remaining = result.Remaining();
        return ParseResult<std::string_view>::Success(input.SliceTo(remaining), remaining);
      });
}

// Runs `parser` one nesting level deeper. When `max_depth` is non-zero and the
// cursor is already that deep, fails without running it.
template <typename T>
Parser<T> Nested(Parser<T> parser, std::size_t max_depth) {
  return Parser<T>([parser = std::move(parser), max_depth](const Cursor& input) -> ParseResult<T> {
    if (max_depth != 0 && input.Depth() >= max_depth) {
      return ParseResult<T>::Failure(ParseFailure{
          input.Offset(), {"at most " + std::to_string(max_depth) + " nesting levels"}});
    }
    auto result = parser.Run(input.Descend());
    if (result.Succeeded()) {
      result.SetRemaining(result.Remaining().Ascend());
    }
    return result;
  });
}

// Forward reference for recursive grammars.
//
// Ref() can be embedded in other parsers before Define() supplies the real
// one. The reference does not own the cell, so a grammar that refers to itself
// does not form an ownership cycle; whoever holds the Recursive keeps the
// grammar alive. Running a Ref whose cell is gone or undefined fails.
template <typename T>
class Recursive {
public:
  Recursive() : cell_(std::make_shared<std::optional<Parser<T>>>()) {}

  Parser<T> Ref() const {
    std::weak_ptr<const std::optional<Parser<T>>> weak = cell_;
    return Parser<T>([weak](const Cursor& input) -> ParseResult<T> {
      const auto cell = weak.lock();
      if (cell == nullptr || !cell->has_value()) {
        return ParseResult<T>::Failure(ParseFailure{input.Offset(), {"defined parser"}});
      }
      return (*cell)->Run(input);
    });
  }

  void Define(Parser<T> parser) {
    *cell_ = std::move(parser);
  }

  bool Defined() const {
    return cell_->has_value();
  }

private:
  std::shared_ptr<std::optional<Parser<T>>> cell_;
};

} // namespace jsoncomb::combinator
