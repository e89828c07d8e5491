#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace jsoncomb::combinator {

// Reported by Cursor::Peek for a byte that does not begin a well-formed UTF-8
// sequence. It lies outside the Unicode range so no predicate accepts it by
// accident.
inline constexpr char32_t kInvalidCodePoint = 0x110000;

// Immutable position over borrowed UTF-8 text.
//
// A cursor never changes after construction: Advance/Descend/Ascend return new
// cursors and leave the original usable, which is all backtracking needs. The
// offset is always on a code point boundary. The text must outlive every cursor
// derived from it.
class Cursor {
public:
  explicit Cursor(std::string_view text) : text_(text) {}

  // Next code point, or nullopt at end of input.
  std::optional<char32_t> Peek() const;

  // Cursor `count` code points further, or nullopt when fewer remain.
  std::optional<Cursor> Advance(std::size_t count = 1) const;

  std::string_view RemainingText() const {
    return text_.substr(offset_);
  }

  std::string_view Text() const {
    return text_;
  }

  std::size_t Offset() const {
    return offset_;
  }

  bool AtEnd() const {
    return offset_ >= text_.size();
  }

  // Text consumed between this cursor and `later` (empty if `later` is not
  // ahead of this cursor).
  std::string_view SliceTo(const Cursor& later) const;

  std::size_t Depth() const {
    return depth_;
  }

  Cursor Descend() const {
    return Cursor(text_, offset_, depth_ + 1);
  }

  Cursor Ascend() const {
    return Cursor(text_, offset_, depth_ == 0 ? 0 : depth_ - 1);
  }

private:
  Cursor(std::string_view text, std::size_t offset, std::size_t depth)
      : text_(text), offset_(offset), depth_(depth) {}

  std::string_view text_;
  std::size_t offset_ = 0;
  std::size_t depth_ = 0;
};

// Decodes the code point starting at `offset`. Returns its byte length through
// `length` (1 for malformed input, which decodes to kInvalidCodePoint).
char32_t DecodeUtf8(std::string_view text, std::size_t offset, std::size_t& length);

// Appends the UTF-8 encoding of `code_point` to `out`. Surrogates and values
// outside the Unicode range encode as U+FFFD.
void AppendUtf8(char32_t code_point, std::string& out);

} // namespace jsoncomb::combinator
