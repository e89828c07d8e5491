#include "combinator/cursor.hpp"

#include <string>

namespace jsoncomb::combinator {

namespace {

bool IsContinuation(unsigned char byte) {
  return (byte & 0xC0U) == 0x80U;
}

} // namespace

char32_t DecodeUtf8(std::string_view text, std::size_t offset, std::size_t& length) {
  length = 1;
  const auto lead = static_cast<unsigned char>(text[offset]);
  if (lead < 0x80U) {
    return lead;
  }

  std::size_t expected = 0;
  char32_t code_point = 0;
  char32_t minimum = 0;
  if ((lead & 0xE0U) == 0xC0U) {
    expected = 2;
    code_point = lead & 0x1FU;
    minimum = 0x80;
  } else if ((lead & 0xF0U) == 0xE0U) {
    expected = 3;
    code_point = lead & 0x0FU;
    minimum = 0x800;
  } else if ((lead & 0xF8U) == 0xF0U) {
    expected = 4;
    code_point = lead & 0x07U;
    minimum = 0x10000;
  } else {
    return kInvalidCodePoint;
  }

  if (offset + expected > text.size()) {
    return kInvalidCodePoint;
  }
  for (std::size_t i = 1; i < expected; ++i) {
    const auto byte = static_cast<unsigned char>(text[offset + i]);
    if (!IsContinuation(byte)) {
      return kInvalidCodePoint;
    }
    code_point = (code_point << 6U) | (byte & 0x3FU);
  }

  // Overlong forms, surrogates and values past U+10FFFF are malformed.
  if (code_point < minimum || code_point > 0x10FFFF ||
      (code_point >= 0xD800 && code_point <= 0xDFFF)) {
    return kInvalidCodePoint;
  }

  length = expected;
  return code_point;
}

void AppendUtf8(char32_t code_point, std::string& out) {
  if (code_point > 0x10FFFF || (code_point >= 0xD800 && code_point <= 0xDFFF)) {
    code_point = 0xFFFD;
  }

  if (code_point < 0x80) {
    out.push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    out.push_back(static_cast<char>(0xC0U | (code_point >> 6U)));
    out.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
  } else if (code_point < 0x10000) {
    out.push_back(static_cast<char>(0xE0U | (code_point >> 12U)));
    out.push_back(static_cast<char>(0x80U | ((code_point >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
  } else {
    out.push_back(static_cast<char>(0xF0U | (code_point >> 18U)));
    out.push_back(static_cast<char>(0x80U | ((code_point >> 12U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | ((code_point >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
  }
}

std::optional<char32_t> Cursor::Peek() const {
  if (AtEnd()) {
    return std::nullopt;
  }
  std::size_t length = 0;
  return DecodeUtf8(text_, offset_, length);
}

std::optional<Cursor> Cursor::Advance(std::size_t count) const {
  std::size_t offset = offset_;
  for (std::size_t i = 0; i < count; ++i) {
    if (offset >= text_.size()) {
      return std::nullopt;
    }
    std::size_t length = 0;
    (void)DecodeUtf8(text_, offset, length);
    offset += length;
  }
  return Cursor(text_, offset, depth_);
}

std::string_view Cursor::SliceTo(const Cursor& later) const {
  if (later.offset_ <= offset_) {
    return {};
  }
  return text_.substr(offset_, later.offset_ - offset_);
}

} // namespace jsoncomb::combinator
