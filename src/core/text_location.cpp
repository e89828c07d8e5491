#include "core/text_location.hpp"

#include <algorithm>

namespace jsoncomb::core {

namespace {

bool IsContinuationByte(char c) {
  return (static_cast<unsigned char>(c) & 0xC0U) == 0x80U;
}

} // namespace

TextLocation LocateOffset(std::string_view text, std::size_t offset) {
  TextLocation location;
  const std::size_t end = std::min(offset, text.size());
  for (std::size_t i = 0; i < end; ++i) {
    const char c = text[i];
    if (c == '\n') {
      ++location.line;
      location.column = 1;
      continue;
    }
    if (IsContinuationByte(c)) {
      continue;
    }
    ++location.column;
  }
  return location;
}

std::string FormatLocation(const TextLocation& location) {
  return std::to_string(location.line) + ":" + std::to_string(location.column);
}

} // namespace jsoncomb::core
