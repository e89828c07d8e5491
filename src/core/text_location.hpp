#ifndef JSONCOMB_CORE_TEXT_LOCATION_HPP_
#define JSONCOMB_CORE_TEXT_LOCATION_HPP_

#include <cstddef>
#include <string>
#include <string_view>

namespace jsoncomb::core {

// 1-based line/column of a byte offset. Columns count UTF-8 code points, so a
// multi-byte character advances the column by one.
struct TextLocation {
  std::size_t line = 1;
  std::size_t column = 1;
};

// Offsets past the end clamp to the end of `text`. "\r\n" counts as one line
// break; a lone '\r' does not.
TextLocation LocateOffset(std::string_view text, std::size_t offset);

std::string FormatLocation(const TextLocation& location);

} // namespace jsoncomb::core

#endif // JSONCOMB_CORE_TEXT_LOCATION_HPP_
