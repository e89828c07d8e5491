#pragma once

#include "json/value.hpp"

#include <ostream>
#include <string>
#include <string_view>

namespace jsoncomb::json {

// Compact JSON text for `value`: no insignificant whitespace, members in
// stored order, numbers in shortest round-trip form. Parsing the result yields
// a Value equal to `value` for every finite number; NaN and infinities have no
// JSON spelling and render as null.
std::string ToJson(const Value& value);

// Same content as ToJson with one item per line and `indent` spaces per level.
std::string ToPrettyJson(const Value& value, int indent = 2);

// Body of a JSON string literal (no surrounding quotes).
std::string EscapeJsonString(std::string_view input);

std::string FormatNumber(double number);

std::ostream& operator<<(std::ostream& out, const Value& value);

} // namespace jsoncomb::json
