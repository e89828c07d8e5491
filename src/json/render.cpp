#include "json/render.hpp"

#include <charconv>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace jsoncomb::json {

namespace {

void AppendQuoted(std::string_view text, std::string& out) {
  out.push_back('"');
  out += EscapeJsonString(text);
  out.push_back('"');
}

void AppendNewline(int indent, int level, std::string& out) {
  out.push_back('\n');
  out.append(static_cast<std::size_t>(indent) * static_cast<std::size_t>(level), ' ');
}

// indent < 0 selects the compact layout.
void Render(const Value& value, int indent, int level, std::string& out) {
  switch (value.Kind()) {
  case Value::Type::kNull:
    out += "null";
    return;
  case Value::Type::kBool:
    out += value.AsBool() ? "true" : "false";
    return;
  case Value::Type::kNumber:
    out += FormatNumber(value.AsNumber());
    return;
  case Value::Type::kString:
    AppendQuoted(value.AsString(), out);
    return;
  case Value::Type::kArray: {
    const auto& items = value.AsArray();
    out.push_back('[');
    for (std::size_t i = 0; i < items.size(); ++i) {
      if (i != 0) {
        out.push_back(',');
      }
      if (indent >= 0) {
        AppendNewline(indent, level + 1, out);
      }
      Render(items[i], indent, level + 1, out);
    }
    if (indent >= 0 && !items.empty()) {
      AppendNewline(indent, level, out);
    }
    out.push_back(']');
    return;
  }
  case Value::Type::kObject: {
    const auto& members = value.AsObject();
    out.push_back('{');
    for (std::size_t i = 0; i < members.size(); ++i) {
      if (i != 0) {
        out.push_back(',');
      }
      if (indent >= 0) {
        AppendNewline(indent, level + 1, out);
      }
      AppendQuoted(members[i].first, out);
      out += indent >= 0 ? ": " : ":";
      Render(members[i].second, indent, level + 1, out);
    }
    if (indent >= 0 && !members.empty()) {
      AppendNewline(indent, level, out);
    }
    out.push_back('}');
    return;
  }
  }
}

} // namespace

std::string EscapeJsonString(std::string_view input) {
  std::ostringstream out;
  for (const char ch : input) {
    switch (ch) {
    case '"':
      out << "\\\"";
      break;
    case '\\':
      out << "\\\\";
      break;
    case '\b':
      out << "\\b";
      break;
    case '\f':
      out << "\\f";
      break;
    case '\n':
      out << "\\n";
      break;
    case '\r':
      out << "\\r";
      break;
    case '\t':
      out << "\\t";
      break;
    default: {
      const auto as_unsigned = static_cast<unsigned char>(ch);
      if (as_unsigned < 0x20U) {
        out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
            << static_cast<int>(as_unsigned) << std::dec << std::setfill(' ');
      } else {
        out << ch;
      }
      break;
    }
    }
  }
  return out.str();
}

std::string FormatNumber(double number) {
  if (!std::isfinite(number)) {
    return "null";
  }
  char buffer[32];
  const auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), number);
  if (ec != std::errc()) {
    return "null";
  }
  return std::string(buffer, end);
}

std::string ToJson(const Value& value) {
  std::string out;
  Render(value, -1, 0, out);
  return out;
}

std::string ToPrettyJson(const Value& value, int indent) {
  std::string out;
  Render(value, indent < 0 ? 0 : indent, 0, out);
  return out;
}

std::ostream& operator<<(std::ostream& out, const Value& value) {
  return out << ToJson(value);
}

} // namespace jsoncomb::json
