#include "json/value.hpp"

#include <algorithm>

namespace jsoncomb::json {

const Value* Value::Find(std::string_view key) const {
  if (!IsObject()) {
    return nullptr;
  }
  const Object& members = AsObject();
  const auto it = std::find_if(members.begin(), members.end(),
                               [key](const Member& member) { return member.first == key; });
  return it == members.end() ? nullptr : &it->second;
}

std::size_t Value::Size() const {
  switch (Kind()) {
  case Type::kArray:
    return AsArray().size();
  case Type::kObject:
    return AsObject().size();
  default:
    return 0;
  }
}

Value Value::MakeObject(Object members) {
  Object unique;
  unique.reserve(members.size());
  for (auto& member : members) {
    InsertMember(unique, std::move(member.first), std::move(member.second));
  }
  Value result;
  result.data_ = std::move(unique);
  return result;
}

void Value::InsertMember(Object& object, std::string key, Value value) {
  for (auto& member : object) {
    if (member.first == key) {
      member.second = std::move(value);
      return;
    }
  }
  object.emplace_back(std::move(key), std::move(value));
}

bool operator==(const Value& lhs, const Value& rhs) {
  if (lhs.Kind() != rhs.Kind()) {
    return false;
  }

  switch (lhs.Kind()) {
  case Value::Type::kNull:
    return true;
  case Value::Type::kBool:
    return lhs.AsBool() == rhs.AsBool();
  case Value::Type::kNumber:
    return lhs.AsNumber() == rhs.AsNumber();
  case Value::Type::kString:
    return lhs.AsString() == rhs.AsString();
  case Value::Type::kArray:
    return lhs.AsArray() == rhs.AsArray();
  case Value::Type::kObject:
    return lhs.AsObject() == rhs.AsObject();
  }
  return false;
}

bool operator!=(const Value& lhs, const Value& rhs) {
  return !(lhs == rhs);
}

const char* ToString(Value::Type type) {
  switch (type) {
  case Value::Type::kNull:
    return "null";
  case Value::Type::kBool:
    return "bool";
  case Value::Type::kNumber:
    return "number";
  case Value::Type::kString:
    return "string";
  case Value::Type::kArray:
    return "array";
  case Value::Type::kObject:
    return "object";
  }
  return "null";
}

} // namespace jsoncomb::json
