#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace jsoncomb::json {

// Parsed JSON document node.
//
// A closed tree: arrays and objects own their children by value, so copying a
// Value deep-copies the subtree and no two nodes share state. Objects keep
// members in document order; keys are unique because InsertMember lets a later
// member replace an earlier one with the same key.
class Value {
public:
  enum class Type {
    kNull,
    kBool,
    kNumber,
    kString,
    kArray,
    kObject,
  };

  using Array = std::vector<Value>;
  using Member = std::pair<std::string, Value>;
  using Object = std::vector<Member>;

  Value() = default;

  static Value Null() {
    return Value();
  }

  static Value Bool(bool value) {
    Value result;
    result.data_ = value;
    return result;
  }

  static Value Number(double value) {
    Value result;
    result.data_ = value;
    return result;
  }

  static Value String(std::string value) {
    Value result;
    result.data_ = std::move(value);
    return result;
  }

  static Value MakeArray(Array items) {
    Value result;
    result.data_ = std::move(items);
    return result;
  }

  // Members go through InsertMember, so a repeated key keeps its first
  // position and its last value.
  static Value MakeObject(Object members);

  Type Kind() const {
    return static_cast<Type>(data_.index());
  }

  bool IsNull() const {
    return Kind() == Type::kNull;
  }
  bool IsBool() const {
    return Kind() == Type::kBool;
  }
  bool IsNumber() const {
    return Kind() == Type::kNumber;
  }
  bool IsString() const {
    return Kind() == Type::kString;
  }
  bool IsArray() const {
    return Kind() == Type::kArray;
  }
  bool IsObject() const {
    return Kind() == Type::kObject;
  }

  // Typed accessors. The value must hold the requested type.
  bool AsBool() const {
    return std::get<bool>(data_);
  }
  double AsNumber() const {
    return std::get<double>(data_);
  }
  const std::string& AsString() const {
    return std::get<std::string>(data_);
  }
  const Array& AsArray() const {
    return std::get<Array>(data_);
  }
  const Object& AsObject() const {
    return std::get<Object>(data_);
  }

  // Member lookup on objects; nullptr for a missing key or a non-object.
  const Value* Find(std::string_view key) const;

  // Number of array items or object members; 0 for scalars.
  std::size_t Size() const;

  // Adds `key` to `object`, or replaces the value of an existing member with
  // the same key in place.
  static void InsertMember(Object& object, std::string key, Value value);

private:
  // Alternative order matches Type.
  std::variant<std::monostate, bool, double, std::string, Array, Object> data_;
};

// Structural equality. Numbers compare with ==, objects compare members in
// order.
bool operator==(const Value& lhs, const Value& rhs);
bool operator!=(const Value& lhs, const Value& rhs);

const char* ToString(Value::Type type);

} // namespace jsoncomb::json
