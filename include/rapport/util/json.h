#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace rapport::json {

class Value;
using Array = std::vector<Value>;
using Object = std::unordered_map<std::string, Value>;

// JSON tree node for relationship exports and scenario files.
//
// Numbers are always doubles. Readers are lenient: the *_value() accessors
// return the fallback on a type mismatch, while at(), object() and array()
// throw std::runtime_error so scenario code can report malformed input.
class Value {
 public:
  Value() = default;
  Value(std::nullptr_t) {}
  Value(bool b) : data_(b) {}
  Value(double d) : data_(d) {}
  Value(int i) : data_(static_cast<double>(i)) {}
  Value(std::string s) : data_(std::move(s)) {}
  Value(const char* s) : data_(std::string(s)) {}
  Value(Array a) : data_(std::move(a)) {}
  Value(Object o) : data_(std::move(o)) {}

  bool is_null() const { return std::holds_alternative<std::nullptr_t>(data_); }
  bool is_number() const { return std::holds_alternative<double>(data_); }
  bool is_string() const { return std::holds_alternative<std::string>(data_); }
  bool is_array() const { return std::holds_alternative<Array>(data_); }
  bool is_object() const { return std::holds_alternative<Object>(data_); }

  // Member lookup on an object; nullptr for a missing key or a non-object.
  const Value* find(const std::string& key) const;
  const Value& at(const std::string& key) const;

  bool bool_value(bool fallback = false) const;
  double number_value(double fallback = 0.0) const;
  std::string string_value(const std::string& fallback = "") const;

  const Object& object() const;
  const Array& array() const;

 private:
  friend class Writer;

  std::variant<std::nullptr_t, bool, double, std::string, Array, Object> data_{nullptr};
};

// Throws std::runtime_error naming the line and column of the first error.
Value parse(const std::string& text);

// Object keys are written in sorted order so output is stable.
std::string stringify(const Value& v, int indent = 2);

} // namespace rapport::json
