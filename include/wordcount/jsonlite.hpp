#pragma once

// wordcount/jsonlite.hpp — Minimal strict JSON value model, parser and writer.
//
// Every payload that crosses the host boundary (requests, responses, the
// descriptor) is a jsonlite::Value. Handlers receive open Values and pull out
// only the fields they need through the typed extractors below.
//
// DETERMINISM:
//   - Object is a std::map, so serialization always emits keys sorted.
//   - format_double() produces the shortest representation that parses back
//     to the same double, and always carries a '.' or exponent so a double
//     never re-reads as an integer.
//
// STRICTNESS:
//   - Duplicate keys, trailing data, NaN/Infinity and raw control characters
//     inside strings are parse errors.
//   - Non-negative integers without fraction/exponent parse as uint64; every
//     other number parses as double.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace wordcount::jsonlite {

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Object, Array> v{nullptr};

  Value() = default;
  Value(std::nullptr_t) {}
  Value(bool b) : v(b) {}
  Value(std::uint64_t n) : v(n) {}
  Value(double d) : v(d) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(const char* s) : v(std::string(s)) {}
  Value(Object o) : v(std::move(o)) {}
  Value(Array a) : v(std::move(a)) {}

  bool is_null() const { return std::holds_alternative<std::nullptr_t>(v); }
  bool is_object() const { return std::holds_alternative<Object>(v); }

  friend bool operator==(const Value& a, const Value& b) { return a.v == b.v; }
};

struct JsonError {
  std::string code;     // "json_parse_error" | "json_duplicate_key"
  std::string message;
};

// Parse any JSON value. On failure *error is set and a null Value returned.
Value parse_value(std::string_view text, std::optional<JsonError>* error);

// Parse text that must be a JSON object. Non-object roots are an error.
Object parse(std::string_view text, std::optional<JsonError>* error);

std::string to_json(const Value& v);
std::string format_double(double d);
std::string escape(std::string_view s);

// Type-safe extractors. A missing key or a value of another type yields def.
const Value* find(const Object& obj, const std::string& key);
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
double get_double(const Object& obj, const std::string& key, double def = 0.0);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);

}  // namespace wordcount::jsonlite
