#pragma once

// keystone/jsonlite.hpp — Minimal strict JSON value model, parser and writer.
//
// Objects are std::map, so serialization is canonical: keys are emitted in
// sorted order and the same Value always produces the same text. WAL digests
// and State Surface values rely on this.
//
// Integers are held as uint64_t. Negative integers and anything with a
// fraction or exponent are held as double.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace keystone::jsonlite {

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::string, std::uint64_t, double, Object, Array> v;
};

// Builders. The variant's converting constructor is ambiguous for plain int
// and const char*, so callers go through these.
inline Value make_string(std::string s) { return Value{std::move(s)}; }
inline Value make_u64(std::uint64_t n) { return Value{n}; }
inline Value make_bool(bool b) { return Value{b}; }
inline Value make_object(Object o) { return Value{std::move(o)}; }
inline Value make_array(Array a) { return Value{std::move(a)}; }

struct JsonError {
  std::string code;
  std::string message;
};

// Strict parse of a full document. Fails on trailing data, duplicate keys,
// NaN/Infinity.
std::optional<JsonError> validate_strict(const std::string& text);

// Parses a document whose root must be an object. Returns {} on error.
Object parse(const std::string& text, std::optional<JsonError>* error);

std::string to_json(const Value& v);
std::string to_json(const Object& o);

// Type-safe extractors. Missing key or wrong type yields the default.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key);
Object get_object(const Object& obj, const std::string& key);
Array get_array(const Object& obj, const std::string& key);

bool is_object(const Value& v);

std::string escape(const std::string& s);

}  // namespace keystone::jsonlite
