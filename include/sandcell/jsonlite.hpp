#pragma once

// sandcell/jsonlite.hpp - Minimal strict JSON reader/writer.
//
// Used for the three JSON surfaces of the engine: the configuration file,
// batch request/result documents and NDJSON terminal event frames.
//
// DETERMINISM:
//   - Object is a std::map, so serialization emits keys in sorted order.
//   - format_double() uses a fixed "%.6f" with trailing-zero trimming.
//
// LIMITS:
//   - Non-negative integers are held as uint64; negative integers and anything
//     with a fraction or exponent as double. get_i64() accepts both.
//   - \uXXXX escapes are decoded to UTF-8 for the BMP only; surrogate pairs are
//     combined when both halves are present.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace sandcell::jsonlite {

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Object, Array> v;

  Value() : v(nullptr) {}
  Value(std::nullptr_t) : v(nullptr) {}
  Value(bool b) : v(b) {}
  Value(std::uint64_t n) : v(n) {}
  Value(double d) : v(d) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(const char* s) : v(std::string(s)) {}
  Value(Object o) : v(std::move(o)) {}
  Value(Array a) : v(std::move(a)) {}
};

struct JsonError {
  std::string code;     // "json_parse_error" | "json_duplicate_key"
  std::string message;
};

// Parse a document whose top level must be an object. On error returns an
// empty object and sets *error (when non-null).
Object parse(const std::string& text, std::optional<JsonError>* error);

// Returns the first syntax error in text, or nullopt for valid JSON.
std::optional<JsonError> validate_strict(const std::string& text);

std::string to_json(const Value& v);
std::string escape(const std::string& s);

// Length of s without a trailing, incomplete UTF-8 sequence. Output is cut
// and chunked here so a JSON string never ends in half a character.
std::size_t utf8_complete_prefix(const std::string& s);
std::string format_double(double d);

// Type-safe extractors. Missing keys or mismatched types return def.
bool has(const Object& obj, const std::string& key);
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
long long get_i64(const Object& obj, const std::string& key, long long def = 0);
double get_double(const Object& obj, const std::string& key, double def = 0.0);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);
std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key);
std::optional<Object> get_object(const Object& obj, const std::string& key);

}  // namespace sandcell::jsonlite
