// Minimal JSON parser for profile documents and config input (no external dependencies).
//
// Handles objects, arrays, strings, numbers, booleans and null. Object member
// order is preserved so that callers iterating a profile document see tracks
// in file order.

#ifndef MOODSPACE_CORE_JSON_PARSER_H
#define MOODSPACE_CORE_JSON_PARSER_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace moodspace {

/// @brief A parsed JSON value.
struct JsonValue {
  enum Type { Null, Bool, Number, String, Array, Object };
  Type type = Null;
  bool bool_val = false;
  double number_val = 0.0;
  std::string string_val;
  std::vector<JsonValue> array_val;
  std::vector<std::pair<std::string, JsonValue>> object_val;  ///< In document order.

  bool isNull() const { return type == Null; }
  bool isNumber() const { return type == Number; }
  bool isString() const { return type == String; }
  bool isArray() const { return type == Array; }
  bool isObject() const { return type == Object; }

  /// @brief Get value as integer, with default.
  int asInt(int default_val = 0) const;

  /// @brief Get value as unsigned integer, with default.
  uint32_t asUint(uint32_t default_val = 0) const;

  /// @brief Get value as double, with default.
  double asDouble(double default_val = 0.0) const;

  /// @brief Get value as boolean, with default.
  bool asBool(bool default_val = false) const;

  /// @brief Get value as string, with default.
  std::string asString(const std::string& default_val = "") const;

  /// @brief Look up an object member.
  /// @return Pointer to the member value, or nullptr when absent or not an object.
  const JsonValue* find(const std::string& name) const;
};

/// @brief Outcome of parsing a JSON document.
struct JsonParseResult {
  bool success = false;
  JsonValue root;
  std::string error_message;
  size_t error_offset = 0;
};

/// @brief Parse a complete JSON document.
/// @param json Pointer to JSON text.
/// @param length Length of JSON text.
/// @return Parsed tree, or success == false with the failing byte offset.
JsonParseResult parseJson(const char* json, size_t length);

/// @brief Parse a flat JSON object into a key-value map.
///
/// Only top-level members are returned. Nested objects and arrays are kept
/// as values but callers reading flat config typically ignore them.
///
/// @param json Pointer to JSON string.
/// @param length Length of JSON string.
/// @return Map of key-value pairs. Empty map on parse error or non-object root.
std::map<std::string, JsonValue> parseJsonObject(const char* json, size_t length);

}  // namespace moodspace

#endif  // MOODSPACE_CORE_JSON_PARSER_H
