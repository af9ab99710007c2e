// Minimal JSON serialization writer (no external dependencies).
//
// Builds JSON output via a string-builder approach. Used for the statistics,
// cluster and export-bundle reports. Parsing lives in core/json_parser.h.

#ifndef MOODSPACE_CORE_JSON_HELPERS_H
#define MOODSPACE_CORE_JSON_HELPERS_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace moodspace {

/// @brief Simple JSON writer that builds a JSON string incrementally.
///
/// Usage:
/// @code
///   JsonWriter writer;
///   writer.beginObject();
///   writer.key("track_id");
///   writer.value("t1");
///   writer.key("valence");
///   writer.value(0.25);
///   writer.endObject();
///   std::string json = writer.toString();
///   // -> {"track_id":"t1","valence":0.25}
/// @endcode
///
/// Supports nested objects and arrays. Comma insertion is tracked per
/// nesting level. Structure is not validated (caller must match begin/end).
class JsonWriter {
 public:
  JsonWriter() = default;

  void beginObject();
  void endObject();
  void beginArray();
  void endArray();

  /// @brief Write an object key (must be followed by a value or container).
  void key(std::string_view name);

  /// @brief Write a string value (JSON-escaped).
  void value(std::string_view val);

  /// @brief Write a C-string value. Prevents literals binding to value(bool).
  void value(const char* val);

  void value(int val);
  void value(uint64_t val);

  /// @brief Write a floating-point value. NaN and infinity become null.
  void value(double val);

  void value(bool val);
  void valueNull();

  /// @brief Shorthand for key() followed by value().
  template <typename T>
  void field(std::string_view name, const T& val) {
    key(name);
    value(val);
  }

  /// @brief Write an array of doubles.
  void numberArray(const std::vector<double>& values);

  /// @brief Get the accumulated compact JSON string.
  std::string toString() const;

  /// @brief Get the accumulated JSON string with indentation.
  /// @param indent_size Number of spaces per indent level (default: 2).
  std::string toPrettyString(int indent_size = 2) const;

 private:
  /// Emit a separating comma if the current level already holds an element.
  void maybeComma();

  /// Record that an element was written at the current level.
  void markWritten();

  void openContainer(char open);
  void closeContainer(char close);

  static std::string escapeString(std::string_view input);

  std::string buffer_;

  // One entry per open container: whether the next element needs a comma.
  std::vector<bool> needs_comma_;

  // Set after key(): the following value belongs to it and takes no comma.
  bool after_key_ = false;
};

}  // namespace moodspace

#endif  // MOODSPACE_CORE_JSON_HELPERS_H
