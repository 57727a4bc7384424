// Minimal JSON serialization writer (no external dependencies).
//
// Builds JSON output via a string-builder approach. Used for prescription
// results and the C API. Does not parse JSON (see core/json_parser.h).

#ifndef LIFTPACK_CORE_JSON_HELPERS_H
#define LIFTPACK_CORE_JSON_HELPERS_H

#include <string>
#include <string_view>
#include <vector>

namespace liftpack {

/// @brief Simple JSON writer that builds a JSON string incrementally.
///
/// Usage:
/// @code
///   JsonWriter writer;
///   writer.beginObject();
///   writer.key("exercise_id");
///   writer.value("push_up");
///   writer.key("sets");
///   writer.value(3);
///   writer.endObject();
///   std::string json = writer.toString();
///   // -> {"exercise_id":"push_up","sets":3}
/// @endcode
///
/// Tracks comma insertion per nesting level. Does not validate structure
/// (caller must match begin/end pairs).
class JsonWriter {
 public:
  JsonWriter() = default;

  void beginObject();
  void endObject();
  void beginArray();
  void endArray();

  /// @brief Write an object key (must be followed by a value call).
  void key(std::string_view name);

  /// @brief Write a JSON-escaped string value.
  void value(std::string_view val);

  /// @brief Write a string value from a C string (avoids the bool overload).
  void value(const char* val) { value(std::string_view(val)); }

  void value(int val);
  void value(bool val);
  void valueNull();

  /// @brief Write an array of strings.
  void stringArray(const std::vector<std::string>& items);

  /// @brief Get the accumulated JSON string.
  const std::string& toString() const { return buffer_; }

  /// @brief Get the accumulated JSON string with pretty-print indentation.
  /// @param indent_size Number of spaces per indent level (default: 2).
  std::string toPrettyString(int indent_size = 2) const;

 private:
  /// Emit a separator if the current container already holds an element.
  void separate();

  /// Record that the current container now holds an element.
  void markWritten();

  /// Escape special characters in a string for JSON output.
  static std::string escapeString(std::string_view input);

  std::string buffer_;

  // One entry per open container: true once it holds an element.
  std::vector<bool> has_element_;

  // True between key() and the value that follows it.
  bool after_key_ = false;
};

}  // namespace liftpack

#endif  // LIFTPACK_CORE_JSON_HELPERS_H
