// Minimal JSON document parser for catalog, history and request input
// (no external dependencies).
//
// Handles objects, arrays, strings, numbers, booleans and null. Object members
// keep their document order. Unicode escapes outside ASCII are not decoded.

#ifndef LIFTPACK_CORE_JSON_PARSER_H
#define LIFTPACK_CORE_JSON_PARSER_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace liftpack {

/// @brief A JSON value of any type.
struct JsonValue {
  enum Type { String, Number, Bool, Null, Array, Object };
  Type type = Null;
  std::string string_val;
  double number_val = 0.0;
  bool bool_val = false;
  std::vector<JsonValue> array_val;
  std::vector<std::pair<std::string, JsonValue>> object_val;

  bool isString() const { return type == String; }
  bool isNumber() const { return type == Number; }
  bool isArray() const { return type == Array; }
  bool isObject() const { return type == Object; }

  /// @brief Get value as integer, with default.
  ///
  /// Fractions truncate toward zero; values outside the int range saturate.
  int asInt(int default_val = 0) const;

  /// @brief Get value as 64-bit integer, with default. Saturates like asInt().
  int64_t asInt64(int64_t default_val = 0) const;

  /// @brief Get value as boolean, with default.
  bool asBool(bool default_val = false) const;

  /// @brief Get value as string, with default.
  std::string asString(const std::string& default_val = "") const;

  /// @brief Collect the string elements of an array value.
  ///
  /// Non-string elements are skipped. Non-array values yield an empty list.
  std::vector<std::string> asStringList() const;

  /// @brief Look up an object member by key.
  /// @return Pointer to the member value, or nullptr if absent or not an object.
  const JsonValue* find(const std::string& key) const;
};

/// @brief Parse a complete JSON document.
///
/// @param json Pointer to JSON text.
/// @param length Length of JSON text.
/// @param[out] out Parsed root value.
/// @param[out] error Description with byte offset on failure.
/// @return True on success. Trailing non-whitespace is an error.
bool parseJson(const char* json, size_t length, JsonValue& out, std::string& error);

/// @brief Convenience overload for std::string input.
bool parseJson(const std::string& json, JsonValue& out, std::string& error);

/// @brief Read a file into a string.
/// @return False with error set if the file cannot be opened.
bool readTextFile(const std::string& path, std::string& out, std::string& error);

}  // namespace liftpack

#endif  // LIFTPACK_CORE_JSON_PARSER_H
