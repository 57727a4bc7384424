// Implementation of the recursive-descent JSON parser.

#include "core/json_parser.h"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace liftpack {

namespace {

/// @brief Truncate a double into IntType, clamping out-of-range values.
template <typename IntType>
IntType saturatingCast(double val) {
  constexpr IntType kMin = std::numeric_limits<IntType>::min();
  constexpr IntType kMax = std::numeric_limits<IntType>::max();
  // kMax may round up when converted to double, so compare with >=.
  if (val >= static_cast<double>(kMax)) return kMax;
  if (val <= static_cast<double>(kMin)) return kMin;
  return static_cast<IntType>(val);
}

}  // namespace

int JsonValue::asInt(int default_val) const {
  if (type == Number) return saturatingCast<int>(number_val);
  return default_val;
}

int64_t JsonValue::asInt64(int64_t default_val) const {
  if (type == Number) return saturatingCast<int64_t>(number_val);
  return default_val;
}

bool JsonValue::asBool(bool default_val) const {
  if (type == Bool) return bool_val;
  return default_val;
}

std::string JsonValue::asString(const std::string& default_val) const {
  if (type == String) return string_val;
  return default_val;
}

std::vector<std::string> JsonValue::asStringList() const {
  std::vector<std::string> result;
  if (type != Array) return result;
  result.reserve(array_val.size());
  for (const auto& elem : array_val) {
    if (elem.type == String) result.push_back(elem.string_val);
  }
  return result;
}

const JsonValue* JsonValue::find(const std::string& key) const {
  if (type != Object) return nullptr;
  for (const auto& member : object_val) {
    if (member.first == key) return &member.second;
  }
  return nullptr;
}

namespace {

/// Nesting limit; deeper documents are rejected rather than recursed into.
constexpr int kMaxDepth = 64;

/// @brief Cursor over the input text with error reporting.
class Parser {
 public:
  Parser(const char* json, size_t length) : json_(json), length_(length) {}

  bool parseDocument(JsonValue& out, std::string& error) {
    skipWhitespace();
    if (!parseValue(out, 0)) {
      error = error_;
      return false;
    }
    skipWhitespace();
    if (pos_ < length_) {
      fail("unexpected trailing characters");
      error = error_;
      return false;
    }
    return true;
  }

 private:
  void skipWhitespace() {
    while (pos_ < length_ && std::isspace(static_cast<unsigned char>(json_[pos_]))) {
      ++pos_;
    }
  }

  bool fail(const char* what) {
    if (error_.empty()) {
      error_ = std::string(what) + " at offset " + std::to_string(pos_);
    }
    return false;
  }

  bool consumeLiteral(const char* literal) {
    size_t idx = 0;
    while (literal[idx] != '\0') {
      if (pos_ + idx >= length_ || json_[pos_ + idx] != literal[idx]) {
        return fail("invalid literal");
      }
      ++idx;
    }
    pos_ += idx;
    return true;
  }

  bool parseValue(JsonValue& out, int depth) {
    if (depth > kMaxDepth) return fail("nesting too deep");
    skipWhitespace();
    if (pos_ >= length_) return fail("unexpected end of input");

    char chr = json_[pos_];
    if (chr == '{') return parseObject(out, depth);
    if (chr == '[') return parseArray(out, depth);
    if (chr == '"') {
      out.type = JsonValue::String;
      return parseString(out.string_val);
    }
    if (chr == 't') {
      out.type = JsonValue::Bool;
      out.bool_val = true;
      return consumeLiteral("true");
    }
    if (chr == 'f') {
      out.type = JsonValue::Bool;
      out.bool_val = false;
      return consumeLiteral("false");
    }
    if (chr == 'n') {
      out.type = JsonValue::Null;
      return consumeLiteral("null");
    }
    if (chr == '-' || std::isdigit(static_cast<unsigned char>(chr))) {
      return parseNumber(out);
    }
    return fail("unexpected character");
  }

  bool parseString(std::string& out) {
    ++pos_;  // opening quote
    out.clear();
    while (pos_ < length_ && json_[pos_] != '"') {
      char chr = json_[pos_];
      if (chr == '\\') {
        if (pos_ + 1 >= length_) return fail("unterminated escape");
        ++pos_;
        switch (json_[pos_]) {
          case '"':  out += '"'; break;
          case '\\': out += '\\'; break;
          case '/':  out += '/'; break;
          case 'b':  out += '\b'; break;
          case 'f':  out += '\f'; break;
          case 'n':  out += '\n'; break;
          case 't':  out += '\t'; break;
          case 'r':  out += '\r'; break;
          case 'u': {
            if (pos_ + 4 >= length_) return fail("truncated unicode escape");
            std::string hex(json_ + pos_ + 1, 4);
            long code = std::strtol(hex.c_str(), nullptr, 16);
            out += (code < 0x80) ? static_cast<char>(code) : '?';
            pos_ += 4;
            break;
          }
          default:
            return fail("invalid escape");
        }
      } else {
        out += chr;
      }
      ++pos_;
    }
    if (pos_ >= length_) return fail("unterminated string");
    ++pos_;  // closing quote
    return true;
  }

  bool parseNumber(JsonValue& out) {
    size_t start = pos_;
    if (json_[pos_] == '-') ++pos_;
    while (pos_ < length_ && std::isdigit(static_cast<unsigned char>(json_[pos_]))) ++pos_;
    if (pos_ < length_ && json_[pos_] == '.') {
      ++pos_;
      while (pos_ < length_ && std::isdigit(static_cast<unsigned char>(json_[pos_]))) ++pos_;
    }
    if (pos_ < length_ && (json_[pos_] == 'e' || json_[pos_] == 'E')) {
      ++pos_;
      if (pos_ < length_ && (json_[pos_] == '+' || json_[pos_] == '-')) ++pos_;
      while (pos_ < length_ && std::isdigit(static_cast<unsigned char>(json_[pos_]))) ++pos_;
    }

    std::string num_str(json_ + start, pos_ - start);
    char* end = nullptr;
    out.type = JsonValue::Number;
    out.number_val = std::strtod(num_str.c_str(), &end);
    if (end == num_str.c_str()) return fail("invalid number");
    return true;
  }

  bool parseArray(JsonValue& out, int depth) {
    out.type = JsonValue::Array;
    ++pos_;  // '['
    skipWhitespace();
    if (pos_ < length_ && json_[pos_] == ']') {
      ++pos_;
      return true;
    }
    while (true) {
      JsonValue elem;
      if (!parseValue(elem, depth + 1)) return false;
      out.array_val.push_back(std::move(elem));
      skipWhitespace();
      if (pos_ >= length_) return fail("unterminated array");
      if (json_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (json_[pos_] == ']') {
        ++pos_;
        return true;
      }
      return fail("expected ',' or ']'");
    }
  }

  bool parseObject(JsonValue& out, int depth) {
    out.type = JsonValue::Object;
    ++pos_;  // '{'
    skipWhitespace();
    if (pos_ < length_ && json_[pos_] == '}') {
      ++pos_;
      return true;
    }
    while (true) {
      skipWhitespace();
      if (pos_ >= length_ || json_[pos_] != '"') return fail("expected key");
      std::string key;
      if (!parseString(key)) return false;
      skipWhitespace();
      if (pos_ >= length_ || json_[pos_] != ':') return fail("expected ':'");
      ++pos_;
      JsonValue member;
      if (!parseValue(member, depth + 1)) return false;
      out.object_val.emplace_back(std::move(key), std::move(member));
      skipWhitespace();
      if (pos_ >= length_) return fail("unterminated object");
      if (json_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (json_[pos_] == '}') {
        ++pos_;
        return true;
      }
      return fail("expected ',' or '}'");
    }
  }

  const char* json_;
  size_t length_;
  size_t pos_ = 0;
  std::string error_;
};

}  // namespace

bool parseJson(const char* json, size_t length, JsonValue& out, std::string& error) {
  out = JsonValue();
  if (!json || length == 0) {
    error = "empty input";
    return false;
  }
  Parser parser(json, length);
  return parser.parseDocument(out, error);
}

bool parseJson(const std::string& json, JsonValue& out, std::string& error) {
  return parseJson(json.data(), json.size(), out, error);
}

bool readTextFile(const std::string& path, std::string& out, std::string& error) {
  std::ifstream file(path);
  if (!file.is_open()) {
    error = "cannot open " + path;
    return false;
  }
  std::ostringstream oss;
  oss << file.rdbuf();
  out = oss.str();
  return true;
}

}  // namespace liftpack
