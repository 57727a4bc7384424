/// @file
/// @brief Implementation of the minimal JSON writer for structured output.

#include "core/json_helpers.h"

#include <cstdio>

namespace liftpack {

void JsonWriter::separate() {
  if (after_key_) {
    after_key_ = false;
    return;
  }
  if (!has_element_.empty() && has_element_.back()) {
    buffer_ += ',';
  }
}

void JsonWriter::markWritten() {
  if (!has_element_.empty()) {
    has_element_.back() = true;
  }
}

void JsonWriter::beginObject() {
  separate();
  buffer_ += '{';
  has_element_.push_back(false);
}

void JsonWriter::endObject() {
  buffer_ += '}';
  if (!has_element_.empty()) has_element_.pop_back();
  markWritten();
}

void JsonWriter::beginArray() {
  separate();
  buffer_ += '[';
  has_element_.push_back(false);
}

void JsonWriter::endArray() {
  buffer_ += ']';
  if (!has_element_.empty()) has_element_.pop_back();
  markWritten();
}

void JsonWriter::key(std::string_view name) {
  separate();
  buffer_ += '"';
  buffer_ += escapeString(name);
  buffer_ += "\":";
  after_key_ = true;
}

void JsonWriter::value(std::string_view val) {
  separate();
  buffer_ += '"';
  buffer_ += escapeString(val);
  buffer_ += '"';
  markWritten();
}

void JsonWriter::value(int val) {
  separate();
  buffer_ += std::to_string(val);
  markWritten();
}

void JsonWriter::value(bool val) {
  separate();
  buffer_ += val ? "true" : "false";
  markWritten();
}

void JsonWriter::valueNull() {
  separate();
  buffer_ += "null";
  markWritten();
}

void JsonWriter::stringArray(const std::vector<std::string>& items) {
  beginArray();
  for (const auto& item : items) {
    value(std::string_view(item));
  }
  endArray();
}

std::string JsonWriter::toPrettyString(int indent_size) const {
  std::string result;
  result.reserve(buffer_.size() * 2);

  int depth = 0;
  bool in_string = false;
  bool escaped = false;

  auto newline = [&]() {
    result += '\n';
    result.append(static_cast<size_t>(depth * indent_size), ' ');
  };

  for (size_t pos = 0; pos < buffer_.size(); ++pos) {
    char chr = buffer_[pos];

    if (in_string) {
      result += chr;
      if (escaped) {
        escaped = false;
      } else if (chr == '\\') {
        escaped = true;
      } else if (chr == '"') {
        in_string = false;
      }
      continue;
    }

    switch (chr) {
      case '"':
        in_string = true;
        result += chr;
        break;
      case '{':
      case '[': {
        result += chr;
        bool empty = pos + 1 < buffer_.size() &&
                     (buffer_[pos + 1] == '}' || buffer_[pos + 1] == ']');
        if (!empty) {
          ++depth;
          newline();
        } else {
          result += buffer_[++pos];
        }
        break;
      }
      case '}':
      case ']':
        --depth;
        newline();
        result += chr;
        break;
      case ',':
        result += chr;
        newline();
        break;
      case ':':
        result += ": ";
        break;
      default:
        result += chr;
        break;
    }
  }

  return result;
}

std::string JsonWriter::escapeString(std::string_view input) {
  std::string result;
  result.reserve(input.size());

  for (char chr : input) {
    switch (chr) {
      case '"':  result += "\\\""; break;
      case '\\': result += "\\\\"; break;
      case '\b': result += "\\b";  break;
      case '\f': result += "\\f";  break;
      case '\n': result += "\\n";  break;
      case '\r': result += "\\r";  break;
      case '\t': result += "\\t";  break;
      default:
        if (static_cast<unsigned char>(chr) < 0x20) {
          char hex_buf[8];
          std::snprintf(hex_buf, sizeof(hex_buf), "\\u%04x",
                        static_cast<unsigned>(static_cast<unsigned char>(chr)));
          result += hex_buf;
        } else {
          result += chr;
        }
        break;
    }
  }

  return result;
}

}  // namespace liftpack
