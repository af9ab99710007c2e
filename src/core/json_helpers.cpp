/// @file
/// @brief Implementation of the minimal JSON writer for structured reports.

#include "core/json_helpers.h"

#include <cmath>
#include <cstdio>

namespace moodspace {

void JsonWriter::maybeComma() {
  if (after_key_) {
    after_key_ = false;
    return;
  }
  if (!needs_comma_.empty() && needs_comma_.back()) {
    buffer_ += ',';
  }
}

void JsonWriter::markWritten() {
  if (!needs_comma_.empty()) {
    needs_comma_.back() = true;
  }
}

void JsonWriter::openContainer(char open) {
  maybeComma();
  buffer_ += open;
  needs_comma_.push_back(false);
}

void JsonWriter::closeContainer(char close) {
  buffer_ += close;
  if (!needs_comma_.empty()) {
    needs_comma_.pop_back();
  }
  markWritten();
}

void JsonWriter::beginObject() { openContainer('{'); }

void JsonWriter::endObject() { closeContainer('}'); }

void JsonWriter::beginArray() { openContainer('['); }

void JsonWriter::endArray() { closeContainer(']'); }

void JsonWriter::key(std::string_view name) {
  maybeComma();
  buffer_ += '"';
  buffer_ += escapeString(name);
  buffer_ += "\":";
  markWritten();
  after_key_ = true;
}

void JsonWriter::value(std::string_view val) {
  maybeComma();
  buffer_ += '"';
  buffer_ += escapeString(val);
  buffer_ += '"';
  markWritten();
}

void JsonWriter::value(const char* val) {
  value(std::string_view(val ? val : ""));
}

void JsonWriter::value(int val) {
  maybeComma();
  buffer_ += std::to_string(val);
  markWritten();
}

void JsonWriter::value(uint64_t val) {
  maybeComma();
  buffer_ += std::to_string(val);
  markWritten();
}

void JsonWriter::value(double val) {
  maybeComma();
  if (std::isnan(val) || std::isinf(val)) {
    buffer_ += "null";
  } else {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.10g", val);
    buffer_ += buf;
  }
  markWritten();
}

void JsonWriter::value(bool val) {
  maybeComma();
  buffer_ += val ? "true" : "false";
  markWritten();
}

void JsonWriter::valueNull() {
  maybeComma();
  buffer_ += "null";
  markWritten();
}

void JsonWriter::numberArray(const std::vector<double>& values) {
  beginArray();
  for (double val : values) {
    value(val);
  }
  endArray();
}

std::string JsonWriter::toString() const {
  return buffer_;
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
        ++depth;
        // Empty containers stay compact: {} or [].
        bool empty = pos + 1 < buffer_.size() &&
                     (buffer_[pos + 1] == '}' || buffer_[pos + 1] == ']');
        if (!empty) newline();
        break;
      }
      case '}':
      case ']':
        --depth;
        if (!result.empty() && result.back() != '{' && result.back() != '[') {
          newline();
        }
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
  std::string output;
  output.reserve(input.size());
  for (char chr : input) {
    switch (chr) {
      case '"':  output += "\\\""; break;
      case '\\': output += "\\\\"; break;
      case '\n': output += "\\n"; break;
      case '\r': output += "\\r"; break;
      case '\t': output += "\\t"; break;
      case '\b': output += "\\b"; break;
      case '\f': output += "\\f"; break;
      default:
        if (static_cast<unsigned char>(chr) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(chr));
          output += buf;
        } else {
          output += chr;
        }
        break;
    }
  }
  return output;
}

}  // namespace moodspace
