// Implementation of the minimal recursive-descent JSON parser.

#include "core/json_parser.h"

#include <cctype>
#include <cstdlib>
#include <cstring>
#include <limits>

namespace moodspace {

int JsonValue::asInt(int default_val) const {
  if (type != Number) return default_val;
  constexpr int kMin = std::numeric_limits<int>::min();
  constexpr int kMax = std::numeric_limits<int>::max();
  if (number_val <= static_cast<double>(kMin)) return kMin;
  if (number_val >= static_cast<double>(kMax)) return kMax;
  return static_cast<int>(number_val);
}

uint32_t JsonValue::asUint(uint32_t default_val) const {
  if (type != Number || number_val < 0.0) return default_val;
  constexpr uint32_t kMax = std::numeric_limits<uint32_t>::max();
  if (number_val >= static_cast<double>(kMax)) return kMax;
  return static_cast<uint32_t>(number_val);
}

double JsonValue::asDouble(double default_val) const {
  if (type == Number) return number_val;
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

const JsonValue* JsonValue::find(const std::string& name) const {
  if (type != Object) return nullptr;
  for (const auto& member : object_val) {
    if (member.first == name) return &member.second;
  }
  return nullptr;
}

namespace {

/// Nesting limit; deeper documents are rejected rather than overflowing the stack.
constexpr int kMaxDepth = 64;

/// @brief Cursor over the input text with error recording.
class Parser {
 public:
  Parser(const char* json, size_t length) : json_(json), length_(length) {}

  bool parseDocument(JsonValue& out) {
    skipWhitespace();
    if (!parseValue(out, 0)) return false;
    skipWhitespace();
    if (pos_ != length_) return fail("trailing characters after document");
    return true;
  }

  const std::string& error() const { return error_; }
  size_t offset() const { return pos_; }

 private:
  bool fail(const char* message) {
    if (error_.empty()) error_ = message;
    return false;
  }

  void skipWhitespace() {
    while (pos_ < length_ && std::isspace(static_cast<unsigned char>(json_[pos_]))) {
      ++pos_;
    }
  }

  bool consumeLiteral(const char* literal) {
    size_t len = std::strlen(literal);
    if (length_ - pos_ < len || std::strncmp(json_ + pos_, literal, len) != 0) {
      return fail("invalid literal");
    }
    pos_ += len;
    return true;
  }

  bool parseValue(JsonValue& out, int depth) {
    if (depth > kMaxDepth) return fail("nesting too deep");
    skipWhitespace();
    if (pos_ >= length_) return fail("unexpected end of input");

    char chr = json_[pos_];
    switch (chr) {
      case '{': return parseObject(out, depth);
      case '[': return parseArray(out, depth);
      case '"':
        out.type = JsonValue::String;
        return parseString(out.string_val);
      case 't':
        out.type = JsonValue::Bool;
        out.bool_val = true;
        return consumeLiteral("true");
      case 'f':
        out.type = JsonValue::Bool;
        out.bool_val = false;
        return consumeLiteral("false");
      case 'n':
        out.type = JsonValue::Null;
        return consumeLiteral("null");
      default:
        return parseNumber(out);
    }
  }

  bool parseObject(JsonValue& out, int depth) {
    out.type = JsonValue::Object;
    ++pos_;  // skip '{'
    skipWhitespace();
    if (pos_ < length_ && json_[pos_] == '}') {
      ++pos_;
      return true;
    }
    while (true) {
      skipWhitespace();
      if (pos_ >= length_ || json_[pos_] != '"') return fail("expected object key");
      std::string name;
      if (!parseString(name)) return false;
      skipWhitespace();
      if (pos_ >= length_ || json_[pos_] != ':') return fail("expected ':'");
      ++pos_;
      JsonValue member;
      if (!parseValue(member, depth + 1)) return false;
      out.object_val.emplace_back(std::move(name), std::move(member));
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

  bool parseArray(JsonValue& out, int depth) {
    out.type = JsonValue::Array;
    ++pos_;  // skip '['
    skipWhitespace();
    if (pos_ < length_ && json_[pos_] == ']') {
      ++pos_;
      return true;
    }
    while (true) {
      JsonValue element;
      if (!parseValue(element, depth + 1)) return false;
      out.array_val.push_back(std::move(element));
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

  bool parseString(std::string& out) {
    ++pos_;  // skip opening quote
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
          case 'r':  out += '\r'; break;
          case 't':  out += '\t'; break;
          case 'u':
            if (!parseUnicodeEscape(out)) return false;
            break;
          default:
            return fail("invalid escape");
        }
      } else {
        out += chr;
      }
      ++pos_;
    }
    if (pos_ >= length_) return fail("unterminated string");
    ++pos_;  // skip closing quote
    return true;
  }

  // Basic Multilingual Plane only; surrogate pairs are encoded as-is.
  bool parseUnicodeEscape(std::string& out) {
    if (length_ - pos_ < 5) return fail("short unicode escape");
    unsigned code = 0;
    for (int idx = 1; idx <= 4; ++idx) {
      char hex = json_[pos_ + idx];
      code <<= 4;
      if (hex >= '0' && hex <= '9') {
        code |= static_cast<unsigned>(hex - '0');
      } else if (hex >= 'a' && hex <= 'f') {
        code |= static_cast<unsigned>(hex - 'a' + 10);
      } else if (hex >= 'A' && hex <= 'F') {
        code |= static_cast<unsigned>(hex - 'A' + 10);
      } else {
        return fail("invalid unicode escape");
      }
    }
    pos_ += 4;
    if (code < 0x80) {
      out += static_cast<char>(code);
    } else if (code < 0x800) {
      out += static_cast<char>(0xC0 | (code >> 6));
      out += static_cast<char>(0x80 | (code & 0x3F));
    } else {
      out += static_cast<char>(0xE0 | (code >> 12));
      out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (code & 0x3F));
    }
    return true;
  }

  bool parseNumber(JsonValue& out) {
    size_t start = pos_;
    if (pos_ < length_ && (json_[pos_] == '-' || json_[pos_] == '+')) ++pos_;
    while (pos_ < length_ &&
           (std::isdigit(static_cast<unsigned char>(json_[pos_])) || json_[pos_] == '.' ||
            json_[pos_] == 'e' || json_[pos_] == 'E' || json_[pos_] == '-' ||
            json_[pos_] == '+')) {
      ++pos_;
    }
    if (pos_ == start) return fail("unexpected character");

    std::string num_str(json_ + start, pos_ - start);
    char* end = nullptr;
    double parsed = std::strtod(num_str.c_str(), &end);
    if (end == num_str.c_str() || *end != '\0') {
      pos_ = start;
      return fail("malformed number");
    }
    out.type = JsonValue::Number;
    out.number_val = parsed;
    return true;
  }

  const char* json_;
  size_t length_;
  size_t pos_ = 0;
  std::string error_;
};

}  // namespace

JsonParseResult parseJson(const char* json, size_t length) {
  JsonParseResult result;
  if (!json || length == 0) {
    result.error_message = "empty document";
    return result;
  }
  Parser parser(json, length);
  result.success = parser.parseDocument(result.root);
  if (!result.success) {
    result.error_message = parser.error();
    result.error_offset = parser.offset();
    result.root = JsonValue();
  }
  return result;
}

std::map<std::string, JsonValue> parseJsonObject(const char* json, size_t length) {
  std::map<std::string, JsonValue> result;
  JsonParseResult parsed = parseJson(json, length);
  if (!parsed.success || !parsed.root.isObject()) return result;
  for (auto& member : parsed.root.object_val) {
    result[member.first] = std::move(member.second);
  }
  return result;
}

}  // namespace moodspace
