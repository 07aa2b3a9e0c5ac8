/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"

#include <charconv>
#include <cmath>
#include <format>
#include <fstream>
#include <iterator>
#include <ostream>

namespace SneakEngine {

namespace {
const JsonValue& nullValue() {
  static const JsonValue s_null;
  return s_null;
}

void appendUtf8(std::string& out, uint32_t codepoint) {
  if (codepoint < 0x80) {
    out += static_cast<char>(codepoint);
  } else if (codepoint < 0x800) {
    out += static_cast<char>(0xC0 | (codepoint >> 6));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else if (codepoint < 0x10000) {
    out += static_cast<char>(0xE0 | (codepoint >> 12));
    out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (codepoint >> 18));
    out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  }
}

void appendQuoted(std::string& out, const std::string& text) {
  out += '"';
  for (char c : text) {
    switch (c) {
    case '"': out += "\\\""; break;
    case '\\': out += "\\\\"; break;
    case '\b': out += "\\b"; break;
    case '\f': out += "\\f"; break;
    case '\n': out += "\\n"; break;
    case '\r': out += "\\r"; break;
    case '\t': out += "\\t"; break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        out += std::format("\\u{:04x}", static_cast<unsigned>(c));
      } else {
        out += c;
      }
    }
  }
  out += '"';
}

void appendNumber(std::string& out, double value) {
  if (!std::isfinite(value)) {
    out += "null";
  } else if (value == std::trunc(value) && std::fabs(value) < 1e15) {
    out += std::format("{}", static_cast<long long>(value));
  } else {
    out += std::format("{}", value);
  }
}
} // namespace

const char* jsonTypeName(JsonType type) {
  switch (type) {
  case JsonType::Null: return "null";
  case JsonType::Boolean: return "boolean";
  case JsonType::Number: return "number";
  case JsonType::String: return "string";
  case JsonType::Array: return "array";
  case JsonType::Object: return "object";
  }
  return "unknown";
}

std::ostream& operator<<(std::ostream& os, JsonType type) {
  return os << jsonTypeName(type);
}

// ---------------------------------------------------------------- JsonValue

bool JsonValue::isInteger() const {
  const double* number = std::get_if<double>(&m_value);
  return number != nullptr && std::isfinite(*number) && *number == std::trunc(*number);
}

std::optional<bool> JsonValue::tryAsBool() const {
  if (const bool* v = std::get_if<bool>(&m_value)) {
    return *v;
  }
  return std::nullopt;
}

std::optional<double> JsonValue::tryAsNumber() const {
  if (const double* v = std::get_if<double>(&m_value)) {
    return *v;
  }
  return std::nullopt;
}

std::optional<int> JsonValue::tryAsInt() const {
  if (const double* v = std::get_if<double>(&m_value)) {
    return static_cast<int>(*v);
  }
  return std::nullopt;
}

std::optional<std::string> JsonValue::tryAsString() const {
  if (const std::string* v = std::get_if<std::string>(&m_value)) {
    return *v;
  }
  return std::nullopt;
}

const JsonArray* JsonValue::tryAsArray() const {
  return std::get_if<JsonArray>(&m_value);
}

const JsonObject* JsonValue::tryAsObject() const {
  return std::get_if<JsonObject>(&m_value);
}

bool JsonValue::hasKey(const std::string& key) const {
  return find(key) != nullptr;
}

const JsonValue* JsonValue::find(const std::string& key) const {
  const JsonObject* obj = tryAsObject();
  if (obj == nullptr) {
    return nullptr;
  }
  auto it = obj->find(key);
  return it == obj->end() ? nullptr : &it->second;
}

const JsonValue& JsonValue::operator[](const std::string& key) const {
  const JsonValue* v = find(key);
  return v != nullptr ? *v : nullValue();
}

// Write access: a non-object value is replaced by an empty object
JsonValue& JsonValue::operator[](const std::string& key) {
  if (!isObject()) {
    m_value = JsonObject{};
  }
  return asObject()[key];
}

const JsonValue& JsonValue::operator[](size_t index) const {
  const JsonArray* arr = tryAsArray();
  if (arr == nullptr || index >= arr->size()) {
    return nullValue();
  }
  return (*arr)[index];
}

size_t JsonValue::size() const {
  if (const JsonArray* arr = tryAsArray()) {
    return arr->size();
  }
  if (const JsonObject* obj = tryAsObject()) {
    return obj->size();
  }
  return 0;
}

std::string JsonValue::toString() const {
  std::string out;
  write(out, 0, 0);
  return out;
}

std::string JsonValue::toPrettyString(int indent) const {
  std::string out;
  write(out, indent, 0);
  out += '\n';
  return out;
}

void JsonValue::write(std::string& out, int indent, int depth) const {
  const bool pretty = indent > 0;
  auto newline = [&](int level) {
    if (pretty) {
      out += '\n';
      out.append(static_cast<size_t>(level * indent), ' ');
    }
  };

  switch (getType()) {
  case JsonType::Null:
    out += "null";
    break;
  case JsonType::Boolean:
    out += asBool() ? "true" : "false";
    break;
  case JsonType::Number:
    appendNumber(out, asNumber());
    break;
  case JsonType::String:
    appendQuoted(out, asString());
    break;
  case JsonType::Array: {
    const JsonArray& arr = asArray();
    out += '[';
    for (size_t i = 0; i < arr.size(); ++i) {
      if (i > 0) {
        out += pretty ? "," : ", ";
      }
      newline(depth + 1);
      arr[i].write(out, indent, depth + 1);
    }
    if (!arr.empty()) {
      newline(depth);
    }
    out += ']';
    break;
  }
  case JsonType::Object: {
    const JsonObject& obj = asObject();
    out += '{';
    bool first = true;
    for (const auto& [key, value] : obj) {
      if (!first) {
        out += pretty ? "," : ", ";
      }
      first = false;
      newline(depth + 1);
      appendQuoted(out, key);
      out += ": ";
      value.write(out, indent, depth + 1);
    }
    if (!obj.empty()) {
      newline(depth);
    }
    out += '}';
    break;
  }
  }
}

// --------------------------------------------------------------- JsonReader

char JsonReader::Cursor::next() {
  if (atEnd()) {
    return '\0';
  }
  char c = m_text[m_pos++];
  if (c == '\n') {
    ++m_line;
    m_column = 1;
  } else {
    ++m_column;
  }
  return c;
}

bool JsonReader::Cursor::consume(char expected) {
  if (peek() != expected || atEnd()) {
    return false;
  }
  next();
  return true;
}

bool JsonReader::Cursor::consumeWord(std::string_view word) {
  if (m_text.substr(m_pos, word.size()) != word) {
    return false;
  }
  for (size_t i = 0; i < word.size(); ++i) {
    next();
  }
  return true;
}

void JsonReader::Cursor::skipWhitespace() {
  while (!atEnd()) {
    char c = peek();
    if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
      break;
    }
    next();
  }
}

bool JsonReader::loadFromFile(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    m_lastError = "Could not open file: " + path;
    return false;
  }
  std::string content((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());
  return parse(content);
}

bool JsonReader::parse(std::string_view jsonText) {
  m_lastError.clear();
  m_root = JsonValue();

  Cursor cur(jsonText);
  cur.skipWhitespace();
  if (cur.atEnd()) {
    return fail(cur, "Empty document");
  }

  JsonValue root;
  if (!parseValue(cur, root, 0)) {
    return false;
  }

  cur.skipWhitespace();
  if (!cur.atEnd()) {
    return fail(cur, "Unexpected trailing content");
  }

  m_root = std::move(root);
  return true;
}

bool JsonReader::parseValue(Cursor& cur, JsonValue& out, int depth) {
  if (depth > MAX_DEPTH) {
    return fail(cur, "Nesting too deep");
  }

  cur.skipWhitespace();
  switch (cur.peek()) {
  case '{':
    return parseObject(cur, out, depth + 1);
  case '[':
    return parseArray(cur, out, depth + 1);
  case '"': {
    std::string text;
    if (!parseString(cur, text)) {
      return false;
    }
    out = JsonValue(std::move(text));
    return true;
  }
  case 't':
    if (cur.consumeWord("true")) {
      out = JsonValue(true);
      return true;
    }
    break;
  case 'f':
    if (cur.consumeWord("false")) {
      out = JsonValue(false);
      return true;
    }
    break;
  case 'n':
    if (cur.consumeWord("null")) {
      out = JsonValue();
      return true;
    }
    break;
  default:
    if (cur.peek() == '-' || (cur.peek() >= '0' && cur.peek() <= '9')) {
      return parseNumber(cur, out);
    }
    break;
  }

  if (cur.atEnd()) {
    return fail(cur, "Unexpected end of input");
  }
  return fail(cur, std::format("Unexpected character '{}'", cur.peek()));
}

bool JsonReader::parseObject(Cursor& cur, JsonValue& out, int depth) {
  cur.next(); // '{'
  JsonObject obj;

  cur.skipWhitespace();
  if (cur.consume('}')) {
    out = JsonValue(std::move(obj));
    return true;
  }

  while (true) {
    cur.skipWhitespace();
    if (cur.peek() != '"') {
      return fail(cur, "Expected string key in object");
    }
    std::string key;
    if (!parseString(cur, key)) {
      return false;
    }

    cur.skipWhitespace();
    if (!cur.consume(':')) {
      return fail(cur, "Expected ':' after object key");
    }

    JsonValue value;
    if (!parseValue(cur, value, depth)) {
      return false;
    }
    // Last duplicate wins, as in most readers
    obj[std::move(key)] = std::move(value);

    cur.skipWhitespace();
    if (cur.consume('}')) {
      break;
    }
    if (!cur.consume(',')) {
      return fail(cur, "Expected ',' or '}' in object");
    }
  }

  out = JsonValue(std::move(obj));
  return true;
}

bool JsonReader::parseArray(Cursor& cur, JsonValue& out, int depth) {
  cur.next(); // '['
  JsonArray arr;

  cur.skipWhitespace();
  if (cur.consume(']')) {
    out = JsonValue(std::move(arr));
    return true;
  }

  while (true) {
    JsonValue element;
    if (!parseValue(cur, element, depth)) {
      return false;
    }
    arr.push_back(std::move(element));

    cur.skipWhitespace();
    if (cur.consume(']')) {
      break;
    }
    if (!cur.consume(',')) {
      return fail(cur, "Expected ',' or ']' in array");
    }
  }

  out = JsonValue(std::move(arr));
  return true;
}

bool JsonReader::parseHex4(Cursor& cur, uint32_t& out) {
  out = 0;
  for (int i = 0; i < 4; ++i) {
    char c = cur.next();
    out <<= 4;
    if (c >= '0' && c <= '9') {
      out |= static_cast<uint32_t>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      out |= static_cast<uint32_t>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
      out |= static_cast<uint32_t>(c - 'A' + 10);
    } else {
      return fail(cur, "Invalid unicode escape");
    }
  }
  return true;
}

bool JsonReader::parseString(Cursor& cur, std::string& out) {
  cur.next(); // opening quote
  out.clear();

  while (true) {
    if (cur.atEnd()) {
      return fail(cur, "Unterminated string");
    }
    char c = cur.next();
    if (c == '"') {
      return true;
    }
    if (static_cast<unsigned char>(c) < 0x20) {
      return fail(cur, "Control character in string");
    }
    if (c != '\\') {
      out += c;
      continue;
    }

    char esc = cur.next();
    switch (esc) {
    case '"': out += '"'; break;
    case '\\': out += '\\'; break;
    case '/': out += '/'; break;
    case 'b': out += '\b'; break;
    case 'f': out += '\f'; break;
    case 'n': out += '\n'; break;
    case 'r': out += '\r'; break;
    case 't': out += '\t'; break;
    case 'u': {
      uint32_t codepoint = 0;
      if (!parseHex4(cur, codepoint)) {
        return false;
      }
      if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
        uint32_t low = 0;
        if (!cur.consumeWord("\\u") || !parseHex4(cur, low) ||
            low < 0xDC00 || low > 0xDFFF) {
          return fail(cur, "Invalid surrogate pair");
        }
        codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
      }
      appendUtf8(out, codepoint);
      break;
    }
    default:
      return fail(cur, "Invalid escape sequence");
    }
  }
}

bool JsonReader::parseNumber(Cursor& cur, JsonValue& out) {
  std::string text;
  auto takeDigits = [&]() {
    size_t count = 0;
    while (cur.peek() >= '0' && cur.peek() <= '9' && !cur.atEnd()) {
      text += cur.next();
      ++count;
    }
    return count;
  };

  if (cur.peek() == '-') {
    text += cur.next();
  }
  if (cur.peek() == '0') {
    text += cur.next();
    if (cur.peek() >= '0' && cur.peek() <= '9') {
      return fail(cur, "Leading zeros are not allowed");
    }
  } else if (takeDigits() == 0) {
    return fail(cur, "Expected digit");
  }

  if (cur.peek() == '.') {
    text += cur.next();
    if (takeDigits() == 0) {
      return fail(cur, "Expected digit after decimal point");
    }
  }

  if (cur.peek() == 'e' || cur.peek() == 'E') {
    text += cur.next();
    if (cur.peek() == '+' || cur.peek() == '-') {
      text += cur.next();
    }
    if (takeDigits() == 0) {
      return fail(cur, "Expected digit in exponent");
    }
  }

  double value = 0.0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return fail(cur, "Invalid number '" + text + "'");
  }
  out = JsonValue(value);
  return true;
}

bool JsonReader::fail(const Cursor& cur, std::string_view message) {
  if (m_lastError.empty()) {
    m_lastError = std::format("Line {}, Column {}: {}", cur.line(), cur.column(), message);
  }
  return false;
}

} // namespace SneakEngine
