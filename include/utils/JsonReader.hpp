/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef JSONREADER_HPP
#define JSONREADER_HPP

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace SneakEngine {

class JsonValue;

// Ordered so dumps and saved files are stable between runs
using JsonObject = std::map<std::string, JsonValue>;
using JsonArray = std::vector<JsonValue>;

enum class JsonType { Null, Boolean, Number, String, Array, Object };

const char* jsonTypeName(JsonType type);
std::ostream& operator<<(std::ostream& os, JsonType type);

/**
 * @brief A parsed JSON document node.
 *
 * Used for level files, settings files and as the value type of entity
 * property records. Numbers are stored as double; asInt() truncates.
 */
class JsonValue {
public:
  using ValueType = std::variant<std::nullptr_t, bool, double, std::string,
                                 JsonArray, JsonObject>;

  JsonValue() : m_value(nullptr) {}
  explicit JsonValue(std::nullptr_t) : m_value(nullptr) {}
  explicit JsonValue(bool value) : m_value(value) {}
  explicit JsonValue(int value) : m_value(static_cast<double>(value)) {}
  explicit JsonValue(double value) : m_value(value) {}
  explicit JsonValue(const std::string& value) : m_value(value) {}
  explicit JsonValue(std::string&& value) : m_value(std::move(value)) {}
  explicit JsonValue(const char* value) : m_value(std::string(value)) {}
  explicit JsonValue(const JsonArray& value) : m_value(value) {}
  explicit JsonValue(JsonArray&& value) : m_value(std::move(value)) {}
  explicit JsonValue(const JsonObject& value) : m_value(value) {}
  explicit JsonValue(JsonObject&& value) : m_value(std::move(value)) {}

  [[nodiscard]] JsonType getType() const noexcept {
    return static_cast<JsonType>(m_value.index());
  }
  bool isNull() const { return std::holds_alternative<std::nullptr_t>(m_value); }
  bool isBool() const { return std::holds_alternative<bool>(m_value); }
  bool isNumber() const { return std::holds_alternative<double>(m_value); }
  bool isInteger() const;
  bool isString() const { return std::holds_alternative<std::string>(m_value); }
  bool isArray() const { return std::holds_alternative<JsonArray>(m_value); }
  bool isObject() const { return std::holds_alternative<JsonObject>(m_value); }

  // Throw std::bad_variant_access on a type mismatch
  bool asBool() const { return std::get<bool>(m_value); }
  double asNumber() const { return std::get<double>(m_value); }
  int asInt() const { return static_cast<int>(std::get<double>(m_value)); }
  const std::string& asString() const { return std::get<std::string>(m_value); }
  const JsonArray& asArray() const { return std::get<JsonArray>(m_value); }
  const JsonObject& asObject() const { return std::get<JsonObject>(m_value); }
  JsonArray& asArray() { return std::get<JsonArray>(m_value); }
  JsonObject& asObject() { return std::get<JsonObject>(m_value); }

  std::optional<bool> tryAsBool() const;
  std::optional<double> tryAsNumber() const;
  std::optional<int> tryAsInt() const;
  std::optional<std::string> tryAsString() const;
  const JsonArray* tryAsArray() const;
  const JsonObject* tryAsObject() const;

  bool hasKey(const std::string& key) const;
  // nullptr when this is not an object or the key is absent
  const JsonValue* find(const std::string& key) const;

  // Missing keys / out-of-range indices yield a shared null value
  const JsonValue& operator[](const std::string& key) const;
  JsonValue& operator[](const std::string& key);
  const JsonValue& operator[](size_t index) const;

  size_t size() const;

  // Compact single-line form
  std::string toString() const;
  // Indented form used when writing files
  std::string toPrettyString(int indent = 2) const;

  friend bool operator==(const JsonValue& a, const JsonValue& b) {
    return a.m_value == b.m_value;
  }

private:
  void write(std::string& out, int indent, int depth) const;

  ValueType m_value;
};

/**
 * @brief Strict RFC 8259 reader.
 *
 * Errors are reported through the boolean return and getLastError(), which
 * carries the line and column of the offending character.
 */
class JsonReader {
public:
  JsonReader() = default;

  bool loadFromFile(const std::string& path);
  bool parse(std::string_view jsonText);

  const JsonValue& getRoot() const { return m_root; }
  const std::string& getLastError() const { return m_lastError; }
  void clearError() { m_lastError.clear(); }

private:
  static constexpr int MAX_DEPTH = 256;

  class Cursor {
  public:
    explicit Cursor(std::string_view text) : m_text(text) {}

    bool atEnd() const { return m_pos >= m_text.size(); }
    char peek() const { return atEnd() ? '\0' : m_text[m_pos]; }
    char next();
    bool consume(char expected);
    bool consumeWord(std::string_view word);
    void skipWhitespace();
    size_t line() const { return m_line; }
    size_t column() const { return m_column; }

  private:
    std::string_view m_text;
    size_t m_pos{0};
    size_t m_line{1};
    size_t m_column{1};
  };

  bool parseValue(Cursor& cur, JsonValue& out, int depth);
  bool parseObject(Cursor& cur, JsonValue& out, int depth);
  bool parseArray(Cursor& cur, JsonValue& out, int depth);
  bool parseString(Cursor& cur, std::string& out);
  bool parseNumber(Cursor& cur, JsonValue& out);
  bool parseHex4(Cursor& cur, uint32_t& out);
  bool fail(const Cursor& cur, std::string_view message);

  std::string m_lastError;
  JsonValue m_root;
};

} // namespace SneakEngine

#endif // JSONREADER_HPP
