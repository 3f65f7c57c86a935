/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <ostream>
#include <sstream>

namespace Cosmic {

namespace {
const JsonValue &nullValue() {
  static const JsonValue s_null;
  return s_null;
}

bool isDigit(char c) { return c >= '0' && c <= '9'; }
} // namespace

const char *toString(JsonType type) {
  switch (type) {
  case JsonType::Null:
    return "Null";
  case JsonType::Boolean:
    return "Boolean";
  case JsonType::Number:
    return "Number";
  case JsonType::String:
    return "String";
  case JsonType::Array:
    return "Array";
  case JsonType::Object:
    return "Object";
  }
  return "Unknown";
}

std::ostream &operator<<(std::ostream &os, JsonType type) {
  return os << toString(type);
}

// JsonValue

std::optional<bool> JsonValue::tryAsBool() const {
  if (const bool *value = std::get_if<bool>(&m_value)) {
    return *value;
  }
  return std::nullopt;
}

std::optional<double> JsonValue::tryAsNumber() const {
  if (const double *value = std::get_if<double>(&m_value)) {
    return *value;
  }
  return std::nullopt;
}

std::optional<int> JsonValue::tryAsInt() const {
  const double *value = std::get_if<double>(&m_value);
  if (!value || std::floor(*value) != *value) {
    return std::nullopt;
  }
  // Whole numbers outside int range are not integers either
  if (*value < static_cast<double>(std::numeric_limits<int>::min()) ||
      *value > static_cast<double>(std::numeric_limits<int>::max())) {
    return std::nullopt;
  }
  return static_cast<int>(*value);
}

const std::string *JsonValue::tryAsString() const {
  return std::get_if<std::string>(&m_value);
}

const JsonArray *JsonValue::tryAsArray() const {
  return std::get_if<JsonArray>(&m_value);
}

const JsonObject *JsonValue::tryAsObject() const {
  return std::get_if<JsonObject>(&m_value);
}

const JsonValue *JsonValue::find(const std::string &key) const {
  const JsonObject *object = tryAsObject();
  if (!object) {
    return nullptr;
  }
  auto it = object->find(key);
  return it != object->end() ? &it->second : nullptr;
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  const JsonValue *value = find(key);
  return value ? *value : nullValue();
}

const JsonValue &JsonValue::operator[](size_t index) const {
  const JsonArray *array = tryAsArray();
  if (!array || index >= array->size()) {
    return nullValue();
  }
  return (*array)[index];
}

size_t JsonValue::size() const {
  if (const JsonArray *array = tryAsArray()) {
    return array->size();
  }
  if (const JsonObject *object = tryAsObject()) {
    return object->size();
  }
  return 0;
}

std::string JsonValue::toString() const {
  std::string out;
  write(out);
  return out;
}

void JsonValue::write(std::string &out) const {
  switch (getType()) {
  case JsonType::Null:
    out += "null";
    break;
  case JsonType::Boolean:
    out += asBool() ? "true" : "false";
    break;
  case JsonType::Number: {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.17g", asNumber());
    out += buffer;
    break;
  }
  case JsonType::String:
    out += '"';
    for (char c : asString()) {
      if (c == '"' || c == '\\') {
        out += '\\';
      }
      out += c;
    }
    out += '"';
    break;
  case JsonType::Array: {
    out += '[';
    bool first = true;
    for (const auto &element : asArray()) {
      if (!first) {
        out += ',';
      }
      first = false;
      element.write(out);
    }
    out += ']';
    break;
  }
  case JsonType::Object: {
    out += '{';
    bool first = true;
    for (const auto &[key, value] : asObject()) {
      if (!first) {
        out += ',';
      }
      first = false;
      out += '"';
      out += key;
      out += "\":";
      value.write(out);
    }
    out += '}';
    break;
  }
  }
}

// JsonReader

bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    m_root = JsonValue();
    m_lastError = "Could not open file: " + path;
    return false;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

bool JsonReader::parse(const std::string &jsonString) {
  clearError();
  m_input = jsonString;
  m_position = 0;
  m_line = 1;
  m_column = 1;

  JsonValue root;
  skipWhitespace();
  if (atEnd()) {
    m_root = JsonValue();
    return fail("Empty JSON input");
  }
  if (!parseValue(root, 0)) {
    m_root = JsonValue();
    return false;
  }
  skipWhitespace();
  if (!atEnd()) {
    m_root = JsonValue();
    return fail("Unexpected trailing characters");
  }

  m_root = std::move(root);
  return true;
}

bool JsonReader::fail(const std::string &message) {
  m_lastError = std::to_string(m_line) + ":" + std::to_string(m_column) +
                ": " + message;
  return false;
}

char JsonReader::peek() const {
  return atEnd() ? '\0' : m_input[m_position];
}

char JsonReader::advance() {
  if (atEnd()) {
    return '\0';
  }
  char c = m_input[m_position++];
  if (c == '\n') {
    ++m_line;
    m_column = 1;
  } else {
    ++m_column;
  }
  return c;
}

void JsonReader::skipWhitespace() {
  while (!atEnd()) {
    char c = peek();
    if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
      break;
    }
    advance();
  }
}

bool JsonReader::parseValue(JsonValue &out, int depth) {
  if (depth > MAX_DEPTH) {
    return fail("Maximum nesting depth exceeded");
  }

  skipWhitespace();
  switch (peek()) {
  case '{':
    return parseObject(out, depth);
  case '[':
    return parseArray(out, depth);
  case '"': {
    std::string text;
    if (!parseString(text)) {
      return false;
    }
    out = JsonValue(std::move(text));
    return true;
  }
  case 't':
    return parseLiteral("true", JsonValue(true), out);
  case 'f':
    return parseLiteral("false", JsonValue(false), out);
  case 'n':
    return parseLiteral("null", JsonValue(), out);
  case '\0':
    return fail("Unexpected end of input");
  default:
    if (peek() == '-' || isDigit(peek())) {
      return parseNumber(out);
    }
    return fail(std::string("Unexpected character '") + peek() + "'");
  }
}

bool JsonReader::parseObject(JsonValue &out, int depth) {
  advance(); // '{'
  JsonObject object;

  skipWhitespace();
  if (peek() == '}') {
    advance();
    out = JsonValue(std::move(object));
    return true;
  }

  while (true) {
    skipWhitespace();
    if (peek() != '"') {
      return fail("Expected string key in object");
    }
    std::string key;
    if (!parseString(key)) {
      return false;
    }

    skipWhitespace();
    if (advance() != ':') {
      return fail("Expected ':' after object key \"" + key + "\"");
    }

    JsonValue value;
    if (!parseValue(value, depth + 1)) {
      return false;
    }
    // Last duplicate wins
    object[key] = std::move(value);

    skipWhitespace();
    char c = advance();
    if (c == '}') {
      break;
    }
    if (c != ',') {
      return fail("Expected ',' or '}' in object");
    }
  }

  out = JsonValue(std::move(object));
  return true;
}

bool JsonReader::parseArray(JsonValue &out, int depth) {
  advance(); // '['
  JsonArray array;

  skipWhitespace();
  if (peek() == ']') {
    advance();
    out = JsonValue(std::move(array));
    return true;
  }

  while (true) {
    JsonValue element;
    if (!parseValue(element, depth + 1)) {
      return false;
    }
    array.push_back(std::move(element));

    skipWhitespace();
    char c = advance();
    if (c == ']') {
      break;
    }
    if (c != ',') {
      return fail("Expected ',' or ']' in array");
    }
  }

  out = JsonValue(std::move(array));
  return true;
}

bool JsonReader::parseString(std::string &out) {
  advance(); // opening quote

  while (!atEnd()) {
    char c = advance();

    if (c == '"') {
      return true;
    }

    if (static_cast<unsigned char>(c) < 0x20) {
      return fail("Unescaped control character in string");
    }

    if (c != '\\') {
      out += c;
      continue;
    }

    char escaped = advance();
    switch (escaped) {
    case '"':
    case '\\':
    case '/':
      out += escaped;
      break;
    case 'b':
      out += '\b';
      break;
    case 'f':
      out += '\f';
      break;
    case 'n':
      out += '\n';
      break;
    case 'r':
      out += '\r';
      break;
    case 't':
      out += '\t';
      break;
    case 'u': {
      uint32_t codePoint = 0;
      if (!parseUnicodeEscape(codePoint)) {
        return false;
      }
      appendUtf8(out, codePoint);
      break;
    }
    case '\0':
      return fail("Unexpected end of input in string escape");
    default:
      return fail(std::string("Invalid escape sequence: \\") + escaped);
    }
  }

  return fail("Unterminated string");
}

bool JsonReader::parseUnicodeEscape(uint32_t &codePoint) {
  codePoint = 0;
  for (int i = 0; i < 4; ++i) {
    char c = peek();
    uint32_t digit;
    if (c >= '0' && c <= '9') {
      digit = static_cast<uint32_t>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      digit = static_cast<uint32_t>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
      digit = static_cast<uint32_t>(c - 'A' + 10);
    } else {
      return fail("Invalid Unicode escape sequence");
    }
    advance();
    codePoint = (codePoint << 4) | digit;
  }
  return true;
}

void JsonReader::appendUtf8(std::string &out, uint32_t codePoint) {
  if (codePoint <= 0x7F) {
    out += static_cast<char>(codePoint);
  } else if (codePoint <= 0x7FF) {
    out += static_cast<char>(0xC0 | (codePoint >> 6));
    out += static_cast<char>(0x80 | (codePoint & 0x3F));
  } else {
    out += static_cast<char>(0xE0 | (codePoint >> 12));
    out += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codePoint & 0x3F));
  }
}

bool JsonReader::parseNumber(JsonValue &out) {
  const size_t start = m_position;

  if (peek() == '-') {
    advance();
  }

  if (peek() == '0') {
    advance();
  } else if (isDigit(peek())) {
    while (isDigit(peek())) {
      advance();
    }
  } else {
    return fail("Invalid number format");
  }

  if (peek() == '.') {
    advance();
    if (!isDigit(peek())) {
      return fail("Invalid number format: expected digit after decimal point");
    }
    while (isDigit(peek())) {
      advance();
    }
  }

  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-') {
      advance();
    }
    if (!isDigit(peek())) {
      return fail("Invalid number format: expected digit in exponent");
    }
    while (isDigit(peek())) {
      advance();
    }
  }

  const std::string text = m_input.substr(start, m_position - start);
  const double value = std::strtod(text.c_str(), nullptr);
  if (!std::isfinite(value)) {
    return fail("Number out of range: " + text);
  }
  out = JsonValue(value);
  return true;
}

bool JsonReader::parseLiteral(const char *word, JsonValue value,
                              JsonValue &out) {
  for (const char *p = word; *p; ++p) {
    if (peek() != *p) {
      return fail(std::string("Invalid literal, expected '") + word + "'");
    }
    advance();
  }
  out = std::move(value);
  return true;
}

} // namespace Cosmic
