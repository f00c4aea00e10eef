/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace VanguardEngine {

namespace {
const JsonValue &nullValue() {
  static const JsonValue s_null;
  return s_null;
}

constexpr int MAX_NESTING_DEPTH = 64;

void writeEscaped(std::ostream &stream, const std::string &text) {
  stream << '"';
  for (char c : text) {
    switch (c) {
    case '"':
      stream << "\\\"";
      break;
    case '\\':
      stream << "\\\\";
      break;
    case '\n':
      stream << "\\n";
      break;
    case '\r':
      stream << "\\r";
      break;
    case '\t':
      stream << "\\t";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        static const char *hex = "0123456789abcdef";
        stream << "\\u00" << hex[(c >> 4) & 0xF] << hex[c & 0xF];
      } else {
        stream << c;
      }
    }
  }
  stream << '"';
}
} // namespace

// ---------------------------------------------------------------------------
// JsonValue
// ---------------------------------------------------------------------------

JsonType JsonValue::getType() const {
  return static_cast<JsonType>(m_value.index());
}

std::optional<bool> JsonValue::tryAsBool() const {
  if (const auto *v = std::get_if<bool>(&m_value)) {
    return *v;
  }
  return std::nullopt;
}

std::optional<double> JsonValue::tryAsNumber() const {
  if (const auto *v = std::get_if<double>(&m_value)) {
    return *v;
  }
  return std::nullopt;
}

std::optional<int> JsonValue::tryAsInt() const {
  if (const auto *v = std::get_if<double>(&m_value)) {
    return static_cast<int>(*v);
  }
  return std::nullopt;
}

std::optional<std::string> JsonValue::tryAsString() const {
  if (const auto *v = std::get_if<std::string>(&m_value)) {
    return *v;
  }
  return std::nullopt;
}

const JsonArray *JsonValue::tryAsArray() const {
  return std::get_if<JsonArray>(&m_value);
}

const JsonObject *JsonValue::tryAsObject() const {
  return std::get_if<JsonObject>(&m_value);
}

double JsonValue::getNumber(const std::string &key, double fallback) const {
  return (*this)[key].tryAsNumber().value_or(fallback);
}

int JsonValue::getInt(const std::string &key, int fallback) const {
  return (*this)[key].tryAsInt().value_or(fallback);
}

bool JsonValue::getBool(const std::string &key, bool fallback) const {
  return (*this)[key].tryAsBool().value_or(fallback);
}

std::string JsonValue::getString(const std::string &key,
                                 const std::string &fallback) const {
  return (*this)[key].tryAsString().value_or(fallback);
}

bool JsonValue::hasKey(const std::string &key) const {
  const auto *obj = tryAsObject();
  return obj && obj->find(key) != obj->end();
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  const auto *obj = tryAsObject();
  if (!obj) {
    return nullValue();
  }
  auto it = obj->find(key);
  return it != obj->end() ? it->second : nullValue();
}

JsonValue &JsonValue::operator[](const std::string &key) {
  if (isNull()) {
    m_value = JsonObject{};
  }
  return asObject()[key];
}

const JsonValue &JsonValue::operator[](size_t index) const {
  const auto *arr = tryAsArray();
  if (!arr || index >= arr->size()) {
    return nullValue();
  }
  return (*arr)[index];
}

size_t JsonValue::size() const {
  if (const auto *arr = tryAsArray()) {
    return arr->size();
  }
  if (const auto *obj = tryAsObject()) {
    return obj->size();
  }
  return 0;
}

std::string JsonValue::toString() const {
  std::ostringstream stream;
  writeToStream(stream);
  return stream.str();
}

void JsonValue::writeToStream(std::ostream &stream) const {
  switch (getType()) {
  case JsonType::Null:
    stream << "null";
    break;
  case JsonType::Boolean:
    stream << (asBool() ? "true" : "false");
    break;
  case JsonType::Number: {
    double num = asNumber();
    if (std::floor(num) == num && std::abs(num) < 1e15) {
      stream << static_cast<long long>(num);
    } else {
      stream << num;
    }
    break;
  }
  case JsonType::String:
    writeEscaped(stream, asString());
    break;
  case JsonType::Array: {
    stream << '[';
    const auto &arr = asArray();
    for (size_t i = 0; i < arr.size(); ++i) {
      if (i > 0)
        stream << ',';
      arr[i].writeToStream(stream);
    }
    stream << ']';
    break;
  }
  case JsonType::Object: {
    stream << '{';
    bool first = true;
    for (const auto &[key, value] : asObject()) {
      if (!first)
        stream << ',';
      first = false;
      writeEscaped(stream, key);
      stream << ':';
      value.writeToStream(stream);
    }
    stream << '}';
    break;
  }
  }
}

// ---------------------------------------------------------------------------
// JsonReader
// ---------------------------------------------------------------------------

bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    m_root = JsonValue();
    m_lastError = "Failed to open file: " + path;
    return false;
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

bool JsonReader::parse(const std::string &jsonString) {
  m_input = jsonString;
  m_position = 0;
  m_line = 1;
  m_column = 1;
  m_lastError.clear();
  m_root = JsonValue();

  JsonValue result;
  skipWhitespace();
  if (!parseValue(result, 0)) {
    m_root = JsonValue();
    return false;
  }
  skipWhitespace();
  if (!atEnd()) {
    fail("Unexpected trailing characters");
    m_root = JsonValue();
    return false;
  }
  m_root = std::move(result);
  return true;
}

char JsonReader::peek() const { return atEnd() ? '\0' : m_input[m_position]; }

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

bool JsonReader::fail(const std::string &message) {
  m_lastError = message + " at line " + std::to_string(m_line) + ", column " +
                std::to_string(m_column);
  return false;
}

bool JsonReader::parseValue(JsonValue &out, int depth) {
  if (depth > MAX_NESTING_DEPTH) {
    return fail("Maximum nesting depth exceeded");
  }
  switch (peek()) {
  case '{':
    return parseObject(out, depth + 1);
  case '[':
    return parseArray(out, depth + 1);
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
    if (peek() == '-' || (peek() >= '0' && peek() <= '9')) {
      return parseNumber(out);
    }
    return fail(std::string("Unexpected character '") + peek() + "'");
  }
}

bool JsonReader::parseObject(JsonValue &out, int depth) {
  advance(); // {
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
      return fail("Expected ':' after object key");
    }
    skipWhitespace();
    JsonValue value;
    if (!parseValue(value, depth)) {
      return false;
    }
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
  advance(); // [
  JsonArray array;
  skipWhitespace();
  if (peek() == ']') {
    advance();
    out = JsonValue(std::move(array));
    return true;
  }

  while (true) {
    skipWhitespace();
    JsonValue value;
    if (!parseValue(value, depth)) {
      return false;
    }
    array.push_back(std::move(value));

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
  out.clear();
  while (true) {
    if (atEnd()) {
      return fail("Unterminated string");
    }
    char c = advance();
    if (c == '"') {
      return true;
    }
    if (static_cast<unsigned char>(c) < 0x20) {
      return fail("Control character in string");
    }
    if (c != '\\') {
      out += c;
      continue;
    }
    char escaped = advance();
    switch (escaped) {
    case '"':
      out += '"';
      break;
    case '\\':
      out += '\\';
      break;
    case '/':
      out += '/';
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
    case 'u':
      if (!parseUnicodeEscape(out)) {
        return false;
      }
      break;
    default:
      return fail("Invalid escape sequence");
    }
  }
}

bool JsonReader::parseUnicodeEscape(std::string &out) {
  uint32_t codepoint = 0;
  for (int i = 0; i < 4; ++i) {
    char h = advance();
    codepoint <<= 4;
    if (h >= '0' && h <= '9') {
      codepoint |= static_cast<uint32_t>(h - '0');
    } else if (h >= 'a' && h <= 'f') {
      codepoint |= static_cast<uint32_t>(h - 'a' + 10);
    } else if (h >= 'A' && h <= 'F') {
      codepoint |= static_cast<uint32_t>(h - 'A' + 10);
    } else {
      return fail("Invalid unicode escape");
    }
  }

  // UTF-8 encode (surrogate pairs are kept as individual code units)
  if (codepoint < 0x80) {
    out += static_cast<char>(codepoint);
  } else if (codepoint < 0x800) {
    out += static_cast<char>(0xC0 | (codepoint >> 6));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else {
    out += static_cast<char>(0xE0 | (codepoint >> 12));
    out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  }
  return true;
}

bool JsonReader::parseNumber(JsonValue &out) {
  const size_t start = m_position;
  if (peek() == '-') {
    advance();
  }
  if (!(peek() >= '0' && peek() <= '9')) {
    return fail("Invalid number");
  }
  while (peek() >= '0' && peek() <= '9') {
    advance();
  }
  if (peek() == '.') {
    advance();
    if (!(peek() >= '0' && peek() <= '9')) {
      return fail("Expected digit after decimal point");
    }
    while (peek() >= '0' && peek() <= '9') {
      advance();
    }
  }
  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-') {
      advance();
    }
    if (!(peek() >= '0' && peek() <= '9')) {
      return fail("Expected digit in exponent");
    }
    while (peek() >= '0' && peek() <= '9') {
      advance();
    }
  }

  const std::string text = m_input.substr(start, m_position - start);
  out = JsonValue(std::strtod(text.c_str(), nullptr));
  return true;
}

bool JsonReader::parseLiteral(const char *literal, JsonValue value,
                              JsonValue &out) {
  for (const char *p = literal; *p != '\0'; ++p) {
    if (advance() != *p) {
      return fail(std::string("Invalid literal, expected '") + literal + "'");
    }
  }
  out = std::move(value);
  return true;
}

} // namespace VanguardEngine
