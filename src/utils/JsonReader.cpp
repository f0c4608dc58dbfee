/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <stdexcept>
#include <cmath>
#include <format>
#include <fstream>
#include <limits>
#include <sstream>

namespace ColonySim {

// JsonValue implementation
JsonType JsonValue::getType() const {
  if (isBool())
    return JsonType::Boolean;
  if (isNumber())
    return JsonType::Number;
  if (isString())
    return JsonType::String;
  if (isArray())
    return JsonType::Array;
  if (isObject())
    return JsonType::Object;
  return JsonType::Null;
}

std::optional<bool> JsonValue::tryAsBool() const {
  if (isBool())
    return asBool();
  return std::nullopt;
}

std::optional<double> JsonValue::tryAsNumber() const {
  if (isNumber())
    return asNumber();
  return std::nullopt;
}

std::optional<int> JsonValue::tryAsInt() const {
  if (!isNumber())
    return std::nullopt;
  const double value = asNumber();
  if (std::trunc(value) != value ||
      value < static_cast<double>(std::numeric_limits<int>::min()) ||
      value > static_cast<double>(std::numeric_limits<int>::max())) {
    return std::nullopt;
  }
  return static_cast<int>(value);
}

std::optional<std::string> JsonValue::tryAsString() const {
  if (isString())
    return asString();
  return std::nullopt;
}

const JsonObject *JsonValue::tryAsObject() const {
  if (isObject())
    return &asObject();
  return nullptr;
}

bool JsonValue::hasKey(const std::string &key) const {
  if (!isObject())
    return false;
  return asObject().contains(key);
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  static const JsonValue null_value;
  if (!isObject())
    return null_value;
  const auto &obj = asObject();
  auto it = obj.find(key);
  return (it != obj.end()) ? it->second : null_value;
}

const JsonValue &JsonValue::operator[](size_t index) const {
  static const JsonValue null_value;
  if (!isArray() || index >= asArray().size())
    return null_value;
  return asArray()[index];
}

size_t JsonValue::size() const {
  if (isArray())
    return asArray().size();
  if (isObject())
    return asObject().size();
  return 0;
}

// JsonReader implementation
bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path, std::ios::in | std::ios::binary);
  if (!file.is_open()) {
    m_lastError = std::format("Failed to open file: {}", path);
    return false;
  }

  std::ostringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    m_lastError = std::format("Failed to read file: {}", path);
    return false;
  }
  return parse(buffer.str());
}

bool JsonReader::parse(std::string_view jsonString) {
  m_input = jsonString;
  m_position = 0;
  m_line = 1;
  m_column = 1;
  m_lastError.clear();
  m_root = JsonValue{};

  skipWhitespace();
  if (atEnd()) {
    setError("Empty JSON document");
    return false;
  }

  auto value = parseValue(0);
  if (!value) {
    m_input = {};
    return false;
  }

  skipWhitespace();
  if (!atEnd()) {
    setError(std::format("Unexpected trailing character '{}'", peek()));
    m_input = {};
    return false;
  }

  m_root = std::move(*value);
  // The view may dangle once the caller's buffer goes away
  m_input = {};
  return true;
}

char JsonReader::peek() const {
  return atEnd() ? '\0' : m_input[m_position];
}

char JsonReader::advance() {
  if (atEnd()) {
    return '\0';
  }
  const char c = m_input[m_position++];
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
    const char c = peek();
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
      advance();
    } else {
      break;
    }
  }
}

bool JsonReader::expectLiteral(std::string_view literal) {
  if (m_input.substr(m_position, literal.size()) != literal) {
    setError(std::format("Invalid literal, expected '{}'", literal));
    return false;
  }
  for (size_t i = 0; i < literal.size(); ++i) {
    advance();
  }
  return true;
}

std::optional<JsonValue> JsonReader::parseValue(size_t depth) {
  skipWhitespace();
  const char next = peek();
  if ((next == '{' || next == '[') && depth >= MAX_DEPTH) {
    setError(std::format("Maximum nesting depth of {} exceeded", MAX_DEPTH));
    return std::nullopt;
  }

  switch (next) {
  case '{':
    return parseObject(depth + 1);
  case '[':
    return parseArray(depth + 1);
  case '"': {
    auto str = parseString();
    if (!str) {
      return std::nullopt;
    }
    return JsonValue(std::move(*str));
  }
  case 't':
    if (!expectLiteral("true")) {
      return std::nullopt;
    }
    return JsonValue(true);
  case 'f':
    if (!expectLiteral("false")) {
      return std::nullopt;
    }
    return JsonValue(false);
  case 'n':
    if (!expectLiteral("null")) {
      return std::nullopt;
    }
    return JsonValue{};
  case '\0':
    setError("Unexpected end of input");
    return std::nullopt;
  default:
    break;
  }

  const char c = peek();
  if (c == '-' || (c >= '0' && c <= '9')) {
    auto number = parseNumber();
    if (!number) {
      return std::nullopt;
    }
    return JsonValue(*number);
  }

  setError(std::format("Unexpected character '{}'", c));
  return std::nullopt;
}

std::optional<JsonValue> JsonReader::parseObject(size_t depth) {
  advance(); // {
  JsonObject object;

  skipWhitespace();
  if (peek() == '}') {
    advance();
    return JsonValue(std::move(object));
  }

  while (true) {
    skipWhitespace();
    if (peek() != '"') {
      setError("Expected string key in object");
      return std::nullopt;
    }
    auto key = parseString();
    if (!key) {
      return std::nullopt;
    }

    skipWhitespace();
    if (peek() != ':') {
      setError(std::format("Expected ':' after key \"{}\"", *key));
      return std::nullopt;
    }
    advance();

    auto value = parseValue(depth);
    if (!value) {
      return std::nullopt;
    }
    // Duplicate keys: last one wins
    object.insert_or_assign(std::move(*key), std::move(*value));

    skipWhitespace();
    const char c = advance();
    if (c == '}') {
      break;
    }
    if (c != ',') {
      setError("Expected ',' or '}' in object");
      return std::nullopt;
    }
  }

  return JsonValue(std::move(object));
}

std::optional<JsonValue> JsonReader::parseArray(size_t depth) {
  advance(); // [
  JsonArray array;

  skipWhitespace();
  if (peek() == ']') {
    advance();
    return JsonValue(std::move(array));
  }

  while (true) {
    auto value = parseValue(depth);
    if (!value) {
      return std::nullopt;
    }
    array.push_back(std::move(*value));

    skipWhitespace();
    const char c = advance();
    if (c == ']') {
      break;
    }
    if (c != ',') {
      setError("Expected ',' or ']' in array");
      return std::nullopt;
    }
  }

  return JsonValue(std::move(array));
}

std::optional<uint32_t> JsonReader::parseHex4() {
  uint32_t value = 0;
  for (int i = 0; i < 4; ++i) {
    const char c = advance();
    value <<= 4;
    if (c >= '0' && c <= '9') {
      value |= static_cast<uint32_t>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      value |= static_cast<uint32_t>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
      value |= static_cast<uint32_t>(c - 'A' + 10);
    } else {
      setError("Invalid unicode escape sequence");
      return std::nullopt;
    }
  }
  return value;
}

namespace {

void appendUtf8(std::string &out, uint32_t codepoint) {
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

} // anonymous namespace

std::optional<std::string> JsonReader::parseString() {
  advance(); // opening quote
  std::string result;

  while (true) {
    if (atEnd()) {
      setError("Unterminated string");
      return std::nullopt;
    }
    const char c = advance();
    if (c == '"') {
      break;
    }
    if (static_cast<unsigned char>(c) < 0x20) {
      setError("Unescaped control character in string");
      return std::nullopt;
    }
    if (c != '\\') {
      result += c;
      continue;
    }

    const char escape = advance();
    switch (escape) {
    case '"':  result += '"';  break;
    case '\\': result += '\\'; break;
    case '/':  result += '/';  break;
    case 'b':  result += '\b'; break;
    case 'f':  result += '\f'; break;
    case 'n':  result += '\n'; break;
    case 'r':  result += '\r'; break;
    case 't':  result += '\t'; break;
    case 'u': {
      auto high = parseHex4();
      if (!high) {
        return std::nullopt;
      }
      uint32_t codepoint = *high;
      if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
        // Surrogate pair
        if (advance() != '\\' || advance() != 'u') {
          setError("Unpaired high surrogate in string");
          return std::nullopt;
        }
        auto low = parseHex4();
        if (!low) {
          return std::nullopt;
        }
        if (*low < 0xDC00 || *low > 0xDFFF) {
          setError("Invalid low surrogate in string");
          return std::nullopt;
        }
        codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (*low - 0xDC00);
      } else if (codepoint >= 0xDC00 && codepoint <= 0xDFFF) {
        setError("Unpaired low surrogate in string");
        return std::nullopt;
      }
      appendUtf8(result, codepoint);
      break;
    }
    default:
      setError(std::format("Invalid escape sequence '\\{}'", escape));
      return std::nullopt;
    }
  }

  return result;
}

std::optional<double> JsonReader::parseNumber() {
  const size_t start = m_position;

  if (peek() == '-') {
    advance();
  }

  // Integer part: a single 0 or a non-zero digit followed by digits
  if (peek() == '0') {
    advance();
  } else if (peek() >= '1' && peek() <= '9') {
    while (peek() >= '0' && peek() <= '9') {
      advance();
    }
  } else {
    setError("Invalid number");
    return std::nullopt;
  }

  if (peek() == '.') {
    advance();
    if (!(peek() >= '0' && peek() <= '9')) {
      setError("Expected digit after decimal point");
      return std::nullopt;
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
      setError("Expected digit in exponent");
      return std::nullopt;
    }
    while (peek() >= '0' && peek() <= '9') {
      advance();
    }
  }

  const std::string text(m_input.substr(start, m_position - start));
  try {
    size_t consumed = 0;
    const double value = std::stod(text, &consumed);
    if (consumed != text.size() || !std::isfinite(value)) {
      setError(std::format("Number out of range: {}", text));
      return std::nullopt;
    }
    return value;
  } catch (const std::out_of_range &) {
    setError(std::format("Number out of range: {}", text));
    return std::nullopt;
  } catch (const std::invalid_argument &) {
    setError(std::format("Invalid number: {}", text));
    return std::nullopt;
  }
}

void JsonReader::setError(const std::string &message) {
  // Keep the first, innermost error
  if (m_lastError.empty()) {
    m_lastError = std::format("{} at line {}, column {}", message, m_line,
                              m_column);
  }
}

} // namespace ColonySim
