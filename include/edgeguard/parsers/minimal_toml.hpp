// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of EdgeGuard, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

/// \file minimal_toml.hpp
/// \brief Reader for the TOML subset used by EdgeGuard configuration files.
///
/// Supported: [section] and [dotted.section] headers, bare keys, basic and
/// literal strings, multi-line basic (""") and literal (''') strings, integers,
/// booleans, arrays (nesting allowed) and # comments. Floats, dates and inline
/// tables are rejected.

#include <cctype>
#include <cstdint>
#include <fstream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace edgeguard
{
namespace parsers
{
namespace toml
{

class table;
class array;

using value_type =
  std::variant<std::monostate, std::int64_t, bool, std::string, std::shared_ptr<table>,
               std::shared_ptr<array>>;

/// \brief Raised for malformed TOML input; carries the 1-based line number.
class parse_error : public std::runtime_error
{
public:
  parse_error(const std::string &what, std::size_t line)
      : std::runtime_error("TOML line " + std::to_string(line) + ": " + what), _line(line)
  {
  }

  std::size_t line() const { return _line; }

private:
  std::size_t _line;
};

class array
{
public:
  using container_type = std::vector<value_type>;

  void push_back(value_type val) { _values.push_back(std::move(val)); }

  std::size_t size() const { return _values.size(); }
  bool empty() const { return _values.empty(); }

  container_type::const_iterator begin() const { return _values.begin(); }
  container_type::const_iterator end() const { return _values.end(); }

  const value_type &operator[](std::size_t idx) const { return _values[idx]; }

private:
  container_type _values;
};

class node
{
public:
  node() = default;
  node(value_type val) : _value(std::move(val)) {}

  bool is_value() const { return !std::holds_alternative<std::monostate>(_value); }
  bool is_string() const { return std::holds_alternative<std::string>(_value); }
  bool is_integer() const { return std::holds_alternative<std::int64_t>(_value); }
  bool is_boolean() const { return std::holds_alternative<bool>(_value); }
  bool is_array() const { return std::holds_alternative<std::shared_ptr<array>>(_value); }
  bool is_table() const { return std::holds_alternative<std::shared_ptr<table>>(_value); }

  template <typename T> std::optional<T> as() const
  {
    static_assert(std::is_same_v<T, std::int64_t> || std::is_same_v<T, bool> ||
                    std::is_same_v<T, std::string>,
                  "unsupported TOML value type");
    if (auto *val = std::get_if<T>(&_value))
    {
      return *val;
    }
    return std::nullopt;
  }

  const array *as_array() const
  {
    if (auto *val = std::get_if<std::shared_ptr<array>>(&_value))
      return val->get();
    return nullptr;
  }

  const table *as_table() const
  {
    if (auto *val = std::get_if<std::shared_ptr<table>>(&_value))
      return val->get();
    return nullptr;
  }

  table *as_table()
  {
    if (auto *val = std::get_if<std::shared_ptr<table>>(&_value))
      return val->get();
    return nullptr;
  }

  explicit operator bool() const { return is_value(); }

private:
  value_type _value;
};

class table
{
public:
  using container_type = std::unordered_map<std::string, node>;

  bool contains(const std::string &key) const { return _values.find(key) != _values.end(); }
  bool empty() const { return _values.empty(); }
  std::size_t size() const { return _values.size(); }

  node &operator[](const std::string &key) { return _values[key]; }

  void insert(const std::string &key, node value) { _values[key] = std::move(value); }

  /// \brief Look up a dotted path such as "proxy.trusted_proxies".
  /// \return An empty node if any component is missing.
  node at_path(const std::string &dottedPath) const
  {
    std::vector<std::string> parts;
    std::stringstream ss(dottedPath);
    std::string part;
    while (std::getline(ss, part, '.'))
      parts.push_back(part);

    const table *current = this;
    for (std::size_t i = 0; i < parts.size(); ++i)
    {
      auto it = current->_values.find(parts[i]);
      if (it == current->_values.end())
        return node();
      if (i == parts.size() - 1)
        return it->second;
      current = it->second.as_table();
      if (!current)
        return node();
    }
    return node();
  }

  container_type::const_iterator begin() const { return _values.begin(); }
  container_type::const_iterator end() const { return _values.end(); }

private:
  container_type _values;
};

class parser
{
public:
  explicit parser(std::string input) : _input(std::move(input)) {}

  table parse()
  {
    table root;
    table *current = &root;

    skipWhitespaceAndComments();
    while (!isEnd())
    {
      if (peek() == '[')
      {
        current = ensureTable(root, parseSectionHeader());
      }
      else
      {
        std::string key = parseKey();
        skipInlineWhitespace();
        expect('=');
        skipInlineWhitespace();
        if (current->contains(key))
        {
          fail("duplicate key '" + key + "'");
        }
        current->insert(key, node(parseValue()));
        expectEndOfLine();
      }
      skipWhitespaceAndComments();
    }
    return root;
  }

private:
  std::string _input;
  std::size_t _pos{0};
  std::size_t _line{1};

  bool isEnd() const { return _pos >= _input.size(); }
  char peek(std::size_t offset = 0) const
  {
    std::size_t p = _pos + offset;
    return p >= _input.size() ? '\0' : _input[p];
  }
  bool startsWith(const char *text) const { return _input.compare(_pos, 3, text) == 0; }

  char advance()
  {
    if (isEnd())
      return '\0';
    char c = _input[_pos++];
    if (c == '\n')
      ++_line;
    return c;
  }

  [[noreturn]] void fail(const std::string &what) const { throw parse_error(what, _line); }

  void expect(char c)
  {
    if (peek() != c)
      fail(std::string("expected '") + c + "'");
    advance();
  }

  void skipInlineWhitespace()
  {
    while (peek() == ' ' || peek() == '\t')
      advance();
  }

  void skipComment()
  {
    if (peek() == '#')
    {
      while (!isEnd() && peek() != '\n')
        advance();
    }
  }

  void skipWhitespaceAndComments()
  {
    while (!isEnd())
    {
      if (std::isspace(static_cast<unsigned char>(peek())))
        advance();
      else if (peek() == '#')
        skipComment();
      else
        break;
    }
  }

  void expectEndOfLine()
  {
    skipInlineWhitespace();
    skipComment();
    if (peek() == '\r')
      advance();
    if (!isEnd() && peek() != '\n')
      fail("unexpected trailing characters");
  }

  std::string parseSectionHeader()
  {
    advance(); // '['
    std::string section;
    while (!isEnd() && peek() != ']' && peek() != '\n')
      section += advance();
    expect(']');
    expectEndOfLine();
    if (section.empty())
      fail("empty section name");
    return section;
  }

  std::string parseKey()
  {
    if (peek() == '"' || peek() == '\'')
      return parseSingleLineString(advance());

    std::string key;
    while (!isEnd() && (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_' ||
                        peek() == '-'))
      key += advance();
    if (key.empty())
      fail("expected a key");
    return key;
  }

  value_type parseValue()
  {
    char c = peek();
    if (c == '"' || c == '\'')
    {
      if ((c == '"' && startsWith("\"\"\"")) || (c == '\'' && startsWith("'''")))
        return parseMultiLineString(c);
      return parseSingleLineString(advance());
    }
    if (c == '[')
      return parseArray();
    if (c == 't' || c == 'f')
      return parseBool();
    if (c == '+' || c == '-' || std::isdigit(static_cast<unsigned char>(c)))
      return parseInteger();
    fail("invalid value");
  }

  char parseEscape()
  {
    char c = advance();
    switch (c)
    {
    case 'n':
      return '\n';
    case 't':
      return '\t';
    case 'r':
      return '\r';
    case '\\':
      return '\\';
    case '"':
      return '"';
    default:
      fail(std::string("unsupported escape '\\") + c + "'");
    }
  }

  /// \param quote The opening quote, already consumed.
  std::string parseSingleLineString(char quote)
  {
    std::string str;
    while (!isEnd() && peek() != quote && peek() != '\n')
    {
      if (quote == '"' && peek() == '\\')
      {
        advance();
        str += parseEscape();
      }
      else
      {
        str += advance();
      }
    }
    if (peek() != quote)
      fail("unterminated string");
    advance();
    return str;
  }

  std::string parseMultiLineString(char quote)
  {
    _pos += 3;
    // A newline directly after the opening delimiter is trimmed.
    if (peek() == '\r' && peek(1) == '\n')
      _pos += 1;
    if (peek() == '\n')
      advance();

    const char delimiter[4] = {quote, quote, quote, '\0'};
    std::string str;
    while (!isEnd() && !startsWith(delimiter))
    {
      if (quote == '"' && peek() == '\\')
      {
        advance();
        str += parseEscape();
      }
      else
      {
        str += advance();
      }
    }
    if (isEnd())
      fail("unterminated multi-line string");
    _pos += 3;
    return str;
  }

  value_type parseArray()
  {
    advance(); // '['
    auto arr = std::make_shared<array>();
    skipWhitespaceAndComments();
    while (!isEnd() && peek() != ']')
    {
      arr->push_back(parseValue());
      skipWhitespaceAndComments();
      if (peek() == ',')
      {
        advance();
        skipWhitespaceAndComments();
      }
      else if (peek() != ']')
      {
        fail("expected ',' or ']' in array");
      }
    }
    expect(']');
    return arr;
  }

  value_type parseBool()
  {
    std::string word;
    while (!isEnd() && std::isalpha(static_cast<unsigned char>(peek())))
      word += advance();
    if (word == "true")
      return true;
    if (word == "false")
      return false;
    fail("invalid boolean value: " + word);
  }

  value_type parseInteger()
  {
    std::string num;
    if (peek() == '+' || peek() == '-')
      num += advance();
    while (!isEnd() && (std::isdigit(static_cast<unsigned char>(peek())) || peek() == '_'))
    {
      char c = advance();
      if (c != '_')
        num += c;
    }
    if (peek() == '.' || peek() == 'e' || peek() == 'E')
      fail("floating point values are not supported");
    try
    {
      return static_cast<std::int64_t>(std::stoll(num));
    }
    catch (const std::exception &)
    {
      fail("invalid integer '" + num + "'");
    }
  }

  table *ensureTable(table &root, const std::string &path)
  {
    std::stringstream ss(path);
    std::string part;
    table *current = &root;
    while (std::getline(ss, part, '.'))
    {
      if (!current->contains(part))
        current->insert(part, node(std::make_shared<table>()));
      current = (*current)[part].as_table();
      if (!current)
        fail("'" + path + "' is not a table");
    }
    return current;
  }
};

inline table parse(const std::string &tomlString)
{
  parser p(tomlString);
  return p.parse();
}

inline table parse_file(const std::string &filename)
{
  std::ifstream file(filename);
  if (!file.is_open())
    throw std::runtime_error("Cannot open file: " + filename);

  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

} // namespace toml
} // namespace parsers
} // namespace edgeguard
