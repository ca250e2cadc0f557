// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Ferry, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

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

namespace ferry
{
namespace parsers
{
/// Subset of TOML sufficient for relay configuration files: [dotted.tables],
/// bare or dotted keys, strings, integers, floats, booleans and # comments.
/// Arrays, inline tables and dates are rejected.
namespace toml
{

class table;

using value_type = std::variant<std::monostate, int64_t, double, bool, std::string,
                                std::shared_ptr<table>>;

/// Thrown for malformed input, carrying the 1-based line of the error.
class parse_error : public std::runtime_error
{
public:
  parse_error(const std::string &what, std::size_t line)
      : std::runtime_error("line " + std::to_string(line) + ": " + what), _line(line)
  {
  }

  std::size_t line() const { return _line; }

private:
  std::size_t _line;
};

class node
{
public:
  node() = default;
  node(value_type val) : _value(std::move(val)) {}

  bool is_value() const
  {
    return !std::holds_alternative<std::monostate>(_value) && !is_table();
  }
  bool is_string() const { return std::holds_alternative<std::string>(_value); }
  bool is_integer() const { return std::holds_alternative<int64_t>(_value); }
  bool is_floating_point() const { return std::holds_alternative<double>(_value); }
  bool is_boolean() const { return std::holds_alternative<bool>(_value); }
  bool is_table() const { return std::holds_alternative<std::shared_ptr<table>>(_value); }

  template <typename T> std::optional<T> as() const
  {
    if constexpr (std::is_same_v<T, double>)
    {
      if (auto *val = std::get_if<double>(&_value))
        return *val;
      if (auto *val = std::get_if<int64_t>(&_value))
        return static_cast<double>(*val);
      return std::nullopt;
    }
    else
    {
      if (auto *val = std::get_if<T>(&_value))
        return *val;
      return std::nullopt;
    }
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

  explicit operator bool() const { return !std::holds_alternative<std::monostate>(_value); }

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

  /// Look up "a.b.c" through nested tables; an empty node when absent.
  node at_path(const std::string &dottedPath) const
  {
    const table *current = this;
    std::size_t start = 0;
    while (current)
    {
      std::size_t dot = dottedPath.find('.', start);
      auto it = current->_values.find(dottedPath.substr(start, dot - start));
      if (it == current->_values.end())
      {
        return node();
      }
      if (dot == std::string::npos)
      {
        return it->second;
      }
      current = it->second.as_table();
      start = dot + 1;
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

    while (true)
    {
      skipBlankAndComments();
      if (isEnd())
        break;

      if (peek() == '[')
      {
        current = descend(&root, parseHeader(), true);
      }
      else
      {
        std::string key = parseKey();
        skipSpaces();
        expect('=');
        skipSpaces();
        node value = parseValue();

        // Dotted keys address nested tables relative to the current section
        auto dot = key.rfind('.');
        table *target = current;
        if (dot != std::string::npos)
        {
          target = descend(current, key.substr(0, dot), false);
          key = key.substr(dot + 1);
        }
        if (target->contains(key))
          fail("duplicate key '" + key + "'");
        (*target)[key] = std::move(value);
      }
      expectLineEnd();
    }
    return root;
  }

private:
  std::string _input;
  std::size_t _pos{0};
  std::size_t _line{1};

  [[noreturn]] void fail(const std::string &what) const { throw parse_error(what, _line); }

  bool isEnd() const { return _pos >= _input.size(); }
  char peek() const { return isEnd() ? '\0' : _input[_pos]; }
  char advance()
  {
    char c = isEnd() ? '\0' : _input[_pos++];
    if (c == '\n')
      ++_line;
    return c;
  }

  void expect(char c)
  {
    if (peek() != c)
      fail(std::string("expected '") + c + "'");
    advance();
  }

  void skipSpaces()
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

  void skipBlankAndComments()
  {
    while (!isEnd())
    {
      char c = peek();
      if (c == ' ' || c == '\t' || c == '\r' || c == '\n')
        advance();
      else if (c == '#')
        skipComment();
      else
        break;
    }
  }

  void expectLineEnd()
  {
    skipSpaces();
    skipComment();
    if (peek() == '\r')
      advance();
    if (!isEnd() && peek() != '\n')
      fail("unexpected trailing characters");
  }

  static bool isKeyChar(char c)
  {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.';
  }

  std::string parseKey()
  {
    std::string key;
    while (isKeyChar(peek()))
      key += advance();
    if (key.empty() || key.front() == '.' || key.back() == '.')
      fail("invalid key");
    return key;
  }

  std::string parseHeader()
  {
    expect('[');
    skipSpaces();
    std::string name = parseKey();
    skipSpaces();
    expect(']');
    return name;
  }

  table *descend(table *from, const std::string &path, bool header)
  {
    table *current = from;
    std::size_t start = 0;
    while (true)
    {
      std::size_t dot = path.find('.', start);
      std::string part = path.substr(start, dot - start);
      if (part.empty())
        fail("empty table name in '" + path + "'");
      node &child = (*current)[part];
      if (!child)
        child = node(std::make_shared<table>());
      current = child.as_table();
      if (!current)
        fail((header ? "section '" : "key path '") + path + "' collides with a value");
      if (dot == std::string::npos)
        return current;
      start = dot + 1;
    }
  }

  node parseValue()
  {
    char c = peek();
    if (c == '"' || c == '\'')
      return node(parseString());
    if (c == 't' || c == 'f')
      return node(parseBool());
    if (c == '+' || c == '-' || std::isdigit(static_cast<unsigned char>(c)))
      return parseNumber();
    fail("invalid value");
  }

  std::string parseString()
  {
    char quote = advance();
    std::string str;
    while (!isEnd() && peek() != quote && peek() != '\n')
    {
      char c = advance();
      if (c != '\\' || quote == '\'')
      {
        str += c;
        continue;
      }
      switch (char esc = advance())
      {
      case 'n':
        str += '\n';
        break;
      case 't':
        str += '\t';
        break;
      case 'r':
        str += '\r';
        break;
      case '\\':
      case '"':
        str += esc;
        break;
      default:
        fail(std::string("unknown escape '\\") + esc + "'");
      }
    }
    if (peek() != quote)
      fail("unterminated string");
    advance();
    return str;
  }

  bool parseBool()
  {
    std::string word;
    while (std::isalpha(static_cast<unsigned char>(peek())))
      word += advance();
    if (word == "true")
      return true;
    if (word == "false")
      return false;
    fail("invalid boolean '" + word + "'");
  }

  node parseNumber()
  {
    std::string num;
    bool isFloat = false;
    if (peek() == '+' || peek() == '-')
      num += advance();

    while (!isEnd())
    {
      char c = peek();
      if (c == '_')
      {
        advance();
        continue;
      }
      if (c == '.' || c == 'e' || c == 'E')
        isFloat = true;
      else if (!(std::isdigit(static_cast<unsigned char>(c)) ||
                 ((c == '+' || c == '-') && isFloat)))
        break;
      num += advance();
    }

    try
    {
      std::size_t used = 0;
      node result = isFloat ? node(std::stod(num, &used))
                            : node(static_cast<int64_t>(std::stoll(num, &used)));
      if (used != num.size())
        fail("invalid number '" + num + "'");
      return result;
    }
    catch (const std::logic_error &)
    {
      fail("invalid number '" + num + "'");
    }
  }
};

inline table parse(const std::string &tomlString) { return parser(tomlString).parse(); }

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
} // namespace ferry
