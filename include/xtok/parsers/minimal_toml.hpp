// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Xtok, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
/// \file minimal_toml.hpp
/// \brief Small TOML subset used for xtok configuration files.
///
/// Supported: [section] and [dotted.section] headers, bare keys, basic and
/// literal strings, booleans, integers, floats, and # comments. Values are
/// stored under their fully qualified dotted key ("reader.trim_text").

#include <cctype>
#include <cstdint>
#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

namespace xtok
{
namespace parsers
{
namespace toml
{
/// \brief Thrown for malformed documents; the message carries the line.
class parse_error : public std::runtime_error
{
public:
  parse_error(const std::string &msg, std::size_t line)
    : std::runtime_error("line " + std::to_string(line) + ": " + msg), _line(line)
  {
  }

  std::size_t line() const { return _line; }

private:
  std::size_t _line;
};

using value = std::variant<std::string, int64_t, double, bool>;

/// \brief Flat key/value view of a parsed document.
class table
{
public:
  bool contains(const std::string &key) const { return _values.count(key) != 0; }
  bool empty() const { return _values.empty(); }
  std::size_t size() const { return _values.size(); }

  const value *find(const std::string &key) const
  {
    auto it = _values.find(key);
    return it == _values.end() ? nullptr : &it->second;
  }

  /// \brief Typed lookup. Integers widen to double; nothing else converts.
  template <typename T> std::optional<T> get(const std::string &key) const
  {
    const value *v = find(key);
    if (!v)
    {
      return std::nullopt;
    }
    if (auto *p = std::get_if<T>(v))
    {
      return *p;
    }
    if constexpr (std::is_same_v<T, double>)
    {
      if (auto *i = std::get_if<int64_t>(v))
      {
        return static_cast<double>(*i);
      }
    }
    return std::nullopt;
  }

  /// \brief Insert a value; redefinition is an error in TOML.
  bool insert(const std::string &key, value v) { return _values.emplace(key, std::move(v)).second; }

  auto begin() const { return _values.begin(); }
  auto end() const { return _values.end(); }

private:
  std::map<std::string, value> _values;
};

class parser
{
public:
  explicit parser(std::string input) : _input(std::move(input)) {}

  table parse()
  {
    table result;
    std::string section;
    while (true)
    {
      skipBlank();
      if (isEnd())
      {
        break;
      }
      if (peek() == '[')
      {
        section = parseHeader();
      }
      else
      {
        std::string key = parseKey();
        skipSpaces();
        expect('=');
        skipSpaces();
        std::string full = section.empty() ? key : section + "." + key;
        if (!result.insert(full, parseValue()))
        {
          throw parse_error("duplicate key '" + full + "'", _line);
        }
      }
      endOfLine();
    }
    return result;
  }

private:
  bool isEnd() const { return _pos >= _input.size(); }
  char peek() const { return isEnd() ? '\0' : _input[_pos]; }

  char take()
  {
    char c = _input[_pos++];
    if (c == '\n')
    {
      ++_line;
    }
    return c;
  }

  void expect(char c)
  {
    if (peek() != c)
    {
      throw parse_error(std::string("expected '") + c + "'", _line);
    }
    take();
  }

  void skipSpaces()
  {
    while (peek() == ' ' || peek() == '\t')
    {
      take();
    }
  }

  void skipComment()
  {
    if (peek() == '#')
    {
      while (!isEnd() && peek() != '\n')
      {
        take();
      }
    }
  }

  // Whitespace, blank lines and comment lines
  void skipBlank()
  {
    while (!isEnd())
    {
      char c = peek();
      if (c == ' ' || c == '\t' || c == '\r' || c == '\n')
        take();
      else if (c == '#')
        skipComment();
      else
        break;
    }
  }

  void endOfLine()
  {
    skipSpaces();
    skipComment();
    if (peek() == '\r')
    {
      take();
    }
    if (!isEnd() && peek() != '\n')
    {
      throw parse_error("unexpected trailing characters", _line);
    }
  }

  static bool isBareKeyChar(char c)
  {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
  }

  std::string parseKey()
  {
    std::string key;
    while (true)
    {
      std::size_t start = _pos;
      while (!isEnd() && isBareKeyChar(peek()))
      {
        take();
      }
      if (_pos == start)
      {
        throw parse_error("expected key", _line);
      }
      key.append(_input, start, _pos - start);
      skipSpaces();
      if (peek() != '.')
      {
        return key;
      }
      key.push_back(take());
      skipSpaces();
    }
  }

  std::string parseHeader()
  {
    expect('[');
    skipSpaces();
    std::string name = parseKey();
    expect(']');
    return name;
  }

  value parseValue()
  {
    char c = peek();
    if (c == '"')
      return parseBasicString();
    if (c == '\'')
      return parseLiteralString();
    if (c == 't' || c == 'f')
      return parseBool();
    if (c == '+' || c == '-' || std::isdigit(static_cast<unsigned char>(c)))
      return parseNumber();
    throw parse_error("invalid value", _line);
  }

  std::string parseBasicString()
  {
    take();
    std::string out;
    while (!isEnd() && peek() != '"' && peek() != '\n')
    {
      char c = take();
      if (c != '\\')
      {
        out.push_back(c);
        continue;
      }
      if (isEnd())
      {
        break;
      }
      switch (char e = take())
      {
      case 'n':
        out.push_back('\n');
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case '"':
      case '\\':
        out.push_back(e);
        break;
      default:
        throw parse_error(std::string("unsupported escape '\\") + e + "'", _line);
      }
    }
    if (peek() != '"')
    {
      throw parse_error("unterminated string", _line);
    }
    take();
    return out;
  }

  std::string parseLiteralString()
  {
    take();
    std::size_t start = _pos;
    while (!isEnd() && peek() != '\'' && peek() != '\n')
    {
      take();
    }
    if (peek() != '\'')
    {
      throw parse_error("unterminated string", _line);
    }
    std::string out = _input.substr(start, _pos - start);
    take();
    return out;
  }

  bool parseBool()
  {
    std::size_t start = _pos;
    while (std::isalpha(static_cast<unsigned char>(peek())))
    {
      take();
    }
    std::string word = _input.substr(start, _pos - start);
    if (word == "true")
      return true;
    if (word == "false")
      return false;
    throw parse_error("invalid boolean '" + word + "'", _line);
  }

  value parseNumber()
  {
    std::string text;
    bool isFloat = false;
    if (peek() == '+' || peek() == '-')
    {
      text.push_back(take());
    }
    while (!isEnd())
    {
      char c = peek();
      if (c == '_')
      {
        take();
        continue;
      }
      if (c == '.' || c == 'e' || c == 'E')
        isFloat = true;
      else if (!(std::isdigit(static_cast<unsigned char>(c)) ||
                 ((c == '+' || c == '-') && (text.back() == 'e' || text.back() == 'E'))))
        break;
      text.push_back(take());
    }
    try
    {
      std::size_t used = 0;
      value v = isFloat ? value(std::stod(text, &used)) : value(static_cast<int64_t>(std::stoll(text, &used)));
      if (used != text.size())
      {
        throw parse_error("invalid number '" + text + "'", _line);
      }
      return v;
    }
    catch (const std::logic_error &)
    {
      throw parse_error("invalid number '" + text + "'", _line);
    }
  }

  std::string _input;
  std::size_t _pos{0};
  std::size_t _line{1};
};

inline table parse(const std::string &text) { return parser(text).parse(); }

/// \throws std::runtime_error if the file cannot be read, parse_error if it
/// is malformed.
inline table parse_file(const std::string &path)
{
  std::ifstream in(path);
  if (!in.is_open())
  {
    throw std::runtime_error("cannot open " + path);
  }
  std::ostringstream buf;
  buf << in.rdbuf();
  return parse(buf.str());
}

} // namespace toml
} // namespace parsers
} // namespace xtok
