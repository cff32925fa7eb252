// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of RpcMesh, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cctype>
#include <cstdint>
#include <fstream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace rpcmesh
{
namespace parsers
{
namespace toml
{

/// The TOML subset needed by rpcmesh configuration files:
///
///   - [table] and [dotted.table] headers
///   - [[array.of.tables]] headers (one entry per provider)
///   - strings ("basic" with escapes, 'literal'), integers with '_'
///     separators, floats, booleans
///   - arrays (multi-line, trailing comma) and { inline = "tables" }
///   - dotted keys and '#' comments
///
/// Dates, multi-line strings and hex/octal literals are not supported.

class table;
class array;

using value_type = std::variant<std::monostate, std::int64_t, double, bool, std::string,
                                std::shared_ptr<table>, std::shared_ptr<array>>;

/// \brief Raised for malformed input; carries the 1-based line number.
class parse_error : public std::runtime_error
{
public:
  parse_error(const std::string &what, std::size_t line)
      : std::runtime_error("TOML parse error at line " + std::to_string(line) + ": " + what),
        _line(line)
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
  node(value_type v) : _value(std::move(v)) {}

  explicit operator bool() const { return !std::holds_alternative<std::monostate>(_value); }

  bool is_string() const { return std::holds_alternative<std::string>(_value); }
  bool is_integer() const { return std::holds_alternative<std::int64_t>(_value); }
  bool is_floating_point() const { return std::holds_alternative<double>(_value); }
  bool is_boolean() const { return std::holds_alternative<bool>(_value); }
  bool is_array() const { return std::holds_alternative<std::shared_ptr<array>>(_value); }
  bool is_table() const { return std::holds_alternative<std::shared_ptr<table>>(_value); }

  /// \brief Typed access. Integers widen to double; nothing else converts.
  template <typename T> std::optional<T> as() const
  {
    if constexpr (std::is_same_v<T, double>)
    {
      if (auto *d = std::get_if<double>(&_value))
      {
        return *d;
      }
      if (auto *i = std::get_if<std::int64_t>(&_value))
      {
        return static_cast<double>(*i);
      }
      return std::nullopt;
    }
    else
    {
      if (auto *v = std::get_if<T>(&_value))
      {
        return *v;
      }
      return std::nullopt;
    }
  }

  const array *as_array() const
  {
    auto *p = std::get_if<std::shared_ptr<array>>(&_value);
    return p ? p->get() : nullptr;
  }

  const table *as_table() const
  {
    auto *p = std::get_if<std::shared_ptr<table>>(&_value);
    return p ? p->get() : nullptr;
  }

  const value_type &raw() const { return _value; }

private:
  value_type _value;
};

class array
{
public:
  void push_back(node n) { _items.push_back(std::move(n)); }
  std::size_t size() const { return _items.size(); }
  bool empty() const { return _items.empty(); }
  const node &operator[](std::size_t i) const { return _items[i]; }

  std::vector<node>::const_iterator begin() const { return _items.begin(); }
  std::vector<node>::const_iterator end() const { return _items.end(); }

private:
  std::vector<node> _items;
};

class table
{
public:
  using container_type = std::map<std::string, node>;

  bool contains(const std::string &key) const { return _entries.count(key) > 0; }
  bool empty() const { return _entries.empty(); }
  std::size_t size() const { return _entries.size(); }

  /// \brief Direct child, or an empty node.
  node get(const std::string &key) const
  {
    auto it = _entries.find(key);
    return it == _entries.end() ? node() : it->second;
  }

  /// \brief Resolve "a.b.c" through nested tables; empty node when absent.
  node at_path(const std::string &dottedPath) const
  {
    const table *current = this;
    std::size_t start = 0;
    while (current)
    {
      auto dot = dottedPath.find('.', start);
      std::string part = dottedPath.substr(start, dot == std::string::npos ? dot : dot - start);
      node child = current->get(part);
      if (dot == std::string::npos || !child)
      {
        return child;
      }
      current = child.as_table();
      start = dot + 1;
    }
    return node();
  }

  void set(const std::string &key, node value) { _entries[key] = std::move(value); }

  container_type::const_iterator begin() const { return _entries.begin(); }
  container_type::const_iterator end() const { return _entries.end(); }

private:
  friend class parser;
  container_type _entries;
};

class parser
{
public:
  explicit parser(std::string input) : _src(std::move(input)) {}

  table parse()
  {
    auto root = std::make_shared<table>();
    std::shared_ptr<table> current = root;

    for (;;)
    {
      skipBlank();
      if (atEnd())
      {
        break;
      }
      if (peek() == '[')
      {
        current = parseHeader(root);
      }
      else
      {
        parseAssignment(*current);
      }
      expectLineEnd();
    }
    return *root;
  }

private:
  // ── cursor ─────────────────────────────────────────────────────────

  bool atEnd() const { return _pos >= _src.size(); }
  char peek(std::size_t ahead = 0) const
  {
    return _pos + ahead < _src.size() ? _src[_pos + ahead] : '\0';
  }
  char next()
  {
    char c = _src[_pos++];
    if (c == '\n')
    {
      ++_line;
    }
    return c;
  }

  [[noreturn]] void fail(const std::string &what) const { throw parse_error(what, _line); }

  void skipSpaces()
  {
    while (peek() == ' ' || peek() == '\t')
    {
      next();
    }
  }

  void skipComment()
  {
    if (peek() == '#')
    {
      while (!atEnd() && peek() != '\n')
      {
        next();
      }
    }
  }

  /// Whitespace, newlines and comments.
  void skipBlank()
  {
    while (!atEnd())
    {
      char c = peek();
      if (c == ' ' || c == '\t' || c == '\r' || c == '\n')
      {
        next();
      }
      else if (c == '#')
      {
        skipComment();
      }
      else
      {
        break;
      }
    }
  }

  void expectLineEnd()
  {
    skipSpaces();
    skipComment();
    if (peek() == '\r')
    {
      next();
    }
    if (!atEnd() && peek() != '\n')
    {
      fail(std::string("unexpected character '") + peek() + "' after value");
    }
  }

  // ── structure ──────────────────────────────────────────────────────

  std::shared_ptr<table> parseHeader(const std::shared_ptr<table> &root)
  {
    next();
    bool arrayOfTables = peek() == '[';
    if (arrayOfTables)
    {
      next();
    }
    skipSpaces();
    std::vector<std::string> path = parseKeyPath();
    skipSpaces();
    if (peek() != ']')
    {
      fail("unterminated table header");
    }
    next();
    if (arrayOfTables)
    {
      if (peek() != ']')
      {
        fail("unterminated array-of-tables header");
      }
      next();
    }

    std::shared_ptr<table> parent = root;
    for (std::size_t i = 0; i + 1 < path.size(); ++i)
    {
      parent = descend(parent, path[i]);
    }
    const std::string &leaf = path.back();

    if (!arrayOfTables)
    {
      return descend(parent, leaf);
    }

    auto entry = std::make_shared<table>();
    auto it = parent->_entries.find(leaf);
    if (it == parent->_entries.end())
    {
      auto list = std::make_shared<array>();
      list->push_back(node(entry));
      parent->_entries[leaf] = node(list);
    }
    else
    {
      auto *listPtr = std::get_if<std::shared_ptr<array>>(&it->second.raw());
      if (!listPtr)
      {
        fail("key '" + leaf + "' is not an array of tables");
      }
      (*listPtr)->push_back(node(entry));
    }
    return entry;
  }

  /// Child table for key, created when missing. For an array of tables the
  /// last element is used, matching how TOML resolves [a.b] after [[a]].
  std::shared_ptr<table> descend(const std::shared_ptr<table> &parent, const std::string &key)
  {
    auto it = parent->_entries.find(key);
    if (it == parent->_entries.end())
    {
      auto child = std::make_shared<table>();
      parent->_entries[key] = node(child);
      return child;
    }
    if (auto *t = std::get_if<std::shared_ptr<table>>(&it->second.raw()))
    {
      return *t;
    }
    if (auto *a = std::get_if<std::shared_ptr<array>>(&it->second.raw()))
    {
      if (!(*a)->empty())
      {
        if (auto *last = std::get_if<std::shared_ptr<table>>(&(*a)->operator[]((*a)->size() - 1).raw()))
        {
          return *last;
        }
      }
    }
    fail("key '" + key + "' is already defined as a value");
  }

  void parseAssignment(table &target)
  {
    std::vector<std::string> path = parseKeyPath();
    skipSpaces();
    if (peek() != '=')
    {
      fail("expected '=' after key '" + path.back() + "'");
    }
    next();
    skipSpaces();
    node value = parseValue();

    std::shared_ptr<table> holder;
    table *dest = &target;
    for (std::size_t i = 0; i + 1 < path.size(); ++i)
    {
      auto it = dest->_entries.find(path[i]);
      if (it == dest->_entries.end())
      {
        holder = std::make_shared<table>();
        dest->_entries[path[i]] = node(holder);
      }
      else
      {
        auto *t = std::get_if<std::shared_ptr<table>>(&it->second.raw());
        if (!t)
        {
          fail("key '" + path[i] + "' is not a table");
        }
        holder = *t;
      }
      dest = holder.get();
    }
    if (dest->contains(path.back()))
    {
      fail("duplicate key '" + path.back() + "'");
    }
    dest->_entries[path.back()] = std::move(value);
  }

  std::vector<std::string> parseKeyPath()
  {
    std::vector<std::string> parts;
    for (;;)
    {
      skipSpaces();
      std::string part;
      if (peek() == '"' || peek() == '\'')
      {
        part = parseString();
      }
      else
      {
        while (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_' || peek() == '-')
        {
          part += next();
        }
      }
      if (part.empty())
      {
        fail("expected key");
      }
      parts.push_back(part);
      skipSpaces();
      if (peek() != '.')
      {
        return parts;
      }
      next();
    }
  }

  // ── values ─────────────────────────────────────────────────────────

  node parseValue()
  {
    char c = peek();
    if (c == '"' || c == '\'')
    {
      return node(parseString());
    }
    if (c == '[')
    {
      return node(parseArray());
    }
    if (c == '{')
    {
      return node(parseInlineTable());
    }
    if (c == 't' || c == 'f')
    {
      return node(parseBoolean());
    }
    if (c == '+' || c == '-' || std::isdigit(static_cast<unsigned char>(c)))
    {
      return parseNumber();
    }
    fail("invalid value");
  }

  std::string parseString()
  {
    char quote = next();
    std::string out;
    while (!atEnd() && peek() != quote)
    {
      if (peek() == '\n')
      {
        fail("newline in string");
      }
      char c = next();
      if (c != '\\' || quote == '\'')
      {
        out += c;
        continue;
      }
      char esc = next();
      switch (esc)
      {
      case 'n':
        out += '\n';
        break;
      case 't':
        out += '\t';
        break;
      case 'r':
        out += '\r';
        break;
      case '"':
      case '\\':
        out += esc;
        break;
      default:
        fail(std::string("unsupported escape '\\") + esc + "'");
      }
    }
    if (atEnd())
    {
      fail("unterminated string");
    }
    next();
    return out;
  }

  std::shared_ptr<array> parseArray()
  {
    next();
    auto out = std::make_shared<array>();
    for (;;)
    {
      skipBlank();
      if (peek() == ']')
      {
        next();
        return out;
      }
      if (atEnd())
      {
        fail("unterminated array");
      }
      out->push_back(parseValue());
      skipBlank();
      if (peek() == ',')
      {
        next();
      }
      else if (peek() != ']')
      {
        fail("expected ',' or ']' in array");
      }
    }
  }

  std::shared_ptr<table> parseInlineTable()
  {
    next();
    auto out = std::make_shared<table>();
    skipSpaces();
    if (peek() == '}')
    {
      next();
      return out;
    }
    for (;;)
    {
      parseAssignment(*out);
      skipSpaces();
      if (peek() == ',')
      {
        next();
        skipSpaces();
        continue;
      }
      if (peek() == '}')
      {
        next();
        return out;
      }
      fail("expected ',' or '}' in inline table");
    }
  }

  bool parseBoolean()
  {
    if (_src.compare(_pos, 4, "true") == 0)
    {
      _pos += 4;
      return true;
    }
    if (_src.compare(_pos, 5, "false") == 0)
    {
      _pos += 5;
      return false;
    }
    fail("invalid boolean");
  }

  node parseNumber()
  {
    std::string digits;
    bool isFloat = false;
    while (!atEnd())
    {
      char c = peek();
      if (std::isdigit(static_cast<unsigned char>(c)) || c == '+' || c == '-')
      {
        digits += next();
      }
      else if (c == '.' || c == 'e' || c == 'E')
      {
        isFloat = true;
        digits += next();
      }
      else if (c == '_')
      {
        next();
      }
      else
      {
        break;
      }
    }
    try
    {
      std::size_t used = 0;
      node result = isFloat ? node(std::stod(digits, &used))
                            : node(static_cast<std::int64_t>(std::stoll(digits, &used)));
      if (used != digits.size())
      {
        fail("invalid number '" + digits + "'");
      }
      return result;
    }
    catch (const std::logic_error &)
    {
      fail("invalid number '" + digits + "'");
    }
  }

  std::string _src;
  std::size_t _pos{0};
  std::size_t _line{1};
};

inline table parse(const std::string &text) { return parser(text).parse(); }

inline table parse_file(const std::string &path)
{
  std::ifstream in(path);
  if (!in)
  {
    throw std::runtime_error("Cannot open file: " + path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return parse(buffer.str());
}

} // namespace toml
} // namespace parsers
} // namespace rpcmesh
