// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of RpcMesh, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "rpcmesh/parsers/minimal_toml.hpp"

namespace rpcmesh
{
namespace core
{

/// \brief Typed, dotted-key access to a TOML document or to one table in it.
///
/// A loader built from a file keeps the path for reload(). Tables taken from
/// an array of tables (e.g. [[providers]]) are returned as loaders too, so
/// the same getters work on each entry. Every getter returns nullopt when
/// the key is absent and throws std::runtime_error when it is present with
/// the wrong type.
class ConfigLoader
{
public:
  /// \brief Load and parse a TOML file. Throws on I/O or syntax errors.
  explicit ConfigLoader(const std::string &filename) : _origin(filename), _filename(filename)
  {
    reload();
  }

  /// \brief Parse TOML held in memory; origin names it in error messages.
  static ConfigLoader fromString(const std::string &text, const std::string &origin = "<string>")
  {
    return ConfigLoader(parsers::toml::parse(text), origin);
  }

  /// \brief Re-read the file this loader was built from.
  void reload()
  {
    if (_filename.empty())
    {
      throw std::runtime_error("ConfigLoader: '" + _origin + "' was not loaded from a file");
    }
    try
    {
      _table = parsers::toml::parse_file(_filename);
    }
    catch (const parsers::toml::parse_error &e)
    {
      throw std::runtime_error("Failed to parse configuration file " + _filename + ": " +
                               e.what());
    }
  }

  const parsers::toml::table &table() const { return _table; }

  const std::string &origin() const { return _origin; }

  bool contains(const std::string &dottedKey) const
  {
    return static_cast<bool>(_table.at_path(dottedKey));
  }

  template <typename T> std::optional<T> get(const std::string &dottedKey) const
  {
    auto node = _table.at_path(dottedKey);
    if (!node)
    {
      return std::nullopt;
    }
    if (auto value = node.as<T>())
    {
      return value;
    }
    throw std::runtime_error(describe(dottedKey) + " has the wrong type");
  }

  std::optional<std::int64_t> getInt(const std::string &key) const
  {
    return get<std::int64_t>(key);
  }

  /// Integers are accepted and widened.
  std::optional<double> getDouble(const std::string &key) const { return get<double>(key); }

  std::optional<bool> getBool(const std::string &key) const { return get<bool>(key); }

  std::optional<std::string> getString(const std::string &key) const
  {
    return get<std::string>(key);
  }

  std::optional<std::vector<std::string>> getStringArray(const std::string &key) const
  {
    const parsers::toml::array *items = arrayAt(key);
    if (!items)
    {
      return std::nullopt;
    }
    std::vector<std::string> result;
    for (const auto &item : *items)
    {
      auto value = item.as<std::string>();
      if (!value)
      {
        throw std::runtime_error(describe(key) + " must contain only strings");
      }
      result.push_back(*value);
    }
    return result;
  }

  std::optional<std::vector<std::int64_t>> getIntArray(const std::string &key) const
  {
    const parsers::toml::array *items = arrayAt(key);
    if (!items)
    {
      return std::nullopt;
    }
    std::vector<std::int64_t> result;
    for (const auto &item : *items)
    {
      auto value = item.as<std::int64_t>();
      if (!value)
      {
        throw std::runtime_error(describe(key) + " must contain only integers");
      }
      result.push_back(*value);
    }
    return result;
  }

  /// \brief Sub-table at key as its own loader; nullopt when absent.
  std::optional<ConfigLoader> getTable(const std::string &key) const
  {
    auto node = _table.at_path(key);
    if (!node)
    {
      return std::nullopt;
    }
    const parsers::toml::table *sub = node.as_table();
    if (!sub)
    {
      throw std::runtime_error(describe(key) + " must be a table");
    }
    return ConfigLoader(*sub, qualify(key));
  }

  /// \brief Entries of an array of tables ([[key]]); empty when absent.
  std::vector<ConfigLoader> getTableArray(const std::string &key) const
  {
    std::vector<ConfigLoader> result;
    const parsers::toml::array *items = arrayAt(key);
    if (!items)
    {
      return result;
    }
    for (std::size_t i = 0; i < items->size(); ++i)
    {
      const parsers::toml::table *entry = (*items)[i].as_table();
      if (!entry)
      {
        throw std::runtime_error(describe(key) + " must be an array of tables");
      }
      result.push_back(ConfigLoader(*entry, qualify(key) + "[" + std::to_string(i) + "]"));
    }
    return result;
  }

  /// \brief Names of the direct children of this table, sorted.
  std::vector<std::string> keys() const
  {
    std::vector<std::string> out;
    for (const auto &entry : _table)
    {
      out.push_back(entry.first);
    }
    return out;
  }

private:
  ConfigLoader(parsers::toml::table tbl, std::string origin)
      : _origin(std::move(origin)), _table(std::move(tbl))
  {
  }

  const parsers::toml::array *arrayAt(const std::string &key) const
  {
    auto node = _table.at_path(key);
    if (!node)
    {
      return nullptr;
    }
    const parsers::toml::array *items = node.as_array();
    if (!items)
    {
      throw std::runtime_error(describe(key) + " must be an array");
    }
    return items;
  }

  std::string qualify(const std::string &key) const
  {
    return _filename.empty() && _origin != "<string>" ? _origin + "." + key : key;
  }

  std::string describe(const std::string &key) const
  {
    return "ConfigLoader: '" + qualify(key) + "' in " + _origin;
  }

  std::string _origin;
  std::string _filename;
  parsers::toml::table _table;
};

} // namespace core
} // namespace rpcmesh
