// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of RpcMesh, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "rpcmesh/core/logger.hpp"
#include "rpcmesh/rpc/errors.hpp"
#include "rpcmesh/rpc/types.hpp"

namespace rpcmesh
{
namespace rpc
{

/// \brief Throws ConfigError if the descriptor cannot be registered.
inline void validateProvider(const Provider &provider)
{
  auto where = [&provider]() { return "provider '" + provider.id + "'"; };
  if (provider.id.empty())
  {
    throw ConfigError("provider id must not be empty");
  }
  if (provider.chain.empty())
  {
    throw ConfigError(where() + " has no chain");
  }
  if (provider.url.rfind("http://", 0) != 0 && provider.url.rfind("https://", 0) != 0)
  {
    throw ConfigError(where() + " url must start with http:// or https:// (got '" +
                      provider.url + "')");
  }
  if (provider.rateLimit == 0)
  {
    throw ConfigError(where() + " rate limit must be positive");
  }
  if (provider.costPerThousand < 0.0)
  {
    throw ConfigError(where() + " cost must not be negative");
  }
  if (provider.maxConnections == 0)
  {
    throw ConfigError(where() + " max connections must be at least 1");
  }
  if (provider.dailyBudget && *provider.dailyBudget < 0.0)
  {
    throw ConfigError(where() + " daily budget must not be negative");
  }
  if (provider.timeout && provider.timeout->count() <= 0)
  {
    throw ConfigError(where() + " timeout must be positive");
  }
}

/// \brief Thread-safe catalog of providers keyed by id.
///
/// Lookups return copies so callers never hold references into the map while
/// another thread deactivates or removes a provider.
class ProviderRegistry
{
public:
  /// \brief Validates and adds a provider. Throws ConfigError on an invalid
  /// descriptor or a duplicate id.
  void registerProvider(const Provider &provider)
  {
    validateProvider(provider);
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_providers.count(provider.id) > 0)
      {
        throw ConfigError("duplicate provider id '" + provider.id + "'");
      }
      _providers.emplace(provider.id, provider);
    }
    RPCMESH_LOG_INFO("Registered provider " << provider.id << " (" << tierToString(provider.tier)
                                            << ") for chain " << provider.chain);
  }

  /// \brief Returns the removed descriptor, or nullopt if unknown.
  std::optional<Provider> removeProvider(const std::string &id)
  {
    std::optional<Provider> removed;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      auto it = _providers.find(id);
      if (it == _providers.end())
      {
        return std::nullopt;
      }
      removed = std::move(it->second);
      _providers.erase(it);
    }
    RPCMESH_LOG_INFO("Removed provider " << id);
    return removed;
  }

  /// \brief Returns true if the flag changed.
  bool setActive(const std::string &id, bool active)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _providers.find(id);
    if (it == _providers.end() || it->second.isActive == active)
    {
      return false;
    }
    it->second.isActive = active;
    return true;
  }

  bool setPriority(const std::string &id, int priority)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _providers.find(id);
    if (it == _providers.end())
    {
      return false;
    }
    it->second.priority = priority;
    return true;
  }

  std::optional<Provider> find(const std::string &id) const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _providers.find(id);
    if (it == _providers.end())
    {
      return std::nullopt;
    }
    return it->second;
  }

  bool contains(const std::string &id) const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _providers.count(id) > 0;
  }

  /// \brief Every provider registered for chain, active or not, by id.
  std::vector<Provider> forChain(const std::string &chain) const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    std::vector<Provider> out;
    for (const auto &entry : _providers)
    {
      if (entry.second.chain == chain)
      {
        out.push_back(entry.second);
      }
    }
    return out;
  }

  std::vector<Provider> all() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    std::vector<Provider> out;
    out.reserve(_providers.size());
    for (const auto &entry : _providers)
    {
      out.push_back(entry.second);
    }
    return out;
  }

  std::vector<std::string> chains() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    std::set<std::string> names;
    for (const auto &entry : _providers)
    {
      names.insert(entry.second.chain);
    }
    return std::vector<std::string>(names.begin(), names.end());
  }

  std::size_t size() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _providers.size();
  }

private:
  mutable std::mutex _mutex;
  std::map<std::string, Provider> _providers;
};

} // namespace rpc
} // namespace rpcmesh
