// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of RpcMesh, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>

#include "rpcmesh/core/clock.hpp"
#include "rpcmesh/core/json.hpp"
#include "rpcmesh/core/logger.hpp"

namespace rpcmesh
{
namespace rpc
{

struct ResponseCacheConfig
{
  bool enabled = true;
  std::size_t maxEntries = 10000;
  /// TTL for methods listed in extraMethods.
  std::chrono::milliseconds defaultTtl{30000};
  /// Cacheable methods and how long their results stay fresh.
  std::map<std::string, std::chrono::milliseconds> ttls{
      {"eth_blockNumber", std::chrono::milliseconds(1000)},
      {"eth_gasPrice", std::chrono::milliseconds(5000)},
      {"eth_getBalance", std::chrono::milliseconds(10000)},
      {"eth_getTransactionCount", std::chrono::milliseconds(10000)},
      {"eth_call", std::chrono::milliseconds(30000)},
      {"getHealth", std::chrono::milliseconds(60000)}};
  /// Further cacheable methods that use defaultTtl.
  std::set<std::string> extraMethods;
};

/// \brief TTL cache for results of read-mostly RPC methods, keyed by
/// chain, method and serialized params. Expiry follows the injected clock;
/// stale entries are dropped on lookup and by purgeExpired().
class ResponseCache
{
public:
  ResponseCache(ResponseCacheConfig config, std::shared_ptr<core::Clock> clock)
      : _config(std::move(config)), _clock(std::move(clock))
  {
  }

  bool enabled() const { return _config.enabled; }

  bool isCacheable(const std::string &method) const
  {
    return _config.enabled &&
           (_config.ttls.count(method) > 0 || _config.extraMethods.count(method) > 0);
  }

  std::chrono::milliseconds ttlFor(const std::string &method) const
  {
    auto it = _config.ttls.find(method);
    return it == _config.ttls.end() ? _config.defaultTtl : it->second;
  }

  static std::string makeKey(const std::string &chain, const std::string &method,
                             const core::Json &params)
  {
    return chain + ":" + method + ":" + params.dump();
  }

  std::optional<core::Json> get(const std::string &chain, const std::string &method,
                                const core::Json &params)
  {
    if (!isCacheable(method))
    {
      return std::nullopt;
    }
    std::string key = makeKey(chain, method, params);
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _entries.find(key);
    if (it == _entries.end())
    {
      ++_misses;
      return std::nullopt;
    }
    if (it->second.expiresAt <= _clock->now())
    {
      _entries.erase(it);
      ++_misses;
      return std::nullopt;
    }
    ++_hits;
    return it->second.value;
  }

  /// \brief Store a result if the method is cacheable. At capacity, expired
  /// entries are purged first and then the oldest entry is evicted.
  void put(const std::string &chain, const std::string &method, const core::Json &params,
           const core::Json &result)
  {
    if (!isCacheable(method) || _config.maxEntries == 0)
    {
      return;
    }
    std::string key = makeKey(chain, method, params);
    auto now = _clock->now();
    std::lock_guard<std::mutex> lock(_mutex);
    if (_entries.count(key) == 0 && _entries.size() >= _config.maxEntries)
    {
      purgeLocked(now);
      if (_entries.size() >= _config.maxEntries)
      {
        evictOldestLocked();
      }
    }
    _entries[key] = Entry{result, now, now + ttlFor(method)};
  }

  std::size_t purgeExpired()
  {
    std::lock_guard<std::mutex> lock(_mutex);
    std::size_t removed = purgeLocked(_clock->now());
    if (removed > 0)
    {
      RPCMESH_LOG_DEBUG("Response cache purged " << removed << " expired entries, "
                                                 << _entries.size() << " left");
    }
    return removed;
  }

  void clear()
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _entries.clear();
  }

  std::size_t size() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _entries.size();
  }

  std::uint64_t hits() const { return _hits.load(); }
  std::uint64_t misses() const { return _misses.load(); }

private:
  struct Entry
  {
    core::Json value;
    core::Clock::TimePoint storedAt;
    core::Clock::TimePoint expiresAt;
  };

  std::size_t purgeLocked(core::Clock::TimePoint now)
  {
    std::size_t removed = 0;
    for (auto it = _entries.begin(); it != _entries.end();)
    {
      if (it->second.expiresAt <= now)
      {
        it = _entries.erase(it);
        ++removed;
      }
      else
      {
        ++it;
      }
    }
    return removed;
  }

  void evictOldestLocked()
  {
    auto oldest = _entries.end();
    for (auto it = _entries.begin(); it != _entries.end(); ++it)
    {
      if (oldest == _entries.end() || it->second.storedAt < oldest->second.storedAt)
      {
        oldest = it;
      }
    }
    if (oldest != _entries.end())
    {
      _entries.erase(oldest);
    }
  }

  ResponseCacheConfig _config;
  std::shared_ptr<core::Clock> _clock;
  mutable std::mutex _mutex;
  std::unordered_map<std::string, Entry> _entries;
  std::atomic<std::uint64_t> _hits{0};
  std::atomic<std::uint64_t> _misses{0};
};

} // namespace rpc
} // namespace rpcmesh
