// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of RpcMesh, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "rpcmesh/common/i_lifecycle_managed.hpp"
#include "rpcmesh/core/clock.hpp"
#include "rpcmesh/core/logger.hpp"
#include "rpcmesh/core/random.hpp"
#include "rpcmesh/pool/connection_health.hpp"
#include "rpcmesh/pool/load_balancer.hpp"
#include "rpcmesh/rpc/errors.hpp"
#include "rpcmesh/rpc/events.hpp"

namespace rpcmesh
{
namespace pool
{

/// \brief Configuration for the connection pool
struct PoolConfig
{
  /// Connections kept per provider; cleanup and scale-down never go below it.
  std::size_t minConnections = 1;
  /// Ceiling across all providers.
  std::size_t maxTotalConnections = 100;
  /// How long acquire() waits for a connection before AcquireTimeout.
  std::chrono::milliseconds connectionTimeout{5000};
  std::chrono::milliseconds idleTimeout{300000};
  std::chrono::milliseconds maxAge{3600000};
  std::chrono::milliseconds healthCheckInterval{30000};
  std::chrono::milliseconds scaleInterval{10000};
  std::chrono::milliseconds cleanupInterval{60000};
  /// Utilization (busy / total) above which one connection is added.
  double scaleUpThreshold = 0.8;
  /// Utilization below which the longest-idle connection is removed.
  double scaleDownThreshold = 0.2;
  LoadBalancingStrategy strategy = LoadBalancingStrategy::RoundRobin;
  HealthConfig health;
};

/// \brief Read-only copy of one connection's state.
struct ConnectionInfo
{
  std::string id;
  std::string providerId;
  bool isBusy = false;
  bool isActive = true;
  core::Clock::TimePoint createdAt{};
  core::Clock::TimePoint lastUsedAt{};
  std::uint64_t requestCount = 0;
  std::uint64_t errorCount = 0;
  int consecutiveErrors = 0;
  double averageResponseMs = 0.0;
  int healthScore = 100;
  ConnectionState state = ConnectionState::Healthy;
};

struct ProviderPoolStats
{
  std::string chain;
  std::size_t total = 0;
  std::size_t busy = 0;
  std::size_t idle = 0;
  std::size_t waiting = 0;
  std::size_t maxConnections = 0;
};

struct PoolStats
{
  std::size_t total = 0;
  std::size_t busy = 0;
  std::size_t idle = 0;
  std::size_t waiting = 0;
  double utilization = 0.0;
  std::uint64_t created = 0;
  std::uint64_t destroyed = 0;
  std::uint64_t scaleUps = 0;
  std::uint64_t scaleDowns = 0;
  std::uint64_t acquireTimeouts = 0;
  std::map<std::string, ProviderPoolStats> providers;
};

struct HealthCheckReport
{
  std::size_t checked = 0;
  std::size_t failed = 0;
  std::size_t deactivated = 0;
};

enum class ScaleAction
{
  None,
  ScaledUp,
  ScaledDown
};

struct ScaleDecision
{
  ScaleAction action = ScaleAction::None;
  std::string providerId;
  double utilization = 0.0;
  std::size_t total = 0;
};

struct CleanupReport
{
  std::size_t expired = 0;
  std::size_t idle = 0;
  std::size_t unhealthy = 0;
  /// Busy connections past their age, destroyed when released.
  std::size_t retired = 0;
  std::size_t replenished = 0;
};

class ConnectionPool;

/// \brief RAII lease on a pooled connection
///
/// Returns the connection to the pool when destroyed. Move-only. The pool
/// must outlive its leases.
class ConnectionLease
{
public:
  ConnectionLease() = default;

  ConnectionLease(ConnectionLease &&other) noexcept
      : _pool(other._pool), _id(std::move(other._id)), _providerId(std::move(other._providerId))
  {
    other._pool = nullptr;
  }

  ConnectionLease &operator=(ConnectionLease &&other) noexcept
  {
    if (this != &other)
    {
      release();
      _pool = other._pool;
      _id = std::move(other._id);
      _providerId = std::move(other._providerId);
      other._pool = nullptr;
    }
    return *this;
  }

  ConnectionLease(const ConnectionLease &) = delete;
  ConnectionLease &operator=(const ConnectionLease &) = delete;

  ~ConnectionLease() { release(); }

  const std::string &id() const { return _id; }
  const std::string &providerId() const { return _providerId; }
  bool isValid() const { return _pool != nullptr; }
  explicit operator bool() const { return isValid(); }

  /// \brief Report the outcome of one request made over this connection.
  void recordResult(bool success, std::optional<double> latencyMs = std::nullopt);

  /// \brief Return the connection early. Safe to call twice.
  bool release();

private:
  friend class ConnectionPool;

  ConnectionLease(ConnectionPool *pool, std::string id, std::string providerId)
      : _pool(pool), _id(std::move(id)), _providerId(std::move(providerId))
  {
  }

  ConnectionPool *_pool = nullptr;
  std::string _id;
  std::string _providerId;
};

/// \brief Bounded set of logical connections per provider.
///
/// acquire() hands out an idle healthy connection chosen by the configured
/// strategy, creates one if the provider and global ceilings allow, or
/// queues the caller. Queued callers are served by descending priority,
/// then in arrival order, and a connection is never leased twice at once.
///
/// Health checks, auto-scaling and cleanup are public methods that the
/// owner drives from its timer.
///
/// Example:
/// \code
///   ConnectionPool pool(config, clock, random);
///   pool.addProvider("alchemy-eth", "ethereum", 8);
///   {
///     auto lease = pool.acquire("alchemy-eth", 10);
///     // use lease.id()
///     lease.recordResult(true, 42.0);
///   }  // Returned here
/// \endcode
class ConnectionPool : public common::ILifecycleManaged
{
public:
  /// Returns true if the provider answered. Called without the pool lock.
  using HealthCheck = std::function<bool(const std::string &providerId)>;

  ConnectionPool(PoolConfig config, std::shared_ptr<core::Clock> clock,
                 std::shared_ptr<core::RandomSource> random, rpc::EventBus *events = nullptr)
      : _config(std::move(config)), _clock(std::move(clock)),
        _balancer(makeLoadBalancer(_config.strategy, std::move(random))), _events(events)
  {
  }

  ~ConnectionPool() override
  {
    std::lock_guard<std::mutex> lock(_mutex);
    rejectWaitersLocked("Connection pool destroyed");
  }

  ConnectionPool(const ConnectionPool &) = delete;
  ConnectionPool &operator=(const ConnectionPool &) = delete;

  const PoolConfig &config() const { return _config; }
  LoadBalancingStrategy strategy() const { return _balancer->strategy(); }

  void setHealthCheck(HealthCheck check)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _healthCheck = std::move(check);
  }

  /// \brief Register a provider, or update its ceiling, and pre-warm it.
  void addProvider(const std::string &providerId, const std::string &chain,
                   std::size_t maxConnections)
  {
    std::vector<rpc::Event> events;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      auto &slot = _providers[providerId];
      slot.chain = chain;
      slot.maxConnections = std::max<std::size_t>(maxConnections, 1);
      if (acceptingLocked())
      {
        prewarmProviderLocked(providerId, events);
      }
      serviceWaitersLocked(events);
    }
    publish(events);
  }

  /// \brief Forget a provider. Idle connections go now, busy ones on release,
  /// and its waiters fail.
  bool removeProvider(const std::string &providerId)
  {
    std::vector<rpc::Event> events;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_providers.find(providerId) == _providers.end())
      {
        return false;
      }
      for (const auto &id : idsForLocked(providerId))
      {
        auto it = _connections.find(id);
        if (it->second.isBusy)
        {
          it->second.isActive = false;
        }
        else
        {
          destroyLocked(it, "provider removed", events);
        }
      }
      for (auto it = _waiters.begin(); it != _waiters.end();)
      {
        if ((*it)->providerId == providerId)
        {
          (*it)->error = std::make_exception_ptr(
              rpc::RpcError("Provider '" + providerId + "' was removed from the pool"));
          (*it)->done = true;
          it = _waiters.erase(it);
        }
        else
        {
          ++it;
        }
      }
      _providers.erase(providerId);
      serviceWaitersLocked(events);
    }
    _cv.notify_all();
    publish(events);
    RPCMESH_LOG_INFO("Removed provider " << providerId << " from connection pool");
    return true;
  }

  bool hasProvider(const std::string &providerId) const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _providers.count(providerId) > 0;
  }

  ConnectionLease acquire(const std::string &providerId, int priority = 0)
  {
    return acquire(providerId, priority, _config.connectionTimeout);
  }

  /// \brief Lease a connection, waiting up to timeout for one to free up.
  /// \throws AcquireTimeout if none is available in time.
  /// \throws PoolDraining if the pool is draining or stopped, now or while waiting.
  /// \throws RpcError if the provider is not registered.
  ConnectionLease acquire(const std::string &providerId, int priority,
                          std::chrono::milliseconds timeout)
  {
    std::vector<rpc::Event> events;
    auto started = std::chrono::steady_clock::now();
    std::unique_lock<std::mutex> lock(_mutex);
    checkAcceptingLocked(providerId);

    if (!hasWaitersForLocked(providerId))
    {
      if (auto id = tryAssignLocked(providerId, events))
      {
        lock.unlock();
        publish(events);
        return ConnectionLease(this, *id, providerId);
      }
    }

    auto waiter = std::make_shared<Waiter>();
    waiter->providerId = providerId;
    waiter->priority = priority;
    waiter->seq = _nextWaiterSeq++;
    waiter->enqueuedAt = _clock->now();
    _waiters.push_back(waiter);
    serviceWaitersLocked(events);

    if (!waiter->done)
    {
      std::size_t waiting = _waiters.size();
      lock.unlock();
      publish(events);
      events.clear();
      RPCMESH_LOG_DEBUG("Waiting for connection to " << providerId << " (priority " << priority
                                                     << ", " << waiting << " waiting)");
      lock.lock();
      _cv.wait_until(lock, started + timeout, [&waiter]() { return waiter->done; });
    }

    if (!waiter->done)
    {
      _waiters.erase(std::remove(_waiters.begin(), _waiters.end(), waiter), _waiters.end());
      ++_acquireTimeouts;
      auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - started);
      lock.unlock();
      RPCMESH_LOG_WARN("Acquire for " << providerId << " timed out after " << waited.count()
                                      << "ms");
      throw rpc::AcquireTimeout(providerId, waited);
    }
    lock.unlock();
    publish(events);
    if (waiter->error)
    {
      std::rethrow_exception(waiter->error);
    }
    return ConnectionLease(this, waiter->assigned, providerId);
  }

  /// \brief Lease a connection only if one is available without waiting.
  std::optional<ConnectionLease> tryAcquire(const std::string &providerId)
  {
    std::vector<rpc::Event> events;
    std::optional<std::string> id;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      checkAcceptingLocked(providerId);
      if (!hasWaitersForLocked(providerId))
      {
        id = tryAssignLocked(providerId, events);
      }
    }
    publish(events);
    if (!id)
    {
      return std::nullopt;
    }
    return ConnectionLease(this, *id, providerId);
  }

  /// \brief Return a busy connection. Retired connections are destroyed
  /// instead. Returns false if the connection is unknown or already idle.
  bool release(const std::string &connectionId)
  {
    std::vector<rpc::Event> events;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      auto it = _connections.find(connectionId);
      if (it == _connections.end() || !it->second.isBusy)
      {
        return false;
      }
      it->second.isBusy = false;
      it->second.lastUsedAt = _clock->now();
      if (!it->second.isActive)
      {
        destroyLocked(it, "retired on release", events);
      }
      serviceWaitersLocked(events);
    }
    _cv.notify_all();
    publish(events);
    return true;
  }

  /// \brief Remove a connection whatever its state. A lease still holding it
  /// becomes a no-op on release.
  bool destroy(const std::string &connectionId)
  {
    std::vector<rpc::Event> events;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      auto it = _connections.find(connectionId);
      if (it == _connections.end())
      {
        return false;
      }
      destroyLocked(it, "destroyed on request", events);
      serviceWaitersLocked(events);
    }
    _cv.notify_all();
    publish(events);
    return true;
  }

  /// \brief Update request counters, response time and health score.
  /// Failures beyond the threshold, or a score below the minimum,
  /// deactivate the connection.
  bool recordResult(const std::string &connectionId, bool success,
                    std::optional<double> latencyMs = std::nullopt)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _connections.find(connectionId);
    if (it == _connections.end())
    {
      return false;
    }
    applyResultLocked(it->second, success, latencyMs);
    return true;
  }

  /// \brief Check every idle connection once. Each checked connection is held
  /// busy while its check runs so it is not leased meanwhile.
  HealthCheckReport runHealthChecks()
  {
    HealthCheckReport report;
    HealthCheck check;
    std::vector<std::string> ids;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      check = _healthCheck;
      if (!check)
      {
        return report;
      }
      for (const auto &entry : _connections)
      {
        if (!entry.second.isBusy && entry.second.isActive)
        {
          ids.push_back(entry.first);
        }
      }
    }

    for (const auto &id : ids)
    {
      std::string providerId;
      {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _connections.find(id);
        if (it == _connections.end() || it->second.isBusy || !it->second.isActive)
        {
          continue;
        }
        it->second.isBusy = true;
        providerId = it->second.providerId;
      }

      auto start = _clock->now();
      bool ok = false;
      try
      {
        ok = check(providerId);
      }
      catch (const std::exception &e)
      {
        RPCMESH_LOG_WARN("Connection check for " << id << " threw: " << e.what());
      }
      double latency = static_cast<double>(core::toMillis(_clock->now() - start));

      std::vector<rpc::Event> events;
      {
        std::lock_guard<std::mutex> lock(_mutex);
        ++report.checked;
        if (!ok)
        {
          ++report.failed;
        }
        auto it = _connections.find(id);
        if (it != _connections.end())
        {
          bool wasActive = it->second.isActive;
          it->second.isBusy = false;
          applyResultLocked(it->second, ok, ok ? std::optional<double>(latency) : std::nullopt);
          if (wasActive && !it->second.isActive)
          {
            ++report.deactivated;
          }
        }
        serviceWaitersLocked(events);
      }
      _cv.notify_all();
      publish(events);
    }

    RPCMESH_LOG_DEBUG("Connection health check: " << report.checked << " checked, " << report.failed
                                                  << " failed, " << report.deactivated
                                                  << " deactivated");
    return report;
  }

  /// \brief One auto-scaling step. Above the high-water mark one connection
  /// is added for the most loaded provider below its ceiling; below the
  /// low-water mark the longest-idle connection above the minimum is removed.
  ScaleDecision autoScale()
  {
    ScaleDecision decision;
    std::vector<rpc::Event> events;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (!acceptingLocked())
      {
        return decision;
      }
      decision.total = _connections.size();
      decision.utilization = utilizationLocked();

      if (decision.utilization > _config.scaleUpThreshold)
      {
        if (auto providerId = mostLoadedLocked())
        {
          createLocked(*providerId, events);
          ++_scaleUps;
          decision.action = ScaleAction::ScaledUp;
          decision.providerId = *providerId;
          decision.total = _connections.size();
          events.push_back(makeEvent(rpc::EventType::PoolScaled, *providerId, "scaled up",
                                     static_cast<double>(decision.total)));
          RPCMESH_LOG_INFO("Pool scaled up for " << *providerId << " at utilization "
                                                 << decision.utilization << ", now "
                                                 << decision.total << " connection(s)");
          serviceWaitersLocked(events);
        }
      }
      else if (decision.utilization < _config.scaleDownThreshold && !_connections.empty())
      {
        auto victim = longestIdleLocked();
        if (victim != _connections.end())
        {
          decision.providerId = victim->second.providerId;
          destroyLocked(victim, "scaled down", events);
          ++_scaleDowns;
          decision.action = ScaleAction::ScaledDown;
          decision.total = _connections.size();
          events.push_back(makeEvent(rpc::EventType::PoolScaled, decision.providerId,
                                     "scaled down", static_cast<double>(decision.total)));
          RPCMESH_LOG_INFO("Pool scaled down for " << decision.providerId << " at utilization "
                                                   << decision.utilization << ", now "
                                                   << decision.total << " connection(s)");
        }
      }
    }
    publish(events);
    return decision;
  }

  /// \brief Evict dead, unleasable, aged and idle connections, then top
  /// providers back up to the minimum. Idle eviction keeps each provider at
  /// its minimum; age eviction does not.
  CleanupReport cleanup()
  {
    CleanupReport report;
    std::vector<rpc::Event> events;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      auto now = _clock->now();
      std::vector<std::string> ids;
      for (const auto &entry : _connections)
      {
        ids.push_back(entry.first);
      }
      for (const auto &id : ids)
      {
        auto it = _connections.find(id);
        Connection &conn = it->second;
        if (!conn.isActive || (!conn.isBusy && !conn.health.isHealthy()))
        {
          if (!conn.isBusy)
          {
            destroyLocked(it, "unhealthy", events);
            ++report.unhealthy;
          }
        }
        else if (now - conn.createdAt >= _config.maxAge)
        {
          if (conn.isBusy)
          {
            conn.isActive = false;
            ++report.retired;
          }
          else
          {
            destroyLocked(it, "max age reached", events);
            ++report.expired;
          }
        }
        else if (!conn.isBusy && now - conn.lastUsedAt >= _config.idleTimeout &&
                 countForLocked(conn.providerId) > _config.minConnections)
        {
          destroyLocked(it, "idle timeout", events);
          ++report.idle;
        }
      }
      if (acceptingLocked())
      {
        for (const auto &entry : _providers)
        {
          report.replenished += prewarmProviderLocked(entry.first, events);
        }
      }
      serviceWaitersLocked(events);
    }
    _cv.notify_all();
    publish(events);
    if (report.expired + report.idle + report.unhealthy + report.retired > 0)
    {
      RPCMESH_LOG_DEBUG("Pool cleanup: " << report.expired << " expired, " << report.idle
                                         << " idle, " << report.unhealthy << " unhealthy, "
                                         << report.retired << " retired, " << report.replenished
                                         << " replenished");
    }
    return report;
  }

  /// \brief Grow or shrink a provider's connection count. Growth is capped by
  /// the provider and global ceilings; shrinking removes idle connections
  /// least recently used first. Returns the resulting count.
  std::size_t scaleTo(const std::string &providerId, std::size_t target)
  {
    std::vector<rpc::Event> events;
    std::size_t before = 0;
    std::size_t after = 0;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      auto slot = _providers.find(providerId);
      if (slot == _providers.end())
      {
        throw rpc::RpcError("Provider '" + providerId + "' is not registered with the pool");
      }
      before = countForLocked(providerId);
      target = std::min(target, slot->second.maxConnections);
      if (target > before)
      {
        for (std::size_t n = before; n < target && hasCapacityLocked(providerId); ++n)
        {
          createLocked(providerId, events);
        }
        serviceWaitersLocked(events);
      }
      else if (target < before)
      {
        std::vector<std::map<std::string, Connection>::iterator> idle;
        for (auto it = _connections.begin(); it != _connections.end(); ++it)
        {
          if (it->second.providerId == providerId && !it->second.isBusy)
          {
            idle.push_back(it);
          }
        }
        std::sort(idle.begin(), idle.end(), [](const auto &a, const auto &b) {
          return a->second.lastUsedAt < b->second.lastUsedAt;
        });
        std::size_t excess = std::min(before - target, idle.size());
        for (std::size_t i = 0; i < excess; ++i)
        {
          destroyLocked(idle[i], "scaled to target", events);
        }
      }
      after = countForLocked(providerId);
      if (after != before)
      {
        events.push_back(makeEvent(rpc::EventType::PoolScaled, providerId, "scaled to target",
                                   static_cast<double>(after)));
      }
    }
    publish(events);
    if (after != before)
    {
      RPCMESH_LOG_INFO("Scaled " << providerId << " connections from " << before << " to "
                                 << after << " (target " << target << ")");
    }
    return after;
  }

  /// \brief Top every provider up to the minimum. Returns connections created.
  std::size_t prewarm()
  {
    std::vector<rpc::Event> events;
    std::size_t created = 0;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      for (const auto &entry : _providers)
      {
        created += prewarmProviderLocked(entry.first, events);
      }
      serviceWaitersLocked(events);
    }
    _cv.notify_all();
    publish(events);
    return created;
  }

  PoolStats stats() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    PoolStats s;
    for (const auto &entry : _providers)
    {
      auto &p = s.providers[entry.first];
      p.chain = entry.second.chain;
      p.maxConnections = entry.second.maxConnections;
    }
    for (const auto &entry : _connections)
    {
      const Connection &conn = entry.second;
      auto &p = s.providers[conn.providerId];
      ++s.total;
      ++p.total;
      if (conn.isBusy)
      {
        ++s.busy;
        ++p.busy;
      }
      else
      {
        ++s.idle;
        ++p.idle;
      }
    }
    for (const auto &waiter : _waiters)
    {
      ++s.waiting;
      ++s.providers[waiter->providerId].waiting;
    }
    s.utilization = utilizationLocked();
    s.created = _created;
    s.destroyed = _destroyed;
    s.scaleUps = _scaleUps;
    s.scaleDowns = _scaleDowns;
    s.acquireTimeouts = _acquireTimeouts;
    return s;
  }

  std::vector<ConnectionInfo> connections() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    std::vector<ConnectionInfo> out;
    out.reserve(_connections.size());
    for (const auto &entry : _connections)
    {
      out.push_back(infoOf(entry.second));
    }
    return out;
  }

  std::optional<ConnectionInfo> connection(const std::string &connectionId) const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _connections.find(connectionId);
    if (it == _connections.end())
    {
      return std::nullopt;
    }
    return infoOf(it->second);
  }

  std::size_t size() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _connections.size();
  }

  std::size_t size(const std::string &providerId) const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return countForLocked(providerId);
  }

  std::size_t waitingCount() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _waiters.size();
  }

  // ═══════════════════════════════════════════════════════════════════
  // ILifecycleManaged
  // ═══════════════════════════════════════════════════════════════════

  common::LifecycleResult start() override
  {
    std::vector<rpc::Event> events;
    std::size_t created = 0;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_state == common::LifecycleState::Running)
      {
        return {true, _state, "ConnectionPool already running"};
      }
      if (_state != common::LifecycleState::Created && _state != common::LifecycleState::Reset)
      {
        return {false, _state, "ConnectionPool cannot start from state " +
                                   std::string(common::lifecycleStateToString(_state))};
      }
      _state = common::LifecycleState::Running;
      for (const auto &entry : _providers)
      {
        created += prewarmProviderLocked(entry.first, events);
      }
    }
    publish(events);
    RPCMESH_LOG_INFO("Connection pool started (" << strategyToString(strategy()) << ", "
                                                 << created << " pre-warmed)");
    return {true, common::LifecycleState::Running, "ConnectionPool started"};
  }

  /// Fails every waiter with PoolDraining, then waits until no connection
  /// is busy or the timeout expires.
  common::LifecycleResult drain(std::uint32_t timeoutMs = 30000) override
  {
    std::unique_lock<std::mutex> lock(_mutex);
    if (_state != common::LifecycleState::Running && _state != common::LifecycleState::Created)
    {
      return {false, _state, "ConnectionPool is not running"};
    }
    _state = common::LifecycleState::Draining;
    auto busyAtStart = static_cast<std::uint32_t>(busyCountLocked());
    auto rejected = static_cast<std::uint32_t>(rejectWaitersLocked("Connection pool is draining"));
    _cv.notify_all();

    bool finished = _cv.wait_for(lock, std::chrono::milliseconds(timeoutMs),
                                 [this]() { return busyCountLocked() == 0; });
    auto remaining = static_cast<std::uint32_t>(busyCountLocked());
    common::DrainStats stats(busyAtStart + rejected, remaining, rejected,
                             busyAtStart >= remaining ? busyAtStart - remaining : 0);
    lock.unlock();

    RPCMESH_LOG_INFO("Connection pool drained: " << stats.completed << " released, " << rejected
                                                 << " waiter(s) rejected, " << remaining
                                                 << " still busy");
    return {finished, common::LifecycleState::Draining,
            finished ? "ConnectionPool drained" : "ConnectionPool drain timed out", stats};
  }

  common::LifecycleResult stop() override
  {
    std::vector<rpc::Event> events;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_state == common::LifecycleState::Stopped || _state == common::LifecycleState::Reset)
      {
        return {true, _state, "ConnectionPool already stopped"};
      }
      _state = common::LifecycleState::Stopped;
      rejectWaitersLocked("Connection pool stopped");
      while (!_connections.empty())
      {
        destroyLocked(_connections.begin(), "pool stopped", events);
      }
    }
    _cv.notify_all();
    publish(events);
    return {true, common::LifecycleState::Stopped, "ConnectionPool stopped"};
  }

  common::LifecycleResult reset() override
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_state != common::LifecycleState::Stopped)
    {
      return {false, _state, "ConnectionPool must be stopped before reset"};
    }
    _created = 0;
    _destroyed = 0;
    _scaleUps = 0;
    _scaleDowns = 0;
    _acquireTimeouts = 0;
    _state = common::LifecycleState::Reset;
    return {true, _state, "ConnectionPool reset"};
  }

  common::LifecycleState getState() const override
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _state;
  }

  std::uint32_t getInFlightCount() const override
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return static_cast<std::uint32_t>(busyCountLocked() + _waiters.size());
  }

private:
  struct Connection
  {
    std::string id;
    std::string providerId;
    bool isBusy = false;
    bool isActive = true;
    core::Clock::TimePoint createdAt{};
    core::Clock::TimePoint lastUsedAt{};
    std::uint64_t requestCount = 0;
    std::uint64_t errorCount = 0;
    ConnectionHealth health;
  };

  struct ProviderSlot
  {
    std::string chain;
    std::size_t maxConnections = 1;
  };

  struct Waiter
  {
    std::string providerId;
    int priority = 0;
    std::uint64_t seq = 0;
    core::Clock::TimePoint enqueuedAt{};
    bool done = false;
    std::string assigned;
    std::exception_ptr error;
  };

  using ConnectionMap = std::map<std::string, Connection>;

  bool acceptingLocked() const
  {
    return _state == common::LifecycleState::Created || _state == common::LifecycleState::Running;
  }

  void checkAcceptingLocked(const std::string &providerId) const
  {
    if (!acceptingLocked())
    {
      throw rpc::PoolDraining("Connection pool is not accepting acquires (state " +
                              std::string(common::lifecycleStateToString(_state)) + ")");
    }
    if (_providers.find(providerId) == _providers.end())
    {
      throw rpc::RpcError("Provider '" + providerId + "' is not registered with the pool");
    }
  }

  static ConnectionInfo infoOf(const Connection &conn)
  {
    ConnectionInfo info;
    info.id = conn.id;
    info.providerId = conn.providerId;
    info.isBusy = conn.isBusy;
    info.isActive = conn.isActive;
    info.createdAt = conn.createdAt;
    info.lastUsedAt = conn.lastUsedAt;
    info.requestCount = conn.requestCount;
    info.errorCount = conn.errorCount;
    info.consecutiveErrors = conn.health.consecutiveFailures();
    info.averageResponseMs = conn.health.averageResponseMs();
    info.healthScore = conn.health.healthScore();
    info.state = conn.health.getState();
    return info;
  }

  void applyResultLocked(Connection &conn, bool success, std::optional<double> latencyMs)
  {
    ++conn.requestCount;
    if (success)
    {
      conn.health.recordSuccess(latencyMs);
    }
    else
    {
      ++conn.errorCount;
      conn.health.recordFailure(latencyMs);
    }
    if (conn.isActive && conn.health.isDead())
    {
      conn.isActive = false;
      RPCMESH_LOG_WARN("Connection " << conn.id << " deactivated (score "
                                     << conn.health.healthScore() << ", "
                                     << conn.health.consecutiveFailures()
                                     << " consecutive failures)");
    }
  }

  std::size_t countForLocked(const std::string &providerId) const
  {
    return static_cast<std::size_t>(
        std::count_if(_connections.begin(), _connections.end(),
                      [&providerId](const auto &entry) { return entry.second.providerId == providerId; }));
  }

  std::vector<std::string> idsForLocked(const std::string &providerId) const
  {
    std::vector<std::string> ids;
    for (const auto &entry : _connections)
    {
      if (entry.second.providerId == providerId)
      {
        ids.push_back(entry.first);
      }
    }
    return ids;
  }

  std::size_t busyCountLocked() const
  {
    return static_cast<std::size_t>(std::count_if(
        _connections.begin(), _connections.end(), [](const auto &entry) { return entry.second.isBusy; }));
  }

  double utilizationLocked() const
  {
    if (_connections.empty())
    {
      return 0.0;
    }
    return static_cast<double>(busyCountLocked()) / static_cast<double>(_connections.size());
  }

  bool hasCapacityLocked(const std::string &providerId) const
  {
    auto slot = _providers.find(providerId);
    return slot != _providers.end() && _connections.size() < _config.maxTotalConnections &&
           countForLocked(providerId) < slot->second.maxConnections;
  }

  bool hasWaitersForLocked(const std::string &providerId) const
  {
    return std::any_of(_waiters.begin(), _waiters.end(),
                       [&providerId](const auto &w) { return w->providerId == providerId; });
  }

  ConnectionMap::iterator createLocked(const std::string &providerId,
                                       std::vector<rpc::Event> &events)
  {
    auto now = _clock->now();
    Connection conn{};
    conn.id = providerId + "-conn-" + std::to_string(++_nextConnectionSeq);
    conn.providerId = providerId;
    conn.createdAt = now;
    conn.lastUsedAt = now;
    conn.health = ConnectionHealth(_config.health);
    auto it = _connections.emplace(conn.id, std::move(conn)).first;
    ++_created;
    events.push_back(makeEvent(rpc::EventType::ConnectionCreated, providerId, it->first,
                               static_cast<double>(_connections.size())));
    RPCMESH_LOG_DEBUG("Connection " << it->first << " created, pool size "
                                    << _connections.size());
    return it;
  }

  void destroyLocked(ConnectionMap::iterator it, const std::string &reason,
                     std::vector<rpc::Event> &events)
  {
    std::string id = it->first;
    std::string providerId = it->second.providerId;
    _connections.erase(it);
    ++_destroyed;
    events.push_back(makeEvent(rpc::EventType::ConnectionRemoved, providerId, id + ": " + reason,
                               static_cast<double>(_connections.size())));
    RPCMESH_LOG_DEBUG("Connection " << id << " removed (" << reason << "), pool size "
                                    << _connections.size());
  }

  std::size_t prewarmProviderLocked(const std::string &providerId,
                                    std::vector<rpc::Event> &events)
  {
    std::size_t created = 0;
    while (countForLocked(providerId) < _config.minConnections && hasCapacityLocked(providerId))
    {
      createLocked(providerId, events);
      ++created;
    }
    return created;
  }

  /// Idle healthy connection picked by the strategy, else a new one if the
  /// ceilings allow. The result is marked busy.
  std::optional<std::string> tryAssignLocked(const std::string &providerId,
                                             std::vector<rpc::Event> &events)
  {
    std::vector<Candidate> candidates;
    for (const auto &entry : _connections)
    {
      const Connection &conn = entry.second;
      if (conn.providerId == providerId && !conn.isBusy && conn.isActive && conn.health.isHealthy())
      {
        candidates.push_back(Candidate{conn.id, conn.providerId, conn.requestCount, conn.errorCount,
                                       conn.health.averageResponseMs(), conn.health.healthScore()});
      }
    }

    ConnectionMap::iterator chosen = _connections.end();
    if (!candidates.empty())
    {
      std::size_t index = std::min(_balancer->pick(candidates), candidates.size() - 1);
      chosen = _connections.find(candidates[index].connectionId);
    }
    else if (hasCapacityLocked(providerId))
    {
      chosen = createLocked(providerId, events);
    }
    if (chosen == _connections.end())
    {
      return std::nullopt;
    }
    chosen->second.isBusy = true;
    chosen->second.lastUsedAt = _clock->now();
    return chosen->first;
  }

  /// Hands free connections to waiters by descending priority, then
  /// arrival order.
  void serviceWaitersLocked(std::vector<rpc::Event> &events)
  {
    if (_waiters.empty())
    {
      return;
    }
    std::vector<std::shared_ptr<Waiter>> ordered(_waiters.begin(), _waiters.end());
    std::sort(ordered.begin(), ordered.end(), [](const auto &a, const auto &b) {
      return a->priority != b->priority ? a->priority > b->priority : a->seq < b->seq;
    });
    bool served = false;
    for (auto &waiter : ordered)
    {
      if (auto id = tryAssignLocked(waiter->providerId, events))
      {
        waiter->assigned = *id;
        waiter->done = true;
        served = true;
        _waiters.erase(std::remove(_waiters.begin(), _waiters.end(), waiter), _waiters.end());
      }
    }
    if (served)
    {
      _cv.notify_all();
    }
  }

  std::size_t rejectWaitersLocked(const std::string &reason)
  {
    std::size_t count = _waiters.size();
    for (auto &waiter : _waiters)
    {
      waiter->error = std::make_exception_ptr(rpc::PoolDraining(reason));
      waiter->done = true;
    }
    _waiters.clear();
    if (count > 0)
    {
      RPCMESH_LOG_WARN("Rejected " << count << " connection waiter(s): " << reason);
    }
    return count;
  }

  /// Provider with the highest busy share that can still grow; more busy
  /// connections break ties. Providers with waiters count as fully loaded.
  std::optional<std::string> mostLoadedLocked() const
  {
    std::optional<std::string> best;
    double bestLoad = -1.0;
    std::size_t bestBusy = 0;
    for (const auto &entry : _providers)
    {
      if (!hasCapacityLocked(entry.first))
      {
        continue;
      }
      std::size_t total = 0;
      std::size_t busy = 0;
      for (const auto &c : _connections)
      {
        if (c.second.providerId == entry.first)
        {
          ++total;
          busy += c.second.isBusy ? 1 : 0;
        }
      }
      double load = hasWaitersForLocked(entry.first)
                        ? 1.0
                        : (total == 0 ? 0.0 : static_cast<double>(busy) / static_cast<double>(total));
      if (load > bestLoad || (load == bestLoad && busy > bestBusy))
      {
        best = entry.first;
        bestLoad = load;
        bestBusy = busy;
      }
    }
    return best;
  }

  ConnectionMap::iterator longestIdleLocked()
  {
    auto victim = _connections.end();
    for (auto it = _connections.begin(); it != _connections.end(); ++it)
    {
      if (it->second.isBusy || countForLocked(it->second.providerId) <= _config.minConnections)
      {
        continue;
      }
      if (victim == _connections.end() || it->second.lastUsedAt < victim->second.lastUsedAt)
      {
        victim = it;
      }
    }
    return victim;
  }

  rpc::Event makeEvent(rpc::EventType type, const std::string &providerId,
                       const std::string &message, double value) const
  {
    auto slot = _providers.find(providerId);
    return rpc::Event{type, providerId, slot == _providers.end() ? "" : slot->second.chain,
                      message, value, _clock->now()};
  }

  void publish(const std::vector<rpc::Event> &events) const
  {
    if (_events && !events.empty())
    {
      _events->publishAll(events);
    }
  }

  PoolConfig _config;
  std::shared_ptr<core::Clock> _clock;
  std::unique_ptr<ILoadBalancer> _balancer;
  rpc::EventBus *_events;
  HealthCheck _healthCheck;

  mutable std::mutex _mutex;
  std::condition_variable _cv;
  ConnectionMap _connections;
  std::map<std::string, ProviderSlot> _providers;
  std::vector<std::shared_ptr<Waiter>> _waiters;
  std::uint64_t _nextWaiterSeq = 0;
  std::uint64_t _nextConnectionSeq = 0;

  std::uint64_t _created = 0;
  std::uint64_t _destroyed = 0;
  std::uint64_t _scaleUps = 0;
  std::uint64_t _scaleDowns = 0;
  std::uint64_t _acquireTimeouts = 0;
  common::LifecycleState _state{common::LifecycleState::Created};
};

inline void ConnectionLease::recordResult(bool success, std::optional<double> latencyMs)
{
  if (_pool)
  {
    _pool->recordResult(_id, success, latencyMs);
  }
}

inline bool ConnectionLease::release()
{
  if (!_pool)
  {
    return false;
  }
  ConnectionPool *pool = _pool;
  _pool = nullptr;
  return pool->release(_id);
}

} // namespace pool
} // namespace rpcmesh
