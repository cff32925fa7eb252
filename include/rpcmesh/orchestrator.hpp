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
#include <cmath>
#include <exception>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "rpcmesh/common/i_lifecycle_managed.hpp"
#include "rpcmesh/config.hpp"
#include "rpcmesh/core/clock.hpp"
#include "rpcmesh/core/json.hpp"
#include "rpcmesh/core/logger.hpp"
#include "rpcmesh/core/random.hpp"
#include "rpcmesh/core/thread_pool.hpp"
#include "rpcmesh/core/timer.hpp"
#include "rpcmesh/pool/connection_pool.hpp"
#include "rpcmesh/rpc/dispatch_queue.hpp"
#include "rpcmesh/rpc/errors.hpp"
#include "rpcmesh/rpc/events.hpp"
#include "rpcmesh/rpc/health_monitor.hpp"
#include "rpcmesh/rpc/health_tracker.hpp"
#include "rpcmesh/rpc/provider_registry.hpp"
#include "rpcmesh/rpc/provider_selector.hpp"
#include "rpcmesh/rpc/request_executor.hpp"
#include "rpcmesh/rpc/response_cache.hpp"
#include "rpcmesh/rpc/stream_manager.hpp"
#include "rpcmesh/rpc/transport.hpp"
#include "rpcmesh/rpc/types.hpp"

namespace rpcmesh
{

/// \brief Entry point for application code.
///
/// Owns one registry, tracker, selector, executor, dispatch queue, response
/// cache, connection pool and stream manager, so independent instances can
/// coexist. The transport, clock and random source are injectable for tests.
///
/// Example:
/// \code
///   Orchestrator mesh(loadConfigFile("rpcmesh.toml"));
///   mesh.start();
///   auto block = mesh.call("ethereum", "eth_blockNumber");
///   auto pending = mesh.queueCall("bsc", "eth_gasPrice");
///   auto gas = pending.result.get();
///   mesh.drain(5000);
///   mesh.stop();
/// \endcode
class Orchestrator : public common::ILifecycleManaged
{
public:
  struct Dependencies
  {
    /// Defaults to JSON-RPC over HTTP(S).
    std::shared_ptr<rpc::IRpcTransport> transport;
    /// Defaults to the system clock.
    std::shared_ptr<core::Clock> clock;
    /// Defaults to an OpenSSL-seeded generator, or the configured seed.
    std::shared_ptr<core::RandomSource> random;
  };

  struct BatchItem
  {
    std::string method;
    core::Json params = core::Json::array();
    rpc::Urgency urgency = rpc::Urgency::Medium;
  };

  struct Metrics
  {
    std::uint64_t totalRequests = 0;
    std::uint64_t successfulRequests = 0;
    std::uint64_t failedRequests = 0;
    double successRate = 1.0;
    /// Average latency weighted by each provider's request count.
    double averageLatencyMs = 0.0;
    double costToday = 0.0;
    std::size_t providers = 0;
    std::size_t healthyProviders = 0;
    std::size_t blacklistedProviders = 0;
    std::size_t queuedRequests = 0;
    std::uint64_t cacheHits = 0;
    std::uint64_t cacheMisses = 0;
    std::size_t cacheEntries = 0;
    rpc::ExecutorStats executor;
    pool::PoolStats pool;
  };

  struct ProviderStatus
  {
    rpc::Provider provider;
    rpc::ProviderMetrics metrics;
    bool blacklisted = false;
    bool overBudget = false;
    bool eligible = false;
    double score = 0.0;
  };

  explicit Orchestrator(OrchestratorConfig config, Dependencies deps = {})
      : _config(std::move(config)), _clock(deps.clock ? deps.clock : core::SystemClock::instance()),
        _random(deps.random ? deps.random : makeRandom(_config.randomSeed)),
        _transport(deps.transport ? deps.transport : std::make_shared<rpc::HttpRpcTransport>()),
        _tracker(_config.tracker, _clock, &_events),
        _selector(_registry, _tracker, _random, _config.excludeUnhealthy),
        _executor(_config.executor, _selector, _tracker, _transport, _clock, &_events),
        _monitor(_config.monitor, _registry, _tracker, _transport, _clock),
        _cache(_config.cache, _clock),
        _workers(_config.workers.threads, _config.workers.queueSize,
                 [](std::exception_ptr error) { logTaskError(error); }),
        _dispatch(_config.dispatch, _selector, _executor, _workers),
        _pool(_config.pool, _clock, _random, &_events),
        _streams(_config.streams, _selector, _clock, &_events)
  {
    _logSubscription = _events.subscribe([](const rpc::Event &event) { logEvent(event); });
    _pool.setHealthCheck(
        [this](const std::string &providerId) { return checkProvider(providerId); });
    for (const auto &provider : _config.providers)
    {
      registerProvider(provider);
    }
  }

  ~Orchestrator() override
  {
    stop();
    _events.unsubscribe(_logSubscription);
  }

  Orchestrator(const Orchestrator &) = delete;
  Orchestrator &operator=(const Orchestrator &) = delete;

  // ═══════════════════════════════════════════════════════════════════
  // Registry
  // ═══════════════════════════════════════════════════════════════════

  /// \throws rpc::ConfigError for a malformed descriptor or a duplicate id.
  void registerProvider(const rpc::Provider &provider)
  {
    _registry.registerProvider(provider);
    _tracker.track(provider);
    _pool.addProvider(provider.id, provider.chain, provider.maxConnections);
    _events.publish(rpc::Event{rpc::EventType::ProviderAdded, provider.id, provider.chain,
                               provider.displayName(), 1.0, _clock->now()});
  }

  /// \brief Drop a provider with its metrics, ledger and connections.
  bool removeProvider(const std::string &providerId)
  {
    auto removed = _registry.removeProvider(providerId);
    if (!removed)
    {
      return false;
    }
    _tracker.untrack(providerId);
    _pool.removeProvider(providerId);
    _events.publish(rpc::Event{rpc::EventType::ProviderRemoved, providerId, removed->chain,
                               removed->displayName(), 0.0, _clock->now()});
    return true;
  }

  bool setProviderActive(const std::string &providerId, bool active)
  {
    if (!_registry.setActive(providerId, active))
    {
      return false;
    }
    auto provider = _registry.find(providerId);
    RPCMESH_LOG_INFO("Provider " << providerId << (active ? " activated" : " deactivated"));
    _events.publish(rpc::Event{rpc::EventType::ProviderStatusChanged, providerId,
                               provider ? provider->chain : std::string(),
                               active ? "activated" : "deactivated", active ? 1.0 : 0.0,
                               _clock->now()});
    return true;
  }

  bool deactivateProvider(const std::string &providerId)
  {
    return setProviderActive(providerId, false);
  }

  std::vector<rpc::Provider> providers() const { return _registry.all(); }

  // ═══════════════════════════════════════════════════════════════════
  // Calls
  // ═══════════════════════════════════════════════════════════════════

  /// \brief Synchronous call through selection, retry and failover.
  /// Cacheable methods are answered from the response cache while fresh.
  rpc::RpcResponse call(const std::string &chain, const std::string &method,
                        core::Json params = core::Json::array(),
                        rpc::Urgency urgency = rpc::Urgency::Medium)
  {
    return call(_executor.makeRequest(chain, method, std::move(params), urgency));
  }

  rpc::RpcResponse call(rpc::RpcRequest request)
  {
    checkAccepting();
    if (auto cached = fromCache(request))
    {
      return *cached;
    }
    rpc::RpcResponse response = _executor.execute(request);
    _cache.put(request.chain, request.method, request.params, response.result);
    return response;
  }

  /// \brief Run every item concurrently on the worker pool. Responses come
  /// back in item order; the first failure is rethrown once all finished.
  /// Must not be called from a worker thread.
  std::vector<rpc::RpcResponse> batchCall(const std::string &chain,
                                          const std::vector<BatchItem> &items)
  {
    checkAccepting();
    std::vector<std::future<rpc::RpcResponse>> futures;
    futures.reserve(items.size());
    for (const auto &item : items)
    {
      auto request = _executor.makeRequest(chain, item.method, item.params, item.urgency);
      futures.push_back(_workers.enqueueWithResult(
          [this](rpc::RpcRequest r) { return call(std::move(r)); }, std::move(request)));
    }

    std::vector<rpc::RpcResponse> responses;
    responses.reserve(items.size());
    std::exception_ptr firstError;
    for (auto &future : futures)
    {
      try
      {
        responses.push_back(future.get());
      }
      catch (const std::exception &)
      {
        if (!firstError)
        {
          firstError = std::current_exception();
        }
      }
    }
    if (firstError)
    {
      std::rethrow_exception(firstError);
    }
    return responses;
  }

  /// \brief Submit through the rate-limited dispatch queue. A fresh cached
  /// result resolves the handle immediately.
  /// \throws rpc::QueueSaturated when the chain's queue is full.
  rpc::QueuedCall queueCall(const std::string &chain, const std::string &method,
                            core::Json params = core::Json::array(),
                            rpc::Urgency urgency = rpc::Urgency::Medium)
  {
    checkAccepting();
    auto request = _executor.makeRequest(chain, method, std::move(params), urgency);
    if (auto cached = fromCache(request))
    {
      std::promise<rpc::RpcResponse> ready;
      ready.set_value(*cached);
      return rpc::QueuedCall{request.id, chain, ready.get_future()};
    }
    return _dispatch.enqueue(std::move(request));
  }

  bool cancelQueued(const std::string &requestId) { return _dispatch.cancel(requestId); }

  // ═══════════════════════════════════════════════════════════════════
  // Connection pool
  // ═══════════════════════════════════════════════════════════════════

  /// \throws rpc::AcquireTimeout, rpc::PoolDraining
  pool::ConnectionLease acquireConnection(const std::string &providerId, int priority = 0)
  {
    return _pool.acquire(providerId, priority);
  }

  bool releaseConnection(pool::ConnectionLease &lease) { return lease.release(); }

  // ═══════════════════════════════════════════════════════════════════
  // Streams
  // ═══════════════════════════════════════════════════════════════════

  /// \brief Open a persistent stream to the chain's best provider that has
  /// a wsUrl. Messages go to the handler set with setStreamHandler().
  /// \returns false when no such provider exists or the first connect failed.
  bool openStream(const std::string &chain)
  {
    checkAccepting();
    return _streams.openStream(chain);
  }

  bool closeStream(const std::string &chain) { return _streams.closeStream(chain); }

  void setStreamHandler(rpc::StreamManager::MessageHandler handler)
  {
    _streams.setMessageHandler(std::move(handler));
  }

  /// \brief eth_subscribe-style request, sent again after every reconnect.
  std::uint64_t subscribe(const std::string &chain, const std::string &method,
                          core::Json params = core::Json::array())
  {
    return _streams.subscribe(chain, method, std::move(params));
  }

  // ═══════════════════════════════════════════════════════════════════
  // Priority optimizers
  // ═══════════════════════════════════════════════════════════════════

  /// \brief priority = floor(successful / (costToday + 1) * 100)
  void optimizeForCost()
  {
    for (const auto &provider : _registry.all())
    {
      auto m = _tracker.metrics(provider.id);
      if (!m)
      {
        continue;
      }
      double efficiency = static_cast<double>(m->successfulRequests) / (m->costToday + 1.0);
      _registry.setPriority(provider.id, static_cast<int>(std::floor(efficiency * 100.0)));
    }
    RPCMESH_LOG_INFO("Provider priorities optimized for cost");
    _events.publish(rpc::Event{rpc::EventType::Optimized, "", "", "cost", 0.0, _clock->now()});
  }

  /// \brief priority = floor(1000 / (averageLatencyMs + 1))
  void optimizeForSpeed()
  {
    for (const auto &provider : _registry.all())
    {
      auto m = _tracker.metrics(provider.id);
      if (!m)
      {
        continue;
      }
      _registry.setPriority(provider.id,
                            static_cast<int>(std::floor(1000.0 / (m->averageLatencyMs + 1.0))));
    }
    RPCMESH_LOG_INFO("Provider priorities optimized for speed");
    _events.publish(rpc::Event{rpc::EventType::Optimized, "", "", "speed", 0.0, _clock->now()});
  }

  /// \brief Check the chain's usable providers and raise priorities by
  /// max(0, 20 - 2 * rank), fastest first. Failed checks rank last.
  /// Returns the priority boost given to each provider.
  std::map<std::string, int> optimizeForLatency(const std::string &chain)
  {
    constexpr double kFailedLatency = 999999.0;
    std::vector<std::pair<double, rpc::Provider>> measured;
    for (const auto &provider : _registry.forChain(chain))
    {
      if (!provider.isActive || _tracker.isBlacklisted(provider.id))
      {
        continue;
      }
      auto start = _clock->now();
      double latency = checkProvider(provider.id)
                           ? static_cast<double>(core::toMillis(_clock->now() - start))
                           : kFailedLatency;
      measured.emplace_back(latency, provider);
    }
    std::stable_sort(measured.begin(), measured.end(), [](const auto &a, const auto &b) {
      return a.first != b.first ? a.first < b.first : a.second.id < b.second.id;
    });

    std::map<std::string, int> boosts;
    for (std::size_t rank = 0; rank < measured.size(); ++rank)
    {
      int boost = std::max(0, 20 - 2 * static_cast<int>(rank));
      const auto &provider = measured[rank].second;
      _registry.setPriority(provider.id, provider.priority + boost);
      boosts[provider.id] = boost;
    }
    RPCMESH_LOG_INFO("Provider priorities for " << chain << " optimized for latency ("
                                                << measured.size() << " measured)");
    _events.publish(rpc::Event{rpc::EventType::Optimized, "", chain, "latency",
                               static_cast<double>(measured.size()), _clock->now()});
    return boosts;
  }

  // ═══════════════════════════════════════════════════════════════════
  // Observability
  // ═══════════════════════════════════════════════════════════════════

  Metrics getMetrics() const
  {
    Metrics out;
    double weightedLatency = 0.0;
    for (const auto &entry : _tracker.snapshot())
    {
      const auto &m = entry.second;
      ++out.providers;
      out.totalRequests += m.totalRequests;
      out.successfulRequests += m.successfulRequests;
      out.failedRequests += m.failedRequests;
      out.costToday += m.costToday;
      weightedLatency += m.averageLatencyMs * static_cast<double>(m.totalRequests);
      if (m.isHealthy)
      {
        ++out.healthyProviders;
      }
      if (_tracker.isBlacklisted(entry.first))
      {
        ++out.blacklistedProviders;
      }
    }
    if (out.totalRequests > 0)
    {
      out.successRate =
          static_cast<double>(out.successfulRequests) / static_cast<double>(out.totalRequests);
      out.averageLatencyMs = weightedLatency / static_cast<double>(out.totalRequests);
    }
    out.queuedRequests = _dispatch.pending();
    out.cacheHits = _cache.hits();
    out.cacheMisses = _cache.misses();
    out.cacheEntries = _cache.size();
    out.executor = _executor.stats();
    out.pool = _pool.stats();
    return out;
  }

  /// \brief Per-provider view, optionally limited to one chain, by id.
  std::vector<ProviderStatus> getProviderStatus(const std::string &chain = std::string()) const
  {
    std::vector<ProviderStatus> out;
    auto providers = chain.empty() ? _registry.all() : _registry.forChain(chain);
    for (auto &provider : providers)
    {
      auto m = _tracker.metrics(provider.id);
      if (!m)
      {
        continue;
      }
      ProviderStatus status;
      status.metrics = *m;
      status.blacklisted = _tracker.isBlacklisted(provider.id);
      status.overBudget = _tracker.isOverBudget(provider.id);
      status.eligible = _selector.isEligible(provider);
      status.score = rpc::ProviderSelector::score(provider, *m);
      status.provider = std::move(provider);
      out.push_back(std::move(status));
    }
    return out;
  }

  rpc::CostSummary getTotalCosts() const { return _tracker.totalCosts(); }

  /// \brief Chain name to whether any provider is eligible right now.
  std::map<std::string, bool> getConnectionStatus() const
  {
    std::map<std::string, bool> out;
    for (const auto &chain : _registry.chains())
    {
      out[chain] = _selector.best(chain).has_value();
    }
    return out;
  }

  rpc::EventBus &events() { return _events; }

  // ═══════════════════════════════════════════════════════════════════
  // Periodic work, scheduled by start() and callable directly
  // ═══════════════════════════════════════════════════════════════════

  rpc::HealthCheckReport runHealthChecks() { return _monitor.checkAll(); }

  std::size_t runDispatchTick() { return _dispatch.tick(); }

  pool::HealthCheckReport runPoolHealthChecks() { return _pool.runHealthChecks(); }

  pool::ScaleDecision runAutoScale() { return _pool.autoScale(); }

  pool::CleanupReport runPoolCleanup() { return _pool.cleanup(); }

  std::size_t runLedgerPurge() { return _tracker.purgeLedger(); }

  std::size_t runCachePurge() { return _cache.purgeExpired(); }

  void logMetricsSummary() const
  {
    Metrics m = getMetrics();
    RPCMESH_LOG_INFO("RPC metrics: " << m.totalRequests << " requests, success rate "
                                     << m.successRate * 100.0 << "%, avg latency "
                                     << m.averageLatencyMs << "ms, cost today " << m.costToday
                                     << ", " << m.healthyProviders << "/" << m.providers
                                     << " healthy, " << m.blacklistedProviders
                                     << " blacklisted, " << m.queuedRequests << " queued, pool "
                                     << m.pool.busy << "/" << m.pool.total << " busy");
  }

  // ═══════════════════════════════════════════════════════════════════
  // Component access
  // ═══════════════════════════════════════════════════════════════════

  const OrchestratorConfig &config() const { return _config; }
  rpc::ProviderRegistry &registry() { return _registry; }
  rpc::HealthTracker &tracker() { return _tracker; }
  const rpc::ProviderSelector &selector() const { return _selector; }
  rpc::RequestExecutor &executor() { return _executor; }
  rpc::DispatchQueue &dispatchQueue() { return _dispatch; }
  rpc::ResponseCache &cache() { return _cache; }
  pool::ConnectionPool &connectionPool() { return _pool; }
  rpc::StreamManager &streams() { return _streams; }

  // ═══════════════════════════════════════════════════════════════════
  // ILifecycleManaged
  // ═══════════════════════════════════════════════════════════════════

  common::LifecycleResult start() override
  {
    {
      std::lock_guard<std::mutex> lock(_stateMutex);
      if (_state == common::LifecycleState::Running)
      {
        return {true, _state, "Orchestrator already running"};
      }
      if (_state != common::LifecycleState::Created && _state != common::LifecycleState::Reset)
      {
        return {false, _state, "Orchestrator cannot start from state " +
                                   std::string(common::lifecycleStateToString(_state))};
      }
    }

    for (common::ILifecycleManaged *component :
         std::vector<common::ILifecycleManaged *>{&_workers, &_dispatch, &_pool, &_streams,
                                                  &_timer})
    {
      auto result = component->start();
      if (!result.success)
      {
        RPCMESH_LOG_ERROR("Orchestrator start failed: " << result.message);
        return {false, getState(), result.message};
      }
    }

    schedule("health-check", _config.healthCheckInterval, true, [this]() { runHealthChecks(); });
    schedule("dispatch", _config.dispatch.tickInterval, false, [this]() { runDispatchTick(); });
    schedule("pool-health", _config.pool.healthCheckInterval, true,
             [this]() { runPoolHealthChecks(); });
    schedule("pool-scale", _config.pool.scaleInterval, false, [this]() { runAutoScale(); });
    schedule("pool-cleanup", _config.pool.cleanupInterval, false, [this]() { runPoolCleanup(); });
    schedule("ledger-purge", _config.ledgerPurgeInterval, false, [this]() { runLedgerPurge(); });
    schedule("cache-purge", _config.cachePurgeInterval, false, [this]() { runCachePurge(); });
    schedule("metrics", _config.log.metricsInterval, false, [this]() { logMetricsSummary(); });

    std::lock_guard<std::mutex> lock(_stateMutex);
    _state = common::LifecycleState::Running;
    RPCMESH_LOG_INFO("Orchestrator started with " << _registry.size() << " provider(s) on "
                                                  << _registry.chains().size() << " chain(s)");
    return {true, _state, "Orchestrator started"};
  }

  /// Stops the loops and closes the streams, then drains the dispatch
  /// queue, the connection pool and the worker pool in that order within
  /// one overall timeout.
  common::LifecycleResult drain(std::uint32_t timeoutMs = 30000) override
  {
    {
      std::lock_guard<std::mutex> lock(_stateMutex);
      if (_state != common::LifecycleState::Running)
      {
        return {false, _state, "Orchestrator is not running"};
      }
      _state = common::LifecycleState::Draining;
    }
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    auto remainingMs = [deadline]() {
      auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now());
      return static_cast<std::uint32_t>(std::max<std::int64_t>(left.count(), 1));
    };

    _timer.drain(timeoutMs);
    common::DrainStats total;
    bool ok = true;
    for (common::ILifecycleManaged *component :
         std::vector<common::ILifecycleManaged *>{&_streams, &_dispatch, &_pool, &_workers})
    {
      auto result = component->drain(remainingMs());
      ok = ok && result.success;
      if (result.drainStats)
      {
        total.inFlightAtStart += result.drainStats->inFlightAtStart;
        total.remaining += result.drainStats->remaining;
        total.cancelled += result.drainStats->cancelled;
        total.completed += result.drainStats->completed;
      }
      if (!result.success)
      {
        RPCMESH_LOG_WARN("Drain: " << result.message);
      }
    }
    RPCMESH_LOG_INFO("Orchestrator drained: " << total.completed << " completed, "
                                              << total.cancelled << " cancelled, "
                                              << total.remaining << " remaining");
    return {ok, common::LifecycleState::Draining,
            ok ? "Orchestrator drained" : "Orchestrator drain incomplete", total};
  }

  common::LifecycleResult stop() override
  {
    {
      std::lock_guard<std::mutex> lock(_stateMutex);
      if (_state == common::LifecycleState::Stopped || _state == common::LifecycleState::Reset)
      {
        return {true, _state, "Orchestrator already stopped"};
      }
    }
    _timer.stop();
    _streams.stop();
    _dispatch.stop();
    _pool.stop();
    _workers.stop();
    {
      std::lock_guard<std::mutex> lock(_timersMutex);
      _timerIds.clear();
    }
    std::lock_guard<std::mutex> lock(_stateMutex);
    _state = common::LifecycleState::Stopped;
    RPCMESH_LOG_INFO("Orchestrator stopped");
    return {true, _state, "Orchestrator stopped"};
  }

  common::LifecycleResult reset() override
  {
    std::lock_guard<std::mutex> lock(_stateMutex);
    if (_state != common::LifecycleState::Stopped)
    {
      return {false, _state, "Orchestrator must be stopped before reset"};
    }
    _timer.reset();
    _dispatch.reset();
    _pool.reset();
    _streams.reset();
    _workers.reset();
    _cache.clear();
    _state = common::LifecycleState::Reset;
    return {true, _state, "Orchestrator reset"};
  }

  common::LifecycleState getState() const override
  {
    std::lock_guard<std::mutex> lock(_stateMutex);
    return _state;
  }

  std::uint32_t getInFlightCount() const override
  {
    return _dispatch.getInFlightCount() + _pool.getInFlightCount();
  }

private:
  static std::shared_ptr<core::RandomSource> makeRandom(std::optional<std::uint64_t> seed)
  {
    if (seed)
    {
      return std::make_shared<core::SeededRandom>(*seed);
    }
    return std::make_shared<core::SeededRandom>();
  }

  static void logTaskError(std::exception_ptr error)
  {
    try
    {
      if (error)
      {
        std::rethrow_exception(error);
      }
    }
    catch (const std::exception &e)
    {
      RPCMESH_LOG_ERROR("Background task failed: " << e.what());
    }
  }

  static void logEvent(const rpc::Event &event)
  {
    switch (event.type)
    {
    case rpc::EventType::ProviderBlacklisted:
    case rpc::EventType::BudgetExceeded:
      RPCMESH_LOG_WARN("Event " << rpc::eventTypeToString(event.type) << " " << event.providerId
                                << ": " << event.message);
      break;
    case rpc::EventType::HealthChanged:
    case rpc::EventType::PoolScaled:
    case rpc::EventType::ProviderAdded:
    case rpc::EventType::ProviderRemoved:
    case rpc::EventType::ProviderStatusChanged:
      RPCMESH_LOG_INFO("Event " << rpc::eventTypeToString(event.type) << " " << event.providerId
                                << ": " << event.message << " (" << event.value << ")");
      break;
    default:
      RPCMESH_LOG_TRACE("Event " << rpc::eventTypeToString(event.type) << " " << event.providerId
                                 << ": " << event.message);
      break;
    }
  }

  void checkAccepting() const
  {
    auto state = getState();
    if (state != common::LifecycleState::Created && state != common::LifecycleState::Running)
    {
      throw rpc::RpcError("Orchestrator is not accepting calls (state " +
                          std::string(common::lifecycleStateToString(state)) + ")");
    }
  }

  std::optional<rpc::RpcResponse> fromCache(const rpc::RpcRequest &request)
  {
    auto hit = _cache.get(request.chain, request.method, request.params);
    if (!hit)
    {
      return std::nullopt;
    }
    rpc::RpcResponse response;
    response.requestId = request.id;
    response.result = std::move(*hit);
    response.fromCache = true;
    return response;
  }

  /// Canonical check call against one provider; used by the pool and the
  /// latency optimizer.
  bool checkProvider(const std::string &providerId)
  {
    auto provider = _registry.find(providerId);
    if (!provider)
    {
      return false;
    }
    try
    {
      _transport->send(*provider, _monitor.checkMethodFor(provider->chain), core::Json::array(),
                       _config.monitor.checkTimeout);
      return true;
    }
    catch (const std::exception &e)
    {
      RPCMESH_LOG_DEBUG("Health check of " << providerId << " failed: " << e.what());
      return false;
    }
  }

  /// Periodic loop on the timer thread. Offloaded loops run on the worker
  /// pool instead and are skipped while a previous run is still going.
  void schedule(const std::string &name, std::chrono::milliseconds interval, bool offload,
                std::function<void()> body)
  {
    auto busy = std::make_shared<std::atomic<bool>>(false);
    auto guarded = [name, body]() {
      try
      {
        body();
      }
      catch (const std::exception &e)
      {
        RPCMESH_LOG_ERROR("Periodic task " << name << " failed: " << e.what());
      }
    };
    std::function<void()> handler;
    if (offload)
    {
      handler = [this, name, guarded, busy]() {
        if (busy->exchange(true))
        {
          RPCMESH_LOG_DEBUG("Periodic task " << name << " still running, skipped");
          return;
        }
        bool queued = _workers.tryEnqueue([guarded, busy]() {
          guarded();
          busy->store(false);
        });
        if (!queued)
        {
          busy->store(false);
        }
      };
    }
    else
    {
      handler = guarded;
    }
    auto id = _timer.schedulePeriodic(interval, std::move(handler));
    std::lock_guard<std::mutex> lock(_timersMutex);
    _timerIds[name] = id;
  }

  OrchestratorConfig _config;
  std::shared_ptr<core::Clock> _clock;
  std::shared_ptr<core::RandomSource> _random;
  std::shared_ptr<rpc::IRpcTransport> _transport;

  rpc::EventBus _events;
  rpc::EventBus::SubscriptionId _logSubscription = 0;
  rpc::ProviderRegistry _registry;
  rpc::HealthTracker _tracker;
  rpc::ProviderSelector _selector;
  rpc::RequestExecutor _executor;
  rpc::HealthMonitor _monitor;
  rpc::ResponseCache _cache;
  core::ThreadPool _workers;
  rpc::DispatchQueue _dispatch;
  pool::ConnectionPool _pool;
  rpc::StreamManager _streams;
  core::TimerService _timer{"rpcmesh-loops"};

  mutable std::mutex _timersMutex;
  std::map<std::string, core::TimerService::TimerId> _timerIds;
  mutable std::mutex _stateMutex;
  common::LifecycleState _state{common::LifecycleState::Created};
};

/// \brief JSON form of getMetrics(), as printed by rpcmeshd --status.
inline core::Json metricsToJson(const Orchestrator::Metrics &m)
{
  core::Json providers = core::Json::object();
  for (const auto &entry : m.pool.providers)
  {
    providers[entry.first] = {{"chain", entry.second.chain},
                              {"total", entry.second.total},
                              {"busy", entry.second.busy},
                              {"idle", entry.second.idle},
                              {"waiting", entry.second.waiting},
                              {"maxConnections", entry.second.maxConnections}};
  }
  return {{"totalRequests", m.totalRequests},
          {"successfulRequests", m.successfulRequests},
          {"failedRequests", m.failedRequests},
          {"successRate", m.successRate},
          {"averageLatencyMs", m.averageLatencyMs},
          {"costToday", m.costToday},
          {"providers", m.providers},
          {"healthyProviders", m.healthyProviders},
          {"blacklistedProviders", m.blacklistedProviders},
          {"queuedRequests", m.queuedRequests},
          {"cache", {{"hits", m.cacheHits}, {"misses", m.cacheMisses}, {"entries", m.cacheEntries}}},
          {"executor",
           {{"requests", m.executor.requests},
            {"succeeded", m.executor.succeeded},
            {"failed", m.executor.failed},
            {"attempts", m.executor.attempts},
            {"retries", m.executor.retries},
            {"failovers", m.executor.failovers},
            {"exhausted", m.executor.exhausted}}},
          {"pool",
           {{"total", m.pool.total},
            {"busy", m.pool.busy},
            {"idle", m.pool.idle},
            {"waiting", m.pool.waiting},
            {"utilization", m.pool.utilization},
            {"created", m.pool.created},
            {"destroyed", m.pool.destroyed},
            {"scaleUps", m.pool.scaleUps},
            {"scaleDowns", m.pool.scaleDowns},
            {"acquireTimeouts", m.pool.acquireTimeouts},
            {"providers", providers}}}};
}

inline core::Json providerStatusToJson(const std::vector<Orchestrator::ProviderStatus> &statuses)
{
  core::Json out = core::Json::array();
  for (const auto &s : statuses)
  {
    out.push_back({{"id", s.provider.id},
                   {"name", s.provider.displayName()},
                   {"chain", s.provider.chain},
                   {"tier", rpc::tierToString(s.provider.tier)},
                   {"priority", s.provider.priority},
                   {"active", s.provider.isActive},
                   {"healthy", s.metrics.isHealthy},
                   {"blacklisted", s.blacklisted},
                   {"overBudget", s.overBudget},
                   {"eligible", s.eligible},
                   {"score", s.score},
                   {"totalRequests", s.metrics.totalRequests},
                   {"successRate", s.metrics.successRate()},
                   {"averageLatencyMs", s.metrics.averageLatencyMs},
                   {"costToday", s.metrics.costToday}});
  }
  return out;
}

} // namespace rpcmesh
