// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of RpcMesh, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "rpcmesh/core/config_loader.hpp"
#include "rpcmesh/core/logger.hpp"
#include "rpcmesh/pool/connection_pool.hpp"
#include "rpcmesh/pool/load_balancer.hpp"
#include "rpcmesh/rpc/dispatch_queue.hpp"
#include "rpcmesh/rpc/errors.hpp"
#include "rpcmesh/rpc/health_monitor.hpp"
#include "rpcmesh/rpc/health_tracker.hpp"
#include "rpcmesh/rpc/provider_registry.hpp"
#include "rpcmesh/rpc/request_executor.hpp"
#include "rpcmesh/rpc/response_cache.hpp"
#include "rpcmesh/rpc/stream_manager.hpp"
#include "rpcmesh/rpc/types.hpp"

namespace rpcmesh
{

/// \brief Everything an Orchestrator is built from, mirroring the TOML
/// tables [logging], [rpc], [dispatch], [cache], [pool], [streams] and
/// [[providers]].
struct OrchestratorConfig
{
  struct LogConfig
  {
    core::Logger::Level level = core::Logger::Level::Info;
    /// Empty keeps console output.
    std::string file;
    std::string format;
    int retentionDays = 7;
    /// Period of the aggregate metrics summary line.
    std::chrono::milliseconds metricsInterval{5 * 60 * 1000};
  } log;

  rpc::HealthTrackerConfig tracker;
  rpc::ExecutorConfig executor;
  rpc::HealthMonitorConfig monitor;
  std::chrono::milliseconds healthCheckInterval{60000};
  std::chrono::milliseconds ledgerPurgeInterval{60 * 60 * 1000};
  bool excludeUnhealthy = false;
  /// Fixed seed for the selection RNG; random when unset.
  std::optional<std::uint64_t> randomSeed;

  rpc::DispatchQueueConfig dispatch;

  struct WorkerConfig
  {
    std::size_t threads = 4;
    std::size_t queueSize = 4096;
  } workers;

  rpc::ResponseCacheConfig cache;
  std::chrono::milliseconds cachePurgeInterval{60000};

  pool::PoolConfig pool;

  rpc::StreamConfig streams;

  std::vector<rpc::Provider> providers;
};

namespace detail
{

inline std::chrono::milliseconds positiveMillis(const core::ConfigLoader &cfg,
                                                const std::string &key,
                                                std::chrono::milliseconds fallback)
{
  auto value = cfg.getInt(key);
  if (!value)
  {
    return fallback;
  }
  if (*value <= 0)
  {
    throw rpc::ConfigError(cfg.origin() + "." + key + " must be positive");
  }
  return std::chrono::milliseconds(*value);
}

template <typename T>
T nonNegative(const core::ConfigLoader &cfg, const std::string &key, T fallback)
{
  auto value = cfg.getInt(key);
  if (!value)
  {
    return fallback;
  }
  if (*value < 0)
  {
    throw rpc::ConfigError(cfg.origin() + "." + key + " must not be negative");
  }
  return static_cast<T>(*value);
}

inline double fraction(const core::ConfigLoader &cfg, const std::string &key, double fallback)
{
  double value = cfg.getDouble(key).value_or(fallback);
  if (value < 0.0 || value > 1.0)
  {
    throw rpc::ConfigError(cfg.origin() + "." + key + " must be between 0 and 1");
  }
  return value;
}

inline void loadLogging(const core::ConfigLoader &cfg, OrchestratorConfig::LogConfig &log)
{
  if (auto level = cfg.getString("level"))
  {
    auto parsed = core::Logger::levelFromString(*level);
    if (!parsed)
    {
      throw rpc::ConfigError("unknown log level '" + *level + "'");
    }
    log.level = *parsed;
  }
  log.file = cfg.getString("file").value_or(log.file);
  log.format = cfg.getString("format").value_or(log.format);
  log.retentionDays = nonNegative<int>(cfg, "retention_days", log.retentionDays);
  log.metricsInterval = positiveMillis(cfg, "metrics_interval_ms", log.metricsInterval);
}

inline void loadRpc(const core::ConfigLoader &cfg, OrchestratorConfig &out)
{
  out.executor.maxRetries = nonNegative<std::uint32_t>(cfg, "max_retries", out.executor.maxRetries);
  auto delay = cfg.getInt("retry_delay_ms");
  if (delay)
  {
    if (*delay < 0)
    {
      throw rpc::ConfigError(cfg.origin() + ".retry_delay_ms must not be negative");
    }
    out.executor.retryDelay = std::chrono::milliseconds(*delay);
  }
  out.executor.maxRetryDelay =
      positiveMillis(cfg, "max_retry_delay_ms", out.executor.maxRetryDelay);
  out.executor.requestTimeout =
      positiveMillis(cfg, "request_timeout_ms", out.executor.requestTimeout);
  if (auto codes = cfg.getIntArray("transient_error_codes"))
  {
    out.executor.transientErrorCodes.clear();
    for (auto code : *codes)
    {
      out.executor.transientErrorCodes.insert(static_cast<int>(code));
    }
  }
  if (auto patterns = cfg.getStringArray("transient_patterns"))
  {
    out.executor.transientMessagePatterns = *patterns;
  }

  out.healthCheckInterval = positiveMillis(cfg, "health_check_interval_ms", out.healthCheckInterval);
  out.monitor.checkTimeout = positiveMillis(cfg, "check_timeout_ms", out.monitor.checkTimeout);
  out.monitor.defaultCheckMethod =
      cfg.getString("check_method").value_or(out.monitor.defaultCheckMethod);
  if (auto methods = cfg.getTable("check_methods"))
  {
    for (const auto &chain : methods->keys())
    {
      auto method = methods->getString(chain);
      if (!method || method->empty())
      {
        throw rpc::ConfigError(methods->origin() + "." + chain + " must be a method name");
      }
      out.monitor.checkMethods[chain] = *method;
    }
  }

  out.tracker.blacklistDuration =
      positiveMillis(cfg, "blacklist_duration_ms", out.tracker.blacklistDuration);
  out.tracker.dailyBudget = cfg.getDouble("daily_budget").value_or(out.tracker.dailyBudget);
  if (auto hours = cfg.getInt("cost_window_hours"))
  {
    if (*hours <= 0)
    {
      throw rpc::ConfigError(cfg.origin() + ".cost_window_hours must be positive");
    }
    out.tracker.costWindow = std::chrono::hours(*hours);
  }
  out.tracker.minSamples = nonNegative<std::uint32_t>(cfg, "min_samples", out.tracker.minSamples);
  out.tracker.healthyThreshold =
      fraction(cfg, "healthy_threshold", out.tracker.healthyThreshold);
  out.ledgerPurgeInterval = positiveMillis(cfg, "ledger_purge_interval_ms", out.ledgerPurgeInterval);
  out.excludeUnhealthy = cfg.getBool("exclude_unhealthy").value_or(out.excludeUnhealthy);
  if (auto seed = cfg.getInt("seed"))
  {
    out.randomSeed = static_cast<std::uint64_t>(*seed);
  }
}

inline void loadDispatch(const core::ConfigLoader &cfg, OrchestratorConfig &out)
{
  out.dispatch.maxQueueDepth =
      nonNegative<std::size_t>(cfg, "max_queue_depth", out.dispatch.maxQueueDepth);
  if (out.dispatch.maxQueueDepth == 0)
  {
    throw rpc::ConfigError(cfg.origin() + ".max_queue_depth must be positive");
  }
  out.dispatch.tickInterval = positiveMillis(cfg, "tick_interval_ms", out.dispatch.tickInterval);
  out.workers.threads = nonNegative<std::size_t>(cfg, "worker_threads", out.workers.threads);
  out.workers.queueSize = nonNegative<std::size_t>(cfg, "worker_queue_size", out.workers.queueSize);
  if (out.workers.threads == 0 || out.workers.queueSize == 0)
  {
    throw rpc::ConfigError(cfg.origin() + " worker_threads and worker_queue_size must be positive");
  }
}

inline void loadCache(const core::ConfigLoader &cfg, OrchestratorConfig &out)
{
  out.cache.enabled = cfg.getBool("enabled").value_or(out.cache.enabled);
  out.cache.maxEntries = nonNegative<std::size_t>(cfg, "max_entries", out.cache.maxEntries);
  out.cache.defaultTtl = positiveMillis(cfg, "default_ttl_ms", out.cache.defaultTtl);
  out.cachePurgeInterval = positiveMillis(cfg, "purge_interval_ms", out.cachePurgeInterval);
  if (auto methods = cfg.getStringArray("methods"))
  {
    out.cache.extraMethods.insert(methods->begin(), methods->end());
  }
  if (auto ttls = cfg.getTable("ttl_ms"))
  {
    for (const auto &method : ttls->keys())
    {
      out.cache.ttls[method] = positiveMillis(*ttls, method, out.cache.defaultTtl);
    }
  }
}

inline void loadPool(const core::ConfigLoader &cfg, OrchestratorConfig &out)
{
  auto &pool = out.pool;
  pool.minConnections = nonNegative<std::size_t>(cfg, "min_connections", pool.minConnections);
  pool.maxTotalConnections =
      nonNegative<std::size_t>(cfg, "max_total_connections", pool.maxTotalConnections);
  if (pool.maxTotalConnections == 0)
  {
    throw rpc::ConfigError(cfg.origin() + ".max_total_connections must be positive");
  }
  pool.connectionTimeout = positiveMillis(cfg, "connection_timeout_ms", pool.connectionTimeout);
  pool.idleTimeout = positiveMillis(cfg, "idle_timeout_ms", pool.idleTimeout);
  pool.maxAge = positiveMillis(cfg, "max_age_ms", pool.maxAge);
  pool.healthCheckInterval =
      positiveMillis(cfg, "health_check_interval_ms", pool.healthCheckInterval);
  pool.scaleInterval = positiveMillis(cfg, "scale_interval_ms", pool.scaleInterval);
  pool.cleanupInterval = positiveMillis(cfg, "cleanup_interval_ms", pool.cleanupInterval);
  pool.scaleUpThreshold = fraction(cfg, "scale_up_threshold", pool.scaleUpThreshold);
  pool.scaleDownThreshold = fraction(cfg, "scale_down_threshold", pool.scaleDownThreshold);
  if (pool.scaleDownThreshold >= pool.scaleUpThreshold)
  {
    throw rpc::ConfigError(cfg.origin() + ".scale_down_threshold must be below scale_up_threshold");
  }
  if (auto strategy = cfg.getString("strategy"))
  {
    try
    {
      pool.strategy = pool::strategyFromString(*strategy);
    }
    catch (const std::invalid_argument &e)
    {
      throw rpc::ConfigError(e.what());
    }
  }
  pool.health.maxConsecutiveFailures =
      nonNegative<int>(cfg, "max_consecutive_failures", pool.health.maxConsecutiveFailures);
}

inline void loadStreams(const core::ConfigLoader &cfg, OrchestratorConfig &out)
{
  out.streams.connectTimeout =
      positiveMillis(cfg, "connect_timeout_ms", out.streams.connectTimeout);
  out.streams.reconnectDelay =
      positiveMillis(cfg, "reconnect_delay_ms", out.streams.reconnectDelay);
  out.streams.reconnect = cfg.getBool("reconnect").value_or(out.streams.reconnect);
  out.streams.maxMessageSize =
      nonNegative<std::size_t>(cfg, "max_message_size", out.streams.maxMessageSize);
  if (out.streams.maxMessageSize == 0)
  {
    throw rpc::ConfigError(cfg.origin() + ".max_message_size must be positive");
  }
}

inline rpc::Provider loadProvider(const core::ConfigLoader &cfg)
{
  rpc::Provider p;
  p.id = cfg.getString("id").value_or("");
  p.name = cfg.getString("name").value_or("");
  p.chain = cfg.getString("chain").value_or("");
  p.url = cfg.getString("url").value_or("");
  p.wsUrl = cfg.getString("ws_url").value_or("");
  p.apiKey = cfg.getString("api_key").value_or("");
  if (auto tier = cfg.getString("tier"))
  {
    auto parsed = rpc::tierFromString(*tier);
    if (!parsed)
    {
      throw rpc::ConfigError(cfg.origin() + " has unknown tier '" + *tier + "'");
    }
    p.tier = *parsed;
  }
  if (auto rate = cfg.getInt("rate_limit"))
  {
    if (*rate <= 0)
    {
      throw rpc::ConfigError(cfg.origin() + ".rate_limit must be positive");
    }
    p.rateLimit = static_cast<std::uint32_t>(*rate);
  }
  p.costPerThousand = cfg.getDouble("cost_per_thousand").value_or(p.costPerThousand);
  p.priority = static_cast<int>(cfg.getInt("priority").value_or(p.priority));
  p.isActive = cfg.getBool("active").value_or(p.isActive);
  if (auto maxConnections = cfg.getInt("max_connections"))
  {
    if (*maxConnections <= 0)
    {
      throw rpc::ConfigError(cfg.origin() + ".max_connections must be positive");
    }
    p.maxConnections = static_cast<std::uint32_t>(*maxConnections);
  }
  if (cfg.contains("timeout_ms"))
  {
    p.timeout = positiveMillis(cfg, "timeout_ms", std::chrono::milliseconds(1));
  }
  p.expectedLatencyMs = cfg.getDouble("expected_latency_ms").value_or(p.expectedLatencyMs);
  p.dailyBudget = cfg.getDouble("daily_budget");
  rpc::validateProvider(p);
  return p;
}

} // namespace detail

/// \brief Map a parsed configuration onto OrchestratorConfig.
/// \throws rpc::ConfigError for any malformed or inconsistent value.
inline OrchestratorConfig loadConfig(const core::ConfigLoader &loader)
{
  OrchestratorConfig out;
  try
  {
    if (auto logging = loader.getTable("logging"))
    {
      detail::loadLogging(*logging, out.log);
    }
    if (auto rpcTable = loader.getTable("rpc"))
    {
      detail::loadRpc(*rpcTable, out);
    }
    if (auto dispatch = loader.getTable("dispatch"))
    {
      detail::loadDispatch(*dispatch, out);
    }
    if (auto cache = loader.getTable("cache"))
    {
      detail::loadCache(*cache, out);
    }
    if (auto poolTable = loader.getTable("pool"))
    {
      detail::loadPool(*poolTable, out);
    }
    if (auto streams = loader.getTable("streams"))
    {
      detail::loadStreams(*streams, out);
    }

    std::set<std::string> seen;
    for (const auto &entry : loader.getTableArray("providers"))
    {
      rpc::Provider provider = detail::loadProvider(entry);
      if (!seen.insert(provider.id).second)
      {
        throw rpc::ConfigError("duplicate provider id '" + provider.id + "'");
      }
      out.providers.push_back(std::move(provider));
    }
  }
  catch (const rpc::ConfigError &)
  {
    throw;
  }
  catch (const std::runtime_error &e)
  {
    // Type mismatches reported by the loader.
    throw rpc::ConfigError(e.what());
  }
  return out;
}

/// \brief Parse and map a TOML file.
/// \throws rpc::ConfigError if the file is unreadable, malformed or invalid.
inline OrchestratorConfig loadConfigFile(const std::string &path)
{
  std::optional<core::ConfigLoader> loader;
  try
  {
    loader.emplace(path);
  }
  catch (const std::exception &e)
  {
    throw rpc::ConfigError(e.what());
  }
  return loadConfig(*loader);
}

/// \brief Apply the [logging] settings to the global logger.
inline void applyLogging(const OrchestratorConfig::LogConfig &log)
{
  core::Logger::init(log.level, log.file, log.retentionDays);
  if (!log.format.empty())
  {
    core::Logger::setLogFormat(log.format);
  }
}

} // namespace rpcmesh
