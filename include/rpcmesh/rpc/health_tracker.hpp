// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of RpcMesh, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <deque>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "rpcmesh/core/clock.hpp"
#include "rpcmesh/core/logger.hpp"
#include "rpcmesh/rpc/events.hpp"
#include "rpcmesh/rpc/types.hpp"

namespace rpcmesh
{
namespace rpc
{

struct HealthTrackerConfig
{
  /// Outcomes required before the success ratio can mark a provider unhealthy.
  std::uint32_t minSamples = 5;
  double healthyThreshold = 0.8;
  std::chrono::milliseconds blacklistDuration{5 * 60 * 1000};
  /// Default per-provider spend ceiling per UTC day. Zero or less disables
  /// the budget gate for providers without their own budget.
  double dailyBudget = 100.0;
  /// Retention of cost ledger entries for windowed totals.
  std::chrono::hours costWindow{24};
};

/// \brief Spend summary across all tracked providers.
struct CostSummary
{
  double daily = 0.0;
  double window = 0.0;
  std::map<std::string, double> breakdown;
};

/// \brief Per-provider rolling metrics, cost ledger and blacklist state.
///
/// Each provider has its own lock, so concurrent outcomes for one provider
/// never lose updates and different providers never contend. Events are
/// published after every lock is released.
class HealthTracker
{
public:
  HealthTracker(HealthTrackerConfig config, std::shared_ptr<core::Clock> clock,
                EventBus *events = nullptr)
      : _config(config), _clock(std::move(clock)), _events(events)
  {
  }

  const HealthTrackerConfig &config() const { return _config; }

  /// \brief Start tracking a provider. Re-tracking an id resets its metrics.
  void track(const Provider &provider)
  {
    auto entry = std::make_shared<Entry>();
    entry->chain = provider.chain;
    entry->budget = provider.dailyBudget;
    entry->metrics.averageLatencyMs = provider.expectedLatencyMs;
    entry->latencySeeded = provider.expectedLatencyMs > 0.0;
    entry->costDay = core::utcDayIndex(_clock->wallNow());
    std::lock_guard<std::mutex> lock(_mapMutex);
    _entries[provider.id] = std::move(entry);
  }

  void untrack(const std::string &providerId)
  {
    std::lock_guard<std::mutex> lock(_mapMutex);
    _entries.erase(providerId);
  }

  bool isTracked(const std::string &providerId) const { return lookup(providerId) != nullptr; }

  /// \brief Count one call outcome and fold its latency into the average.
  void recordOutcome(const std::string &providerId, bool success,
                     std::optional<double> latencyMs = std::nullopt)
  {
    auto entry = lookup(providerId);
    if (!entry)
    {
      RPCMESH_LOG_DEBUG("Outcome for untracked provider " << providerId << " ignored");
      return;
    }
    std::vector<Event> pending;
    {
      std::lock_guard<std::mutex> lock(entry->mutex);
      auto &m = entry->metrics;
      ++m.totalRequests;
      if (success)
      {
        ++m.successfulRequests;
      }
      else
      {
        ++m.failedRequests;
      }
      if (latencyMs)
      {
        foldLatency(*entry, *latencyMs);
      }
      updateHealth(providerId, *entry, pending);
    }
    publish(pending);
  }

  /// \brief Charge a call to the provider's ledger and check its budget.
  void recordCost(const std::string &providerId, double cost)
  {
    auto entry = lookup(providerId);
    if (!entry || cost <= 0.0)
    {
      return;
    }
    std::vector<Event> pending;
    {
      std::lock_guard<std::mutex> lock(entry->mutex);
      auto now = _clock->wallNow();
      refreshDay(*entry, now);
      purgeLocked(*entry, now);
      entry->ledger.emplace_back(now, cost);
      entry->metrics.costToday += cost;

      double budget = budgetFor(*entry);
      if (budget > 0.0 && entry->metrics.costToday >= budget &&
          entry->budgetSignalDay != entry->costDay)
      {
        entry->budgetSignalDay = entry->costDay;
        RPCMESH_LOG_WARN("Provider " << providerId << " reached its daily budget ("
                                     << entry->metrics.costToday << " >= " << budget << ")");
        pending.push_back(makeEvent(EventType::BudgetExceeded, providerId, *entry,
                                    "daily budget exhausted", entry->metrics.costToday));
      }
    }
    publish(pending);
  }

  /// \brief Apply the result of a health check. A failed check marks the
  /// provider unhealthy and blacklists it for the configured duration.
  void recordHealthCheck(const std::string &providerId, bool success,
                   std::optional<double> latencyMs = std::nullopt,
                   const std::string &error = std::string())
  {
    auto entry = lookup(providerId);
    if (!entry)
    {
      return;
    }
    std::vector<Event> pending;
    {
      std::lock_guard<std::mutex> lock(entry->mutex);
      entry->metrics.lastHealthCheck = _clock->wallNow();
      if (success)
      {
        if (latencyMs)
        {
          foldLatency(*entry, *latencyMs);
        }
        updateHealth(providerId, *entry, pending);
      }
      else
      {
        if (entry->metrics.isHealthy)
        {
          entry->metrics.isHealthy = false;
          pending.push_back(makeEvent(EventType::HealthChanged, providerId, *entry,
                                      "health check failed: " + error, 0.0));
        }
        blacklistLocked(providerId, *entry, _config.blacklistDuration, error, pending);
      }
    }
    publish(pending);
  }

  /// \brief Exclude a provider from selection until now + duration.
  void blacklist(const std::string &providerId,
                 std::optional<std::chrono::milliseconds> duration = std::nullopt,
                 const std::string &reason = "manual")
  {
    auto entry = lookup(providerId);
    if (!entry)
    {
      return;
    }
    std::vector<Event> pending;
    {
      std::lock_guard<std::mutex> lock(entry->mutex);
      blacklistLocked(providerId, *entry, duration.value_or(_config.blacklistDuration), reason,
                      pending);
    }
    publish(pending);
  }

  void clearBlacklist(const std::string &providerId)
  {
    if (auto entry = lookup(providerId))
    {
      std::lock_guard<std::mutex> lock(entry->mutex);
      entry->metrics.blacklistedUntil.reset();
    }
  }

  /// \brief True while now < blacklistedUntil. Expiry needs no reset call.
  bool isBlacklisted(const std::string &providerId) const
  {
    auto entry = lookup(providerId);
    if (!entry)
    {
      return false;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    return blacklistedLocked(*entry);
  }

  bool isHealthy(const std::string &providerId) const
  {
    auto entry = lookup(providerId);
    if (!entry)
    {
      return false;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->metrics.isHealthy;
  }

  /// \brief True once today's spend reaches the provider's budget. Resets at
  /// the next UTC midnight.
  bool isOverBudget(const std::string &providerId) const
  {
    auto entry = lookup(providerId);
    if (!entry)
    {
      return false;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    refreshDay(*entry, _clock->wallNow());
    double budget = budgetFor(*entry);
    return budget > 0.0 && entry->metrics.costToday >= budget;
  }

  double costToday(const std::string &providerId) const
  {
    auto entry = lookup(providerId);
    if (!entry)
    {
      return 0.0;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    refreshDay(*entry, _clock->wallNow());
    return entry->metrics.costToday;
  }

  void setBudget(const std::string &providerId, std::optional<double> budget)
  {
    if (auto entry = lookup(providerId))
    {
      std::lock_guard<std::mutex> lock(entry->mutex);
      entry->budget = budget;
    }
  }

  std::optional<ProviderMetrics> metrics(const std::string &providerId) const
  {
    auto entry = lookup(providerId);
    if (!entry)
    {
      return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    refreshDay(*entry, _clock->wallNow());
    ProviderMetrics copy = entry->metrics;
    if (!blacklistedLocked(*entry))
    {
      copy.blacklistedUntil.reset();
    }
    return copy;
  }

  std::map<std::string, ProviderMetrics> snapshot() const
  {
    std::map<std::string, ProviderMetrics> out;
    for (const auto &id : trackedIds())
    {
      if (auto m = metrics(id))
      {
        out.emplace(id, *m);
      }
    }
    return out;
  }

  CostSummary totalCosts() const
  {
    CostSummary summary;
    auto now = _clock->wallNow();
    auto windowStart = now - _config.costWindow;
    for (const auto &item : entriesCopy())
    {
      std::lock_guard<std::mutex> lock(item.second->mutex);
      refreshDay(*item.second, now);
      summary.daily += item.second->metrics.costToday;
      summary.breakdown[item.first] = item.second->metrics.costToday;
      for (const auto &charge : item.second->ledger)
      {
        if (charge.first >= windowStart)
        {
          summary.window += charge.second;
        }
      }
    }
    return summary;
  }

  /// \brief Drop ledger entries older than both the window and today.
  /// Returns the number removed.
  std::size_t purgeLedger()
  {
    std::size_t removed = 0;
    auto now = _clock->wallNow();
    for (const auto &item : entriesCopy())
    {
      std::lock_guard<std::mutex> lock(item.second->mutex);
      removed += purgeLocked(*item.second, now);
    }
    return removed;
  }

  std::size_t ledgerSize() const
  {
    std::size_t total = 0;
    for (const auto &item : entriesCopy())
    {
      std::lock_guard<std::mutex> lock(item.second->mutex);
      total += item.second->ledger.size();
    }
    return total;
  }

  std::vector<std::string> trackedIds() const
  {
    std::lock_guard<std::mutex> lock(_mapMutex);
    std::vector<std::string> ids;
    for (const auto &item : _entries)
    {
      ids.push_back(item.first);
    }
    return ids;
  }

private:
  struct Entry
  {
    mutable std::mutex mutex;
    std::string chain;
    ProviderMetrics metrics;
    bool latencySeeded = false;
    std::optional<double> budget;
    std::deque<std::pair<core::Clock::WallTime, double>> ledger;
    std::int64_t costDay = 0;
    std::int64_t budgetSignalDay = std::numeric_limits<std::int64_t>::min();
  };

  std::shared_ptr<Entry> lookup(const std::string &providerId) const
  {
    std::lock_guard<std::mutex> lock(_mapMutex);
    auto it = _entries.find(providerId);
    return it == _entries.end() ? nullptr : it->second;
  }

  std::vector<std::pair<std::string, std::shared_ptr<Entry>>> entriesCopy() const
  {
    std::lock_guard<std::mutex> lock(_mapMutex);
    return {_entries.begin(), _entries.end()};
  }

  double budgetFor(const Entry &entry) const { return entry.budget.value_or(_config.dailyBudget); }

  bool blacklistedLocked(const Entry &entry) const
  {
    return entry.metrics.blacklistedUntil && _clock->now() < *entry.metrics.blacklistedUntil;
  }

  static void foldLatency(Entry &entry, double latencyMs)
  {
    auto &avg = entry.metrics.averageLatencyMs;
    if (!entry.latencySeeded)
    {
      avg = latencyMs;
      entry.latencySeeded = true;
    }
    else
    {
      avg = avg * 0.9 + latencyMs * 0.1;
    }
  }

  void updateHealth(const std::string &providerId, Entry &entry, std::vector<Event> &pending)
  {
    auto &m = entry.metrics;
    bool healthy = m.totalRequests < _config.minSamples ||
                   m.successRate() > _config.healthyThreshold;
    if (healthy != m.isHealthy)
    {
      m.isHealthy = healthy;
      RPCMESH_LOG_INFO("Provider " << providerId << " is now "
                                   << (healthy ? "healthy" : "unhealthy") << " (success rate "
                                   << m.successRate() << ")");
      pending.push_back(makeEvent(EventType::HealthChanged, providerId, entry,
                                  healthy ? "recovered" : "success rate below threshold",
                                  healthy ? 1.0 : 0.0));
    }
  }

  void blacklistLocked(const std::string &providerId, Entry &entry,
                       std::chrono::milliseconds duration, const std::string &reason,
                       std::vector<Event> &pending)
  {
    entry.metrics.blacklistedUntil = _clock->now() + duration;
    RPCMESH_LOG_WARN("Provider " << providerId << " blacklisted for " << duration.count()
                                 << "ms: " << reason);
    pending.push_back(makeEvent(EventType::ProviderBlacklisted, providerId, entry, reason,
                                static_cast<double>(duration.count())));
  }

  /// Recompute today's cost from the ledger when the UTC day has changed.
  void refreshDay(Entry &entry, core::Clock::WallTime now) const
  {
    std::int64_t today = core::utcDayIndex(now);
    if (today == entry.costDay)
    {
      return;
    }
    entry.costDay = today;
    double total = 0.0;
    for (const auto &charge : entry.ledger)
    {
      if (core::utcDayIndex(charge.first) == today)
      {
        total += charge.second;
      }
    }
    entry.metrics.costToday = total;
  }

  std::size_t purgeLocked(Entry &entry, core::Clock::WallTime now) const
  {
    auto cutoff = std::min(now - _config.costWindow, core::utcDayStart(now));
    std::size_t removed = 0;
    while (!entry.ledger.empty() && entry.ledger.front().first < cutoff)
    {
      entry.ledger.pop_front();
      ++removed;
    }
    return removed;
  }

  Event makeEvent(EventType type, const std::string &providerId, const Entry &entry,
                  const std::string &message, double value) const
  {
    return Event{type, providerId, entry.chain, message, value, _clock->now()};
  }

  void publish(const std::vector<Event> &pending) const
  {
    if (_events && !pending.empty())
    {
      _events->publishAll(pending);
    }
  }

  HealthTrackerConfig _config;
  std::shared_ptr<core::Clock> _clock;
  EventBus *_events;
  mutable std::mutex _mapMutex;
  std::map<std::string, std::shared_ptr<Entry>> _entries;
};

} // namespace rpc
} // namespace rpcmesh
