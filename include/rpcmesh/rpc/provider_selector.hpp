// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of RpcMesh, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <atomic>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "rpcmesh/core/random.hpp"
#include "rpcmesh/rpc/health_tracker.hpp"
#include "rpcmesh/rpc/provider_registry.hpp"
#include "rpcmesh/rpc/types.hpp"

namespace rpcmesh
{
namespace rpc
{

struct ScoredProvider
{
  Provider provider;
  ProviderMetrics metrics;
  double score = 0.0;
};

/// \brief Filters and ranks providers for a chain.
///
/// A provider is eligible when it serves the chain, is active, is not
/// blacklisted and is under its daily budget (optionally also healthy).
/// Eligible providers are scored as
///
///   tierWeight * 1000 + priority + successRate * 100 - averageLatencyMs
///
/// so tier dominates priority, which dominates small latency differences.
class ProviderSelector
{
public:
  /// Number of top-ranked providers the weighted pick spreads load over.
  static constexpr std::size_t kSpread = 3;

  ProviderSelector(const ProviderRegistry &registry, const HealthTracker &tracker,
                   std::shared_ptr<core::RandomSource> random, bool excludeUnhealthy = false)
      : _registry(registry), _tracker(tracker), _random(std::move(random)),
        _excludeUnhealthy(excludeUnhealthy)
  {
  }

  static double score(const Provider &provider, const ProviderMetrics &metrics)
  {
    return tierWeight(provider.tier) * 1000.0 + provider.priority +
           metrics.successRate() * 100.0 - metrics.averageLatencyMs;
  }

  void setExcludeUnhealthy(bool exclude) { _excludeUnhealthy = exclude; }
  bool excludeUnhealthy() const { return _excludeUnhealthy; }

  bool isEligible(const Provider &provider) const
  {
    if (!provider.isActive || !_tracker.isTracked(provider.id))
    {
      return false;
    }
    if (_tracker.isBlacklisted(provider.id) || _tracker.isOverBudget(provider.id))
    {
      return false;
    }
    return !_excludeUnhealthy || _tracker.isHealthy(provider.id);
  }

  /// \brief Eligible providers for chain minus exclude, best first. Equal
  /// scores are ordered by id so ranking is deterministic.
  std::vector<ScoredProvider> rank(const std::string &chain,
                                   const std::set<std::string> &exclude = {}) const
  {
    std::vector<ScoredProvider> ranked;
    for (auto &provider : _registry.forChain(chain))
    {
      if (exclude.count(provider.id) > 0 || !isEligible(provider))
      {
        continue;
      }
      auto metrics = _tracker.metrics(provider.id);
      if (!metrics)
      {
        continue;
      }
      ScoredProvider entry;
      entry.score = score(provider, *metrics);
      entry.metrics = *metrics;
      entry.provider = std::move(provider);
      ranked.push_back(std::move(entry));
    }
    std::sort(ranked.begin(), ranked.end(), [](const ScoredProvider &a, const ScoredProvider &b) {
      return a.score != b.score ? a.score > b.score : a.provider.id < b.provider.id;
    });
    return ranked;
  }

  /// \brief Ordered candidates for one attempt.
  ///
  /// Critical urgency yields only the top provider. Other urgencies yield up
  /// to kSpread providers, the first chosen at random with weights
  /// 2^(n-1-i) over rank i, followed by the rest in rank order. Empty when
  /// nothing is eligible.
  std::vector<Provider> selectProviders(const std::string &chain, Urgency urgency,
                                        const std::set<std::string> &exclude = {}) const
  {
    std::vector<ScoredProvider> ranked = rank(chain, exclude);
    std::vector<Provider> out;
    if (ranked.empty())
    {
      return out;
    }
    if (urgency == Urgency::Critical)
    {
      out.push_back(std::move(ranked.front().provider));
      return out;
    }

    std::size_t n = std::min(kSpread, ranked.size());
    std::size_t pick = weightedPick(n);
    out.push_back(ranked[pick].provider);
    for (std::size_t i = 0; i < n; ++i)
    {
      if (i != pick)
      {
        out.push_back(ranked[i].provider);
      }
    }
    return out;
  }

  /// \brief The provider with this id if it serves chain and is eligible.
  std::optional<Provider> eligible(const std::string &providerId, const std::string &chain) const
  {
    auto provider = _registry.find(providerId);
    if (!provider || provider->chain != chain || !isEligible(*provider))
    {
      return std::nullopt;
    }
    return provider;
  }

  std::optional<Provider> best(const std::string &chain) const
  {
    auto ranked = rank(chain);
    if (ranked.empty())
    {
      return std::nullopt;
    }
    return ranked.front().provider;
  }

private:
  std::size_t weightedPick(std::size_t n) const
  {
    if (n <= 1)
    {
      return 0;
    }
    double total = static_cast<double>((1u << n) - 1);
    double r = _random->nextUnit() * total;
    for (std::size_t i = 0; i < n; ++i)
    {
      double weight = static_cast<double>(1u << (n - 1 - i));
      if (r < weight)
      {
        return i;
      }
      r -= weight;
    }
    return n - 1;
  }

  const ProviderRegistry &_registry;
  const HealthTracker &_tracker;
  std::shared_ptr<core::RandomSource> _random;
  std::atomic<bool> _excludeUnhealthy;
};

} // namespace rpc
} // namespace rpcmesh
