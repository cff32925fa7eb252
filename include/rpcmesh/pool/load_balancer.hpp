// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of RpcMesh, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <memory>
#include <numeric>
#include <stdexcept>
#include <string>
#include <vector>

#include "rpcmesh/core/random.hpp"

namespace rpcmesh
{
namespace pool
{

enum class LoadBalancingStrategy
{
  RoundRobin,
  LeastRequests,
  Weighted,
  LatencyBiased
};

inline const char *strategyToString(LoadBalancingStrategy strategy)
{
  switch (strategy)
  {
  case LoadBalancingStrategy::RoundRobin:
    return "round-robin";
  case LoadBalancingStrategy::LeastRequests:
    return "least-requests";
  case LoadBalancingStrategy::Weighted:
    return "weighted";
  case LoadBalancingStrategy::LatencyBiased:
    return "latency-based";
  }
  return "unknown";
}

/// \brief Parse a strategy name. Accepts "least-connections" and
/// "latency-biased" as aliases.
/// \throws std::invalid_argument for an unknown name.
inline LoadBalancingStrategy strategyFromString(const std::string &name)
{
  if (name == "round-robin")
  {
    return LoadBalancingStrategy::RoundRobin;
  }
  if (name == "least-requests" || name == "least-connections")
  {
    return LoadBalancingStrategy::LeastRequests;
  }
  if (name == "weighted")
  {
    return LoadBalancingStrategy::Weighted;
  }
  if (name == "latency-based" || name == "latency-biased")
  {
    return LoadBalancingStrategy::LatencyBiased;
  }
  throw std::invalid_argument("Unknown load balancing strategy: " + name);
}

/// Snapshot of an idle connection offered to a strategy.
struct Candidate
{
  std::string connectionId;
  std::string providerId;
  std::uint64_t requestCount = 0;
  std::uint64_t errorCount = 0;
  double averageResponseMs = 0.0;
  int healthScore = 100;
};

/// \brief Picks one of several idle connections. Candidates are never empty
/// and arrive in a stable order (by connection id).
class ILoadBalancer
{
public:
  virtual ~ILoadBalancer() = default;
  virtual std::size_t pick(const std::vector<Candidate> &candidates) = 0;
  virtual LoadBalancingStrategy strategy() const = 0;
};

class RoundRobinBalancer : public ILoadBalancer
{
public:
  std::size_t pick(const std::vector<Candidate> &candidates) override
  {
    return _counter.fetch_add(1) % candidates.size();
  }

  LoadBalancingStrategy strategy() const override { return LoadBalancingStrategy::RoundRobin; }

private:
  std::atomic<std::uint64_t> _counter{0};
};

class LeastRequestsBalancer : public ILoadBalancer
{
public:
  std::size_t pick(const std::vector<Candidate> &candidates) override
  {
    std::size_t best = 0;
    for (std::size_t i = 1; i < candidates.size(); ++i)
    {
      if (candidates[i].requestCount < candidates[best].requestCount)
      {
        best = i;
      }
    }
    return best;
  }

  LoadBalancingStrategy strategy() const override { return LoadBalancingStrategy::LeastRequests; }
};

/// \brief Weighted-random pick. Weight starts at the health score, loses up
/// to 50 for latency (1 per 10ms) and the error rate times 100, floor 1.
class WeightedBalancer : public ILoadBalancer
{
public:
  explicit WeightedBalancer(std::shared_ptr<core::RandomSource> random)
      : _random(std::move(random))
  {
  }

  static double weightOf(const Candidate &c)
  {
    double errorRate =
        static_cast<double>(c.errorCount) / static_cast<double>(std::max<std::uint64_t>(c.requestCount, 1));
    double weight = c.healthScore - std::min(c.averageResponseMs / 10.0, 50.0) - errorRate * 100.0;
    return std::max(weight, 1.0);
  }

  std::size_t pick(const std::vector<Candidate> &candidates) override
  {
    std::vector<double> weights;
    weights.reserve(candidates.size());
    for (const auto &c : candidates)
    {
      weights.push_back(weightOf(c));
    }
    double total = std::accumulate(weights.begin(), weights.end(), 0.0);
    double r = _random->nextUnit() * total;
    for (std::size_t i = 0; i < weights.size(); ++i)
    {
      if (r < weights[i])
      {
        return i;
      }
      r -= weights[i];
    }
    return weights.size() - 1;
  }

  LoadBalancingStrategy strategy() const override { return LoadBalancingStrategy::Weighted; }

private:
  std::shared_ptr<core::RandomSource> _random;
};

/// \brief Uniform pick among the three fastest candidates.
class LatencyBiasedBalancer : public ILoadBalancer
{
public:
  static constexpr std::size_t kTop = 3;

  explicit LatencyBiasedBalancer(std::shared_ptr<core::RandomSource> random)
      : _random(std::move(random))
  {
  }

  std::size_t pick(const std::vector<Candidate> &candidates) override
  {
    std::vector<std::size_t> order(candidates.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
      return candidates[a].averageResponseMs < candidates[b].averageResponseMs;
    });
    std::size_t n = std::min(kTop, order.size());
    return order[_random->nextIndex(n)];
  }

  LoadBalancingStrategy strategy() const override { return LoadBalancingStrategy::LatencyBiased; }

private:
  std::shared_ptr<core::RandomSource> _random;
};

inline std::unique_ptr<ILoadBalancer> makeLoadBalancer(LoadBalancingStrategy strategy,
                                                       std::shared_ptr<core::RandomSource> random)
{
  switch (strategy)
  {
  case LoadBalancingStrategy::RoundRobin:
    return std::make_unique<RoundRobinBalancer>();
  case LoadBalancingStrategy::LeastRequests:
    return std::make_unique<LeastRequestsBalancer>();
  case LoadBalancingStrategy::Weighted:
    return std::make_unique<WeightedBalancer>(std::move(random));
  case LoadBalancingStrategy::LatencyBiased:
    return std::make_unique<LatencyBiasedBalancer>(std::move(random));
  }
  throw std::invalid_argument("Unsupported load balancing strategy");
}

} // namespace pool
} // namespace rpcmesh
