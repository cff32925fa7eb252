// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of RpcMesh, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "rpcmesh/core/clock.hpp"
#include "rpcmesh/core/json.hpp"

namespace rpcmesh
{
namespace rpc
{

/// Reliability and cost class of a provider.
enum class Tier
{
  Premium,
  Standard,
  Fallback
};

/// Caller-declared priority of a request. Critical requests always go to the
/// single best provider; the others are spread over the top candidates.
enum class Urgency
{
  Low,
  Medium,
  High,
  Critical
};

inline int tierWeight(Tier tier)
{
  switch (tier)
  {
  case Tier::Premium:
    return 3;
  case Tier::Standard:
    return 2;
  case Tier::Fallback:
  default:
    return 1;
  }
}

inline const char *tierToString(Tier tier)
{
  switch (tier)
  {
  case Tier::Premium:
    return "premium";
  case Tier::Standard:
    return "standard";
  case Tier::Fallback:
    return "fallback";
  default:
    return "unknown";
  }
}

inline const char *urgencyToString(Urgency urgency)
{
  switch (urgency)
  {
  case Urgency::Low:
    return "low";
  case Urgency::Medium:
    return "medium";
  case Urgency::High:
    return "high";
  case Urgency::Critical:
    return "critical";
  default:
    return "unknown";
  }
}

namespace detail
{
inline std::string lowerCopy(std::string s)
{
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}
} // namespace detail

inline std::optional<Tier> tierFromString(const std::string &name)
{
  std::string n = detail::lowerCopy(name);
  if (n == "premium")
  {
    return Tier::Premium;
  }
  if (n == "standard")
  {
    return Tier::Standard;
  }
  if (n == "fallback")
  {
    return Tier::Fallback;
  }
  return std::nullopt;
}

inline std::optional<Urgency> urgencyFromString(const std::string &name)
{
  std::string n = detail::lowerCopy(name);
  if (n == "low")
  {
    return Urgency::Low;
  }
  if (n == "medium")
  {
    return Urgency::Medium;
  }
  if (n == "high")
  {
    return Urgency::High;
  }
  if (n == "critical")
  {
    return Urgency::Critical;
  }
  return std::nullopt;
}

/// \brief One upstream RPC endpoint. Only isActive and priority change after
/// registration, and only through the registry.
struct Provider
{
  std::string id;
  std::string name;
  std::string chain;
  Tier tier = Tier::Standard;
  std::string url;
  std::string wsUrl;
  std::string apiKey;
  /// Requests permitted per dispatch tick.
  std::uint32_t rateLimit = 10;
  /// Cost charged per thousand calls, in the operator's currency unit.
  double costPerThousand = 0.0;
  int priority = 0;
  bool isActive = true;
  std::uint32_t maxConnections = 10;
  std::optional<std::chrono::milliseconds> timeout;
  /// Seeds the latency average before the first measured call.
  double expectedLatencyMs = 0.0;
  /// Overrides the global daily budget when set.
  std::optional<double> dailyBudget;

  double costPerCall() const { return costPerThousand / 1000.0; }

  std::string displayName() const { return name.empty() ? id : name; }
};

/// \brief Point-in-time copy of a provider's rolling metrics.
struct ProviderMetrics
{
  std::uint64_t totalRequests = 0;
  std::uint64_t successfulRequests = 0;
  std::uint64_t failedRequests = 0;
  double averageLatencyMs = 0.0;
  double costToday = 0.0;
  std::optional<core::Clock::WallTime> lastHealthCheck;
  bool isHealthy = true;
  std::optional<core::Clock::TimePoint> blacklistedUntil;

  /// 1.0 before the first request so new providers are not penalised.
  double successRate() const
  {
    return totalRequests == 0
               ? 1.0
               : static_cast<double>(successfulRequests) / static_cast<double>(totalRequests);
  }
};

/// \brief A single logical RPC call. Only retryCount changes after creation.
struct RpcRequest
{
  std::string id;
  std::string method;
  core::Json params = core::Json::array();
  std::string chain;
  Urgency urgency = Urgency::Medium;
  std::uint32_t retryCount = 0;
  std::uint32_t maxRetries = 3;
  core::Clock::TimePoint createdAt{};
  std::optional<std::string> pinnedProvider;
  std::optional<std::chrono::milliseconds> timeout;
};

struct RpcResponse
{
  std::string requestId;
  core::Json result;
  std::string providerId;
  std::chrono::milliseconds latency{0};
  std::uint32_t attempts = 0;
  bool fromCache = false;
};

/// \brief Process-unique request ids ("req-1", "req-2", ...).
inline std::string nextRequestId()
{
  static std::atomic<std::uint64_t> counter{0};
  return "req-" + std::to_string(++counter);
}

} // namespace rpc
} // namespace rpcmesh
