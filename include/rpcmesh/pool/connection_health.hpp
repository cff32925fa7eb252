// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of RpcMesh, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>

namespace rpcmesh
{
namespace pool
{

  struct HealthConfig
  {
    /// Consecutive failures beyond this mark the connection Unhealthy.
    int maxConsecutiveFailures{3};
    /// Below this score a connection is not handed out.
    int minHealthScore{20};
    int successReward{5};
    int failurePenalty{20};
  };

  enum class ConnectionState
  {
    Healthy,
    Warning,  // One recent failure
    Degraded, // Repeated failures
    Critical, // At the failure threshold
    Unhealthy // Should be destroyed
  };

  inline const char *connectionStateToString(ConnectionState state)
  {
    switch (state)
    {
    case ConnectionState::Healthy:
      return "healthy";
    case ConnectionState::Warning:
      return "warning";
    case ConnectionState::Degraded:
      return "degraded";
    case ConnectionState::Critical:
      return "critical";
    case ConnectionState::Unhealthy:
      return "unhealthy";
    }
    return "unknown";
  }

  /// \brief Health bookkeeping for one pooled connection: a 0-100 score,
  /// consecutive-failure state and a response-time EMA. Not synchronized;
  /// the owning pool guards it.
  class ConnectionHealth
  {
  public:
    explicit ConnectionHealth(const HealthConfig &config = {}) : config_(config) {}

    void recordSuccess(std::optional<double> latencyMs = std::nullopt)
    {
      ++totalSuccesses_;
      consecutiveFailures_ = 0;
      healthScore_ = std::min(100, healthScore_ + config_.successReward);
      sampleLatency(latencyMs);
      updateState();
    }

    void recordFailure(std::optional<double> latencyMs = std::nullopt)
    {
      ++totalFailures_;
      ++consecutiveFailures_;
      healthScore_ = std::max(0, healthScore_ - config_.failurePenalty);
      sampleLatency(latencyMs);
      updateState();
    }

    bool isHealthy() const
    {
      return state_ <= ConnectionState::Degraded && healthScore_ >= config_.minHealthScore;
    }

    /// True once failures have run past the threshold or the score has
    /// sunk below minHealthScore.
    bool isDead() const
    {
      return state_ == ConnectionState::Unhealthy || healthScore_ < config_.minHealthScore;
    }

    ConnectionState getState() const { return state_; }
    int healthScore() const { return healthScore_; }
    int consecutiveFailures() const { return consecutiveFailures_; }
    double averageResponseMs() const { return averageResponseMs_; }
    std::uint64_t totalSuccesses() const { return totalSuccesses_; }
    std::uint64_t totalFailures() const { return totalFailures_; }

    double successRate() const
    {
      auto total = totalSuccesses_ + totalFailures_;
      return total > 0 ? static_cast<double>(totalSuccesses_) / total : 1.0;
    }

  private:
    void sampleLatency(std::optional<double> latencyMs)
    {
      if (!latencyMs)
      {
        return;
      }
      averageResponseMs_ =
          averageResponseMs_ == 0.0 ? *latencyMs : averageResponseMs_ * 0.8 + *latencyMs * 0.2;
    }

    void updateState()
    {
      if (consecutiveFailures_ == 0)
      {
        state_ = ConnectionState::Healthy;
      }
      else if (consecutiveFailures_ == 1)
      {
        state_ = ConnectionState::Warning;
      }
      else if (consecutiveFailures_ < config_.maxConsecutiveFailures)
      {
        state_ = ConnectionState::Degraded;
      }
      else if (consecutiveFailures_ == config_.maxConsecutiveFailures)
      {
        state_ = ConnectionState::Critical;
      }
      else
      {
        state_ = ConnectionState::Unhealthy;
      }
    }

    HealthConfig config_;
    ConnectionState state_{ConnectionState::Healthy};
    int consecutiveFailures_{0};
    int healthScore_{100};
    double averageResponseMs_{0.0};
    std::uint64_t totalSuccesses_{0};
    std::uint64_t totalFailures_{0};
  };

} // namespace pool
} // namespace rpcmesh
