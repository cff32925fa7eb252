// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of RpcMesh, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace rpcmesh
{
namespace common
{

/// Lifecycle state of a managed component
enum class LifecycleState
{
  Created,   ///< Constructed, background work not started
  Running,   ///< Accepting calls, leases and queued requests
  Draining,  ///< New work rejected, outstanding work finishing
  Stopped,   ///< Background loops exited, nothing outstanding
  Reset      ///< State cleared, start() may be called again
};

/// Counters reported by drain()
struct DrainStats
{
  std::uint32_t inFlightAtStart;  ///< Outstanding work when drain began
  std::uint32_t remaining;        ///< Still outstanding when drain returned
  std::uint32_t cancelled;        ///< Rejected or cancelled by the drain itself
  std::uint32_t completed;        ///< Finished normally while draining

  DrainStats() : inFlightAtStart(0), remaining(0), cancelled(0), completed(0) {}

  DrainStats(std::uint32_t inFlight, std::uint32_t rem, std::uint32_t canc, std::uint32_t comp)
      : inFlightAtStart(inFlight), remaining(rem), cancelled(canc), completed(comp)
  {
  }
};

/// Outcome of a lifecycle transition
struct LifecycleResult
{
  bool success;
  LifecycleState newState;
  std::string message;
  std::optional<DrainStats> drainStats;

  LifecycleResult() : success(false), newState(LifecycleState::Created), message("") {}

  LifecycleResult(bool succ, LifecycleState state, const std::string &msg)
      : success(succ), newState(state), message(msg)
  {
  }

  LifecycleResult(bool succ, LifecycleState state, const std::string &msg, const DrainStats &stats)
      : success(succ), newState(state), message(msg), drainStats(stats)
  {
  }
};

/// Common start/drain/stop contract for the orchestration components.
///
/// State machine:
///
///   Created → Running → Draining → Stopped → Reset → (start again)
///
/// - drain() rejects new work and blocks until outstanding work finishes or
///   the timeout expires. What "outstanding" means is component specific:
///   queued RPC requests for the dispatch queue, busy leases and waiters for
///   the connection pool, queued tasks for the thread pool.
/// - stop() exits background loops. It drains first when still running.
/// - reset() clears internal state so that start() can be called again.
class ILifecycleManaged
{
public:
  virtual ~ILifecycleManaged() = default;

  /// Created/Reset → Running
  virtual LifecycleResult start() = 0;

  /// Running → Draining, blocking up to timeoutMs (0 waits indefinitely)
  virtual LifecycleResult drain(std::uint32_t timeoutMs = 30000) = 0;

  /// Draining → Stopped
  virtual LifecycleResult stop() = 0;

  /// Stopped → Reset
  virtual LifecycleResult reset() = 0;

  virtual LifecycleState getState() const = 0;

  /// Number of queued or executing work items.
  virtual std::uint32_t getInFlightCount() const = 0;
};

inline const char *lifecycleStateToString(LifecycleState state)
{
  switch (state)
  {
  case LifecycleState::Created:
    return "Created";
  case LifecycleState::Running:
    return "Running";
  case LifecycleState::Draining:
    return "Draining";
  case LifecycleState::Stopped:
    return "Stopped";
  case LifecycleState::Reset:
    return "Reset";
  default:
    return "Unknown";
  }
}

} // namespace common
} // namespace rpcmesh
