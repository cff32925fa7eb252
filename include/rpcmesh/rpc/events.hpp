// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of RpcMesh, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <string>

#include "rpcmesh/core/clock.hpp"
#include "rpcmesh/core/event_bus.hpp"

namespace rpcmesh
{
namespace rpc
{

enum class EventType
{
  HealthChanged,
  ProviderBlacklisted,
  BudgetExceeded,
  PoolScaled,
  ConnectionCreated,
  ConnectionRemoved,
  ProviderAdded,
  ProviderRemoved,
  ProviderStatusChanged,
  RequestFailed,
  Optimized,
  StreamConnected,
  StreamDisconnected,
  StreamError
};

/// \brief Notification emitted by the orchestration components.
///
/// Fields not meaningful for a type stay empty. value carries the numeric
/// payload: the new health flag (0/1), cost today, pool size after scaling,
/// active flag, the attempt number of a failed request, or a stream's
/// close code.
struct Event
{
  EventType type;
  std::string providerId;
  std::string chain;
  std::string message;
  double value = 0.0;
  core::Clock::TimePoint timestamp{};
};

using EventBus = core::EventBus<Event>;
using EventChannel = core::EventChannel<Event>;

inline const char *eventTypeToString(EventType type)
{
  switch (type)
  {
  case EventType::HealthChanged:
    return "health-changed";
  case EventType::ProviderBlacklisted:
    return "provider-blacklisted";
  case EventType::BudgetExceeded:
    return "budget-exceeded";
  case EventType::PoolScaled:
    return "pool-scaled";
  case EventType::ConnectionCreated:
    return "connection-created";
  case EventType::ConnectionRemoved:
    return "connection-removed";
  case EventType::ProviderAdded:
    return "provider-added";
  case EventType::ProviderRemoved:
    return "provider-removed";
  case EventType::ProviderStatusChanged:
    return "provider-status-changed";
  case EventType::RequestFailed:
    return "request-failed";
  case EventType::Optimized:
    return "optimized";
  case EventType::StreamConnected:
    return "stream-connected";
  case EventType::StreamDisconnected:
    return "stream-disconnected";
  case EventType::StreamError:
    return "stream-error";
  default:
    return "unknown";
  }
}

} // namespace rpc
} // namespace rpcmesh
