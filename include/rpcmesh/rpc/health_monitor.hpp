// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of RpcMesh, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <chrono>
#include <map>
#include <memory>
#include <string>

#include "rpcmesh/core/clock.hpp"
#include "rpcmesh/core/logger.hpp"
#include "rpcmesh/rpc/health_tracker.hpp"
#include "rpcmesh/rpc/provider_registry.hpp"
#include "rpcmesh/rpc/transport.hpp"

namespace rpcmesh
{
namespace rpc
{

struct HealthMonitorConfig
{
  std::string defaultCheckMethod{"eth_blockNumber"};
  /// Chain name to check method, e.g. solana -> getHealth.
  std::map<std::string, std::string> checkMethods{{"solana", "getHealth"}};
  std::chrono::milliseconds checkTimeout{5000};
};

struct HealthCheckReport
{
  std::size_t checked = 0;
  std::size_t healthy = 0;
  std::size_t failed = 0;
};

/// \brief Issues the canonical check call against every registered provider
/// and feeds the result to the tracker. A failed check blacklists the
/// provider; an expired blacklist needs no action here.
class HealthMonitor
{
public:
  HealthMonitor(HealthMonitorConfig config, const ProviderRegistry &registry,
                HealthTracker &tracker, std::shared_ptr<IRpcTransport> transport,
                std::shared_ptr<core::Clock> clock)
      : _config(std::move(config)), _registry(registry), _tracker(tracker),
        _transport(std::move(transport)), _clock(std::move(clock))
  {
  }

  const std::string &checkMethodFor(const std::string &chain) const
  {
    auto it = _config.checkMethods.find(chain);
    return it == _config.checkMethods.end() ? _config.defaultCheckMethod : it->second;
  }

  /// \brief Check one provider. Returns true on success.
  bool check(const Provider &provider)
  {
    const std::string &method = checkMethodFor(provider.chain);
    auto timeout = std::min(_config.checkTimeout, provider.timeout.value_or(_config.checkTimeout));
    auto start = _clock->now();
    try
    {
      _transport->send(provider, method, core::Json::array(), timeout);
    }
    catch (const std::exception &e)
    {
      RPCMESH_LOG_WARN("Health check " << method << " failed for " << provider.id << ": "
                                       << e.what());
      _tracker.recordHealthCheck(provider.id, false, std::nullopt, e.what());
      return false;
    }
    auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(_clock->now() - start);
    _tracker.recordHealthCheck(provider.id, true, static_cast<double>(latency.count()));
    return true;
  }

  /// \brief Check every registered provider, active or not.
  HealthCheckReport checkAll()
  {
    HealthCheckReport report;
    for (const auto &provider : _registry.all())
    {
      ++report.checked;
      if (check(provider))
      {
        ++report.healthy;
      }
      else
      {
        ++report.failed;
      }
    }
    RPCMESH_LOG_DEBUG("Health check: " << report.healthy << "/" << report.checked
                                       << " providers responded");
    return report;
  }

private:
  HealthMonitorConfig _config;
  const ProviderRegistry &_registry;
  HealthTracker &_tracker;
  std::shared_ptr<IRpcTransport> _transport;
  std::shared_ptr<core::Clock> _clock;
};

} // namespace rpc
} // namespace rpcmesh
