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
#include <cstdint>
#include <exception>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "rpcmesh/core/clock.hpp"
#include "rpcmesh/core/logger.hpp"
#include "rpcmesh/rpc/errors.hpp"
#include "rpcmesh/rpc/events.hpp"
#include "rpcmesh/rpc/health_tracker.hpp"
#include "rpcmesh/rpc/provider_selector.hpp"
#include "rpcmesh/rpc/transport.hpp"
#include "rpcmesh/rpc/types.hpp"

namespace rpcmesh
{
namespace rpc
{

struct ExecutorConfig
{
  std::uint32_t maxRetries = 3;
  /// Base backoff; attempt k (k >= 1) waits retryDelay * 2^k.
  std::chrono::milliseconds retryDelay{1000};
  /// Ceiling for the backoff between two attempts.
  std::chrono::milliseconds maxRetryDelay{60000};
  std::chrono::milliseconds requestTimeout{30000};
  /// Provider error codes retried like transport failures.
  std::set<int> transientErrorCodes{-32005, -32603, 429};
  /// Provider error messages containing any of these are retried too.
  std::vector<std::string> transientMessagePatterns{
      "ECONNRESET", "ENOTFOUND", "ECONNREFUSED", "ETIMEDOUT", "Network Error", "timeout",
      "rate limit"};
};

struct ExecutorStats
{
  std::uint64_t requests = 0;
  std::uint64_t succeeded = 0;
  std::uint64_t failed = 0;
  std::uint64_t attempts = 0;
  std::uint64_t retries = 0;
  std::uint64_t failovers = 0;
  std::uint64_t exhausted = 0;
  std::uint64_t nonTransientErrors = 0;
};

/// \brief Executes one logical request with retry and failover.
///
/// Each attempt goes to the first selected candidate, or to the pinned
/// provider while it remains eligible. Providers that already failed the
/// request are excluded from later attempts unless no other candidate is
/// left. Transport failures and transient provider errors are retried up to
/// maxRetries times with exponential backoff; any other provider error is
/// returned to the caller immediately.
class RequestExecutor
{
public:
  RequestExecutor(ExecutorConfig config, const ProviderSelector &selector, HealthTracker &tracker,
                  std::shared_ptr<IRpcTransport> transport, std::shared_ptr<core::Clock> clock,
                  EventBus *events = nullptr)
      : _config(std::move(config)), _selector(selector), _tracker(tracker),
        _transport(std::move(transport)), _clock(std::move(clock)), _events(events)
  {
  }

  const ExecutorConfig &config() const { return _config; }

  /// \brief A request with this executor's retry bound and a fresh id.
  RpcRequest makeRequest(const std::string &chain, const std::string &method,
                         core::Json params = core::Json::array(),
                         Urgency urgency = Urgency::Medium) const
  {
    RpcRequest request;
    request.id = nextRequestId();
    request.chain = chain;
    request.method = method;
    request.params = std::move(params);
    request.urgency = urgency;
    request.maxRetries = _config.maxRetries;
    request.createdAt = _clock->now();
    return request;
  }

  /// \brief Run the request to a terminal outcome.
  /// \throws NoProviderAvailable if no provider is eligible for the first attempt.
  /// \throws ProviderError for a non-transient provider error.
  /// \throws RetriesExhausted once maxRetries + 1 attempts have failed.
  RpcResponse execute(RpcRequest request)
  {
    ++_requests;
    std::set<std::string> failedProviders;
    std::vector<std::string> attempted;
    std::exception_ptr lastError;
    std::string lastMessage;

    for (;;)
    {
      auto candidates = _selector.selectProviders(request.chain, request.urgency, failedProviders);
      if (candidates.empty() && !failedProviders.empty())
      {
        candidates = _selector.selectProviders(request.chain, request.urgency);
      }
      if (candidates.empty())
      {
        ++_failed;
        if (attempted.empty())
        {
          RPCMESH_LOG_WARN("No provider available for " << request.method << " on "
                                                        << request.chain);
          throw NoProviderAvailable(request.chain);
        }
        ++_exhausted;
        throw RetriesExhausted(request.chain, request.method, attempted,
                               static_cast<std::uint32_t>(attempted.size()), lastError,
                               lastMessage + " (no provider left to retry)");
      }

      Provider target = choose(request, candidates, failedProviders);
      if (!attempted.empty() && attempted.back() != target.id)
      {
        ++_failovers;
      }
      attempted.push_back(target.id);
      ++_attempts;

      auto timeout = request.timeout ? *request.timeout
                                     : target.timeout.value_or(_config.requestTimeout);
      auto start = _clock->now();
      try
      {
        core::Json result = _transport->send(target, request.method, request.params, timeout);
        auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(_clock->now() - start);
        _tracker.recordOutcome(target.id, true, static_cast<double>(latency.count()));
        _tracker.recordCost(target.id, target.costPerCall());
        ++_succeeded;

        RpcResponse response;
        response.requestId = request.id;
        response.result = std::move(result);
        response.providerId = target.id;
        response.latency = latency;
        response.attempts = static_cast<std::uint32_t>(attempted.size());
        return response;
      }
      catch (const ProviderError &e)
      {
        _tracker.recordOutcome(target.id, false);
        _tracker.recordCost(target.id, target.costPerCall());
        lastError = std::current_exception();
        lastMessage = e.what();
        if (!isTransient(e))
        {
          ++_nonTransient;
          ++_failed;
          notifyFailure(request, target, lastMessage, attempted.size());
          RPCMESH_LOG_WARN("Request " << request.id << " (" << request.method << ") rejected by "
                                      << target.id << ": " << e.what());
          throw;
        }
      }
      catch (const std::exception &e)
      {
        // TransportError and anything else the transport raised.
        _tracker.recordOutcome(target.id, false);
        lastError = std::current_exception();
        lastMessage = e.what();
      }

      failedProviders.insert(target.id);
      notifyFailure(request, target, lastMessage, attempted.size());

      if (request.retryCount >= request.maxRetries)
      {
        ++_exhausted;
        ++_failed;
        RPCMESH_LOG_ERROR("Request " << request.id << " (" << request.method << " on "
                                     << request.chain << ") failed after " << attempted.size()
                                     << " attempt(s): " << lastMessage);
        throw RetriesExhausted(request.chain, request.method, attempted,
                               static_cast<std::uint32_t>(attempted.size()), lastError,
                               lastMessage);
      }

      ++request.retryCount;
      ++_retries;
      auto delay = backoffFor(request.retryCount);
      RPCMESH_LOG_DEBUG("Retrying " << request.id << " (" << request.method << ") attempt "
                                    << request.retryCount + 1 << " in " << delay.count()
                                    << "ms after failure on " << target.id << ": "
                                    << lastMessage);
      _clock->sleepFor(std::chrono::duration_cast<std::chrono::milliseconds>(delay));
    }
  }

  /// retryDelay * 2^retryCount, saturating at maxRetryDelay.
  std::chrono::milliseconds backoffFor(std::uint32_t retryCount) const
  {
    auto delay = _config.retryDelay;
    for (std::uint32_t i = 0; i < retryCount && delay.count() > 0 && delay < _config.maxRetryDelay;
         ++i)
    {
      delay *= 2;
    }
    return std::min(delay, _config.maxRetryDelay);
  }

  bool isTransient(const ProviderError &error) const
  {
    if (_config.transientErrorCodes.count(error.code()) > 0)
    {
      return true;
    }
    for (const auto &pattern : _config.transientMessagePatterns)
    {
      if (error.message().find(pattern) != std::string::npos)
      {
        return true;
      }
    }
    return false;
  }

  ExecutorStats stats() const
  {
    ExecutorStats s;
    s.requests = _requests.load();
    s.succeeded = _succeeded.load();
    s.failed = _failed.load();
    s.attempts = _attempts.load();
    s.retries = _retries.load();
    s.failovers = _failovers.load();
    s.exhausted = _exhausted.load();
    s.nonTransientErrors = _nonTransient.load();
    return s;
  }

private:
  Provider choose(const RpcRequest &request, const std::vector<Provider> &candidates,
                  const std::set<std::string> &failedProviders) const
  {
    if (request.pinnedProvider && failedProviders.count(*request.pinnedProvider) == 0)
    {
      if (auto pinned = _selector.eligible(*request.pinnedProvider, request.chain))
      {
        return *pinned;
      }
      RPCMESH_LOG_DEBUG("Pinned provider " << *request.pinnedProvider
                                           << " not eligible, using " << candidates.front().id);
    }
    return candidates.front();
  }

  void notifyFailure(const RpcRequest &request, const Provider &target, const std::string &error,
                     std::size_t attempt)
  {
    if (_events)
    {
      _events->publish(Event{EventType::RequestFailed, target.id, request.chain,
                             request.method + ": " + error, static_cast<double>(attempt),
                             _clock->now()});
    }
  }

  ExecutorConfig _config;
  const ProviderSelector &_selector;
  HealthTracker &_tracker;
  std::shared_ptr<IRpcTransport> _transport;
  std::shared_ptr<core::Clock> _clock;
  EventBus *_events;

  std::atomic<std::uint64_t> _requests{0};
  std::atomic<std::uint64_t> _succeeded{0};
  std::atomic<std::uint64_t> _failed{0};
  std::atomic<std::uint64_t> _attempts{0};
  std::atomic<std::uint64_t> _retries{0};
  std::atomic<std::uint64_t> _failovers{0};
  std::atomic<std::uint64_t> _exhausted{0};
  std::atomic<std::uint64_t> _nonTransient{0};
};

} // namespace rpc
} // namespace rpcmesh
