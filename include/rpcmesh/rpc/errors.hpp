// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of RpcMesh, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

#include "rpcmesh/core/json.hpp"

namespace rpcmesh
{
namespace rpc
{

/// \brief Base class for every error raised by the orchestration layer.
class RpcError : public std::runtime_error
{
public:
  explicit RpcError(const std::string &what) : std::runtime_error(what) {}
};

/// \brief Malformed configuration or provider descriptor. Never retried.
class ConfigError : public RpcError
{
public:
  explicit ConfigError(const std::string &what) : RpcError("Configuration error: " + what) {}
};

/// \brief No provider passed the selection filters. Retryable by the caller
/// after a delay.
class NoProviderAvailable : public RpcError
{
public:
  explicit NoProviderAvailable(const std::string &chain)
      : RpcError("No provider available for chain '" + chain + "'"), _chain(chain)
  {
  }

  const std::string &chain() const noexcept { return _chain; }

private:
  std::string _chain;
};

/// \brief The provider answered with a JSON-RPC error object.
class ProviderError : public RpcError
{
public:
  ProviderError(std::string providerId, int code, const std::string &message,
                core::Json data = nullptr)
      : RpcError("Provider '" + providerId + "' returned error (" + std::to_string(code) + ") " +
                 message),
        _providerId(std::move(providerId)), _code(code), _message(message),
        _data(std::move(data))
  {
  }

  const std::string &providerId() const noexcept { return _providerId; }
  int code() const noexcept { return _code; }
  const std::string &message() const noexcept { return _message; }
  const core::Json &data() const noexcept { return _data; }

private:
  std::string _providerId;
  int _code;
  std::string _message;
  core::Json _data;
};

/// \brief Connection reset, timeout, name resolution failure, bad HTTP status
/// or unparseable body. Always retried through the executor's backoff.
class TransportError : public RpcError
{
public:
  TransportError(std::string providerId, const std::string &what)
      : RpcError("Transport failure on '" + providerId + "': " + what),
        _providerId(std::move(providerId))
  {
  }

  const std::string &providerId() const noexcept { return _providerId; }

private:
  std::string _providerId;
};

/// \brief Terminal failure after the retry bound was reached. Carries enough
/// context for the caller to decide between surfacing and degrading.
class RetriesExhausted : public RpcError
{
public:
  RetriesExhausted(std::string chain, std::string method, std::vector<std::string> attempted,
                   std::uint32_t attempts, std::exception_ptr lastError,
                   const std::string &lastMessage)
      : RpcError("Retries exhausted for " + method + " on '" + chain + "' after " +
                 std::to_string(attempts) + " attempt(s) [" + join(attempted) +
                 "]: " + lastMessage),
        _chain(std::move(chain)), _method(std::move(method)), _attempted(std::move(attempted)),
        _attempts(attempts), _lastError(std::move(lastError)), _lastMessage(lastMessage)
  {
  }

  const std::string &chain() const noexcept { return _chain; }
  const std::string &method() const noexcept { return _method; }
  /// Provider ids in attempt order; repeats when a sole survivor was retried.
  const std::vector<std::string> &attemptedProviders() const noexcept { return _attempted; }
  std::uint32_t attempts() const noexcept { return _attempts; }
  std::exception_ptr lastError() const noexcept { return _lastError; }
  const std::string &lastErrorMessage() const noexcept { return _lastMessage; }

private:
  static std::string join(const std::vector<std::string> &ids)
  {
    std::string out;
    for (const auto &id : ids)
    {
      if (!out.empty())
      {
        out += ", ";
      }
      out += id;
    }
    return out;
  }

  std::string _chain;
  std::string _method;
  std::vector<std::string> _attempted;
  std::uint32_t _attempts;
  std::exception_ptr _lastError;
  std::string _lastMessage;
};

/// \brief A chain's dispatch queue is at capacity. The caller must back off.
class QueueSaturated : public RpcError
{
public:
  QueueSaturated(std::string chain, std::size_t depth, std::size_t capacity)
      : RpcError("Dispatch queue for '" + chain + "' is saturated (" + std::to_string(depth) +
                 "/" + std::to_string(capacity) + ")"),
        _chain(std::move(chain)), _depth(depth), _capacity(capacity)
  {
  }

  const std::string &chain() const noexcept { return _chain; }
  std::size_t depth() const noexcept { return _depth; }
  std::size_t capacity() const noexcept { return _capacity; }

private:
  std::string _chain;
  std::size_t _depth;
  std::size_t _capacity;
};

/// \brief A pool acquire waited longer than the connection timeout.
class AcquireTimeout : public RpcError
{
public:
  AcquireTimeout(std::string providerId, std::chrono::milliseconds waited)
      : RpcError("Timed out after " + std::to_string(waited.count()) +
                 "ms waiting for a connection to '" + providerId + "'"),
        _providerId(std::move(providerId)), _waited(waited)
  {
  }

  const std::string &providerId() const noexcept { return _providerId; }
  std::chrono::milliseconds waited() const noexcept { return _waited; }

private:
  std::string _providerId;
  std::chrono::milliseconds _waited;
};

/// \brief The pool is draining or stopped and rejects acquires.
class PoolDraining : public RpcError
{
public:
  explicit PoolDraining(const std::string &what) : RpcError(what) {}
};

/// \brief A queued request was cancelled before dispatch.
class RequestCancelled : public RpcError
{
public:
  explicit RequestCancelled(std::string requestId)
      : RpcError("Request '" + requestId + "' was cancelled before dispatch"),
        _requestId(std::move(requestId))
  {
  }

  const std::string &requestId() const noexcept { return _requestId; }

private:
  std::string _requestId;
};

} // namespace rpc
} // namespace rpcmesh
