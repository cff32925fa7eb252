// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of RpcMesh, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>

#include "rpcmesh/core/json.hpp"
#include "rpcmesh/core/logger.hpp"
#include "rpcmesh/network/http_client.hpp"
#include "rpcmesh/rpc/errors.hpp"
#include "rpcmesh/rpc/types.hpp"

namespace rpcmesh
{
namespace rpc
{

/// \brief Sends one JSON-RPC call to one provider.
///
/// Implementations return the `result` member on success and throw
/// ProviderError when the provider answers with an `error` member, or
/// TransportError for anything that prevented a well-formed answer.
class IRpcTransport
{
public:
  virtual ~IRpcTransport() = default;

  virtual core::Json send(const Provider &provider, const std::string &method,
                          const core::Json &params, std::chrono::milliseconds timeout) = 0;
};

/// \brief JSON-RPC 2.0 over HTTP(S) POST.
class HttpRpcTransport : public IRpcTransport
{
public:
  HttpRpcTransport() : HttpRpcTransport(network::HttpClient::Config{}) {}

  explicit HttpRpcTransport(network::HttpClient::Config config)
      : _http(std::make_unique<network::HttpClient>(std::move(config)))
  {
  }

  core::Json send(const Provider &provider, const std::string &method, const core::Json &params,
                  std::chrono::milliseconds timeout) override
  {
    core::Json envelope = makeRequestEnvelope(method, params, nextId_());
    std::map<std::string, std::string> headers{{"Content-Type", "application/json"}};
    if (!provider.apiKey.empty())
    {
      headers["Authorization"] = "Bearer " + provider.apiKey;
    }

    network::HttpClient::Response response;
    try
    {
      response = _http->post(provider.url, envelope.dump(), headers, timeout);
    }
    catch (const network::HttpError &e)
    {
      throw TransportError(provider.id, e.what());
    }
    catch (const std::invalid_argument &e)
    {
      throw TransportError(provider.id, e.what());
    }

    if (!response.success())
    {
      throw TransportError(provider.id, "HTTP " + std::to_string(response.statusCode) + " " +
                                            response.statusText);
    }
    auto body = core::tryParseJson(response.body);
    if (!body)
    {
      throw TransportError(provider.id,
                           "invalid JSON response body: " + response.body.substr(0, 128));
    }
    RPCMESH_LOG_TRACE("<- " << provider.id << " " << method << ": " << core::jsonPreview(*body));
    return parseResponseOrThrow(provider.id, std::move(*body));
  }

  /// \brief Build the JSON-RPC 2.0 request object. Null params are omitted.
  static core::Json makeRequestEnvelope(const std::string &method, const core::Json &params,
                                        std::uint64_t id)
  {
    core::Json j;
    j["jsonrpc"] = "2.0";
    j["method"] = method;
    if (!params.is_null())
    {
      j["params"] = params;
    }
    j["id"] = id;
    return j;
  }

  /// \brief Return `result`, or throw ProviderError for an `error` member.
  static core::Json parseResponseOrThrow(const std::string &providerId, core::Json response)
  {
    if (!response.is_object())
    {
      throw TransportError(providerId, "JSON-RPC response is not an object");
    }
    auto error = response.find("error");
    if (error != response.end() && !error->is_null())
    {
      int code = -32000;
      std::string message = "Unknown error";
      core::Json data = nullptr;
      if (error->is_object())
      {
        if (error->contains("code") && (*error)["code"].is_number_integer())
        {
          code = (*error)["code"].get<int>();
        }
        if (error->contains("message") && (*error)["message"].is_string())
        {
          message = (*error)["message"].get<std::string>();
        }
        if (error->contains("data"))
        {
          data = (*error)["data"];
        }
      }
      else if (error->is_string())
      {
        message = error->get<std::string>();
      }
      throw ProviderError(providerId, code, message, std::move(data));
    }
    auto result = response.find("result");
    if (result == response.end())
    {
      throw TransportError(providerId, "JSON-RPC response has neither result nor error");
    }
    return *result;
  }

private:
  std::uint64_t nextId_() { return _nextId.fetch_add(1, std::memory_order_relaxed); }

  std::unique_ptr<network::HttpClient> _http;
  std::atomic<std::uint64_t> _nextId{1};
};

} // namespace rpc
} // namespace rpcmesh
