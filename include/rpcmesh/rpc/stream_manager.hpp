// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of RpcMesh, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "rpcmesh/common/i_lifecycle_managed.hpp"
#include "rpcmesh/core/clock.hpp"
#include "rpcmesh/core/json.hpp"
#include "rpcmesh/core/logger.hpp"
#include "rpcmesh/network/websocket_client.hpp"
#include "rpcmesh/rpc/errors.hpp"
#include "rpcmesh/rpc/events.hpp"
#include "rpcmesh/rpc/provider_selector.hpp"
#include "rpcmesh/rpc/types.hpp"

namespace rpcmesh
{
namespace rpc
{

struct StreamConfig
{
  /// Bounds TCP connect, TLS and the upgrade handshake.
  std::chrono::milliseconds connectTimeout{10000};
  /// Wait before reopening a stream that dropped or failed to connect.
  std::chrono::milliseconds reconnectDelay{5000};
  bool reconnect = true;
  /// Receive slice; bounds how long closing a stream waits for its reader.
  std::chrono::milliseconds pollInterval{250};
  std::size_t maxMessageSize = 16 * 1024 * 1024;
};

/// \brief A JSON message pushed by a provider over its stream.
struct StreamMessage
{
  std::string chain;
  std::string providerId;
  core::Json message;
};

struct StreamStatus
{
  std::string chain;
  std::string providerId;
  std::string url;
  bool connected = false;
  std::uint64_t messages = 0;
  std::uint64_t errors = 0;
  std::uint32_t reconnects = 0;
  std::size_t subscriptions = 0;
};

/// \brief Persistent streaming connections for subscription-style
/// providers, at most one per chain.
///
/// openStream() connects to the best eligible provider of the chain that
/// has a wsUrl. Every stream owns a reader thread that parses incoming
/// messages and hands them to the message handler. A stream that drops is
/// reopened after reconnectDelay, reselecting the provider, and requests
/// registered with subscribe() are sent again on each reconnect.
class StreamManager : public common::ILifecycleManaged
{
public:
  using MessageHandler = std::function<void(const StreamMessage &)>;

  StreamManager(StreamConfig config, const ProviderSelector &selector,
                std::shared_ptr<core::Clock> clock, EventBus *events = nullptr)
      : _config(config), _selector(selector), _clock(std::move(clock)), _events(events)
  {
  }

  ~StreamManager() override { closeAll(); }

  StreamManager(const StreamManager &) = delete;
  StreamManager &operator=(const StreamManager &) = delete;

  /// \brief Receives every message of every stream, on that stream's
  /// reader thread.
  void setMessageHandler(MessageHandler handler)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _handler = std::move(handler);
  }

  /// \brief Open the chain's stream, replacing any existing one, and wait
  /// for the first connect attempt.
  /// \returns false when no eligible provider of the chain has a wsUrl, or
  /// when the first attempt failed. A stream whose first attempt failed
  /// keeps retrying.
  /// \throws RpcError when the manager is draining or stopped.
  bool openStream(const std::string &chain)
  {
    checkAccepting();
    if (!pickProvider(chain))
    {
      RPCMESH_LOG_WARN("No WebSocket endpoint available for chain " << chain);
      return false;
    }

    auto stream = std::make_shared<Stream>(chain, clientConfig());
    auto firstAttempt = stream->firstAttempt.get_future();
    stream->worker = std::thread([this, stream]() { run(*stream); });

    std::shared_ptr<Stream> previous;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      auto &slot = _streams[chain];
      previous = std::move(slot);
      slot = stream;
    }
    if (previous)
    {
      RPCMESH_LOG_INFO("Replacing the " << chain << " stream");
      shutdown(*previous);
    }
    return firstAttempt.get();
  }

  /// \brief Close the chain's stream and stop reconnecting it.
  bool closeStream(const std::string &chain)
  {
    std::shared_ptr<Stream> stream;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      auto it = _streams.find(chain);
      if (it == _streams.end())
      {
        return false;
      }
      stream = std::move(it->second);
      _streams.erase(it);
    }
    shutdown(*stream);
    return true;
  }

  /// \brief Close every stream. Returns how many were open.
  std::size_t closeAll()
  {
    std::map<std::string, std::shared_ptr<Stream>> streams;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      streams.swap(_streams);
    }
    for (auto &entry : streams)
    {
      shutdown(*entry.second);
    }
    return streams.size();
  }

  /// \brief Send a JSON-RPC request over the chain's stream. The reply
  /// arrives through the message handler. Returns the request id.
  /// \throws RpcError when the chain's stream is not connected.
  /// \throws TransportError when the write fails.
  std::uint64_t send(const std::string &chain, const std::string &method,
                     core::Json params = core::Json::array())
  {
    auto stream = findStream(chain);
    std::uint64_t id = _nextId++;
    auto request = makeRequest(id, method, std::move(params));
    std::string providerId;
    {
      std::lock_guard<std::mutex> lock(stream->mutex);
      if (!stream->connected)
      {
        throw RpcError("Stream for chain '" + chain + "' is not connected");
      }
      providerId = stream->providerId;
    }
    write(*stream, providerId, request);
    return id;
  }

  /// \brief Like send(), and sent again after every reconnect. A request
  /// made while the stream is reconnecting goes out once it is back.
  /// \throws RpcError when the chain has no stream.
  std::uint64_t subscribe(const std::string &chain, const std::string &method,
                          core::Json params = core::Json::array())
  {
    auto stream = findStream(chain);
    std::uint64_t id = _nextId++;
    auto request = makeRequest(id, method, std::move(params));
    std::string providerId;
    bool connected = false;
    {
      std::lock_guard<std::mutex> lock(stream->mutex);
      stream->subscriptions.push_back(request);
      connected = stream->connected;
      providerId = stream->providerId;
    }
    if (connected)
    {
      write(*stream, providerId, request);
    }
    return id;
  }

  std::optional<StreamStatus> status(const std::string &chain) const
  {
    std::shared_ptr<Stream> stream;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      auto it = _streams.find(chain);
      if (it == _streams.end())
      {
        return std::nullopt;
      }
      stream = it->second;
    }
    return statusOf(*stream);
  }

  std::vector<StreamStatus> statuses() const
  {
    std::vector<std::shared_ptr<Stream>> streams;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      for (const auto &entry : _streams)
      {
        streams.push_back(entry.second);
      }
    }
    std::vector<StreamStatus> out;
    for (const auto &stream : streams)
    {
      out.push_back(statusOf(*stream));
    }
    return out;
  }

  bool isConnected(const std::string &chain) const
  {
    auto s = status(chain);
    return s && s->connected;
  }

  // ═══════════════════════════════════════════════════════════════════
  // ILifecycleManaged
  // ═══════════════════════════════════════════════════════════════════

  common::LifecycleResult start() override
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_state == common::LifecycleState::Running)
    {
      return {true, _state, "StreamManager already running"};
    }
    if (_state != common::LifecycleState::Created && _state != common::LifecycleState::Reset)
    {
      return {false, _state, "StreamManager cannot start from state " +
                                 std::string(common::lifecycleStateToString(_state))};
    }
    _state = common::LifecycleState::Running;
    return {true, _state, "StreamManager started"};
  }

  /// Streams have no outstanding work to finish; draining closes them.
  common::LifecycleResult drain(std::uint32_t /*timeoutMs*/ = 30000) override
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_state != common::LifecycleState::Running && _state != common::LifecycleState::Created)
      {
        return {false, _state, "StreamManager is not running"};
      }
      _state = common::LifecycleState::Draining;
    }
    auto closed = static_cast<std::uint32_t>(closeAll());
    RPCMESH_LOG_INFO("Stream manager drained: " << closed << " stream(s) closed");
    return {true, common::LifecycleState::Draining, "StreamManager drained",
            common::DrainStats(closed, 0, 0, closed)};
  }

  common::LifecycleResult stop() override
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_state == common::LifecycleState::Stopped || _state == common::LifecycleState::Reset)
      {
        return {true, _state, "StreamManager already stopped"};
      }
      _state = common::LifecycleState::Stopped;
    }
    closeAll();
    return {true, common::LifecycleState::Stopped, "StreamManager stopped"};
  }

  common::LifecycleResult reset() override
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_state != common::LifecycleState::Stopped)
    {
      return {false, _state, "StreamManager must be stopped before reset"};
    }
    _state = common::LifecycleState::Reset;
    return {true, _state, "StreamManager reset"};
  }

  common::LifecycleState getState() const override
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _state;
  }

  /// Open streams.
  std::uint32_t getInFlightCount() const override
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return static_cast<std::uint32_t>(_streams.size());
  }

private:
  struct Stream
  {
    Stream(std::string c, network::WebSocketClient::Config config)
        : chain(std::move(c)), client(std::move(config))
    {
    }

    const std::string chain;
    network::WebSocketClient client;
    std::thread worker;
    std::atomic<bool> stopping{false};

    // Guarded by mutex.
    std::mutex mutex;
    std::condition_variable wake;
    std::string providerId;
    std::string url;
    bool connected = false;
    std::uint64_t messages = 0;
    std::uint64_t errors = 0;
    std::uint32_t reconnects = 0;
    std::vector<core::Json> subscriptions;
    std::promise<bool> firstAttempt;
    bool attempted = false;
  };

  network::WebSocketClient::Config clientConfig() const
  {
    network::WebSocketClient::Config config;
    config.connectTimeout = _config.connectTimeout;
    config.maxMessageSize = _config.maxMessageSize;
    return config;
  }

  static core::Json makeRequest(std::uint64_t id, const std::string &method, core::Json params)
  {
    return core::Json{{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", std::move(params)}};
  }

  void checkAccepting() const
  {
    auto state = getState();
    if (state != common::LifecycleState::Created && state != common::LifecycleState::Running)
    {
      throw RpcError("StreamManager is not accepting streams (state " +
                     std::string(common::lifecycleStateToString(state)) + ")");
    }
  }

  std::optional<Provider> pickProvider(const std::string &chain) const
  {
    for (auto &entry : _selector.rank(chain))
    {
      if (!entry.provider.wsUrl.empty())
      {
        return std::move(entry.provider);
      }
    }
    return std::nullopt;
  }

  std::shared_ptr<Stream> findStream(const std::string &chain) const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _streams.find(chain);
    if (it == _streams.end())
    {
      throw RpcError("No stream open for chain '" + chain + "'");
    }
    return it->second;
  }

  static StreamStatus statusOf(Stream &stream)
  {
    std::lock_guard<std::mutex> lock(stream.mutex);
    StreamStatus s;
    s.chain = stream.chain;
    s.providerId = stream.providerId;
    s.url = stream.url;
    s.connected = stream.connected;
    s.messages = stream.messages;
    s.errors = stream.errors;
    s.reconnects = stream.reconnects;
    s.subscriptions = stream.subscriptions.size();
    return s;
  }

  void write(Stream &stream, const std::string &providerId, const core::Json &request)
  {
    try
    {
      stream.client.send(request.dump());
    }
    catch (const std::exception &e)
    {
      throw TransportError(providerId, e.what());
    }
  }

  static void shutdown(Stream &stream)
  {
    {
      std::lock_guard<std::mutex> lock(stream.mutex);
      stream.stopping = true;
    }
    stream.wake.notify_all();
    if (stream.worker.joinable())
    {
      stream.worker.join();
    }
  }

  /// Reader thread: connect, pump messages until the stream drops, wait,
  /// then reconnect until shut down.
  void run(Stream &stream)
  {
    while (!stream.stopping)
    {
      auto provider = pickProvider(stream.chain);
      if (!provider)
      {
        reportError(stream, "", "no eligible provider with a WebSocket endpoint");
        settleFirstAttempt(stream, false);
      }
      else if (connect(stream, *provider))
      {
        pump(stream, *provider);
      }
      if (stream.stopping || !_config.reconnect || !waitToReconnect(stream))
      {
        break;
      }
      std::lock_guard<std::mutex> lock(stream.mutex);
      ++stream.reconnects;
    }
    stream.client.close(network::WebSocketClient::kGoingAway);
    settleFirstAttempt(stream, false);
  }

  bool connect(Stream &stream, const Provider &provider)
  {
    std::size_t replayed = 0;
    try
    {
      stream.client.connect(provider.wsUrl);
      // Subscriptions added while replaying are picked up before the stream
      // is marked connected; after that subscribe() sends them itself.
      for (;;)
      {
        std::vector<core::Json> pending;
        {
          std::lock_guard<std::mutex> lock(stream.mutex);
          if (replayed == stream.subscriptions.size())
          {
            stream.providerId = provider.id;
            stream.url = provider.wsUrl;
            stream.connected = true;
            break;
          }
          pending.assign(stream.subscriptions.begin() + static_cast<std::ptrdiff_t>(replayed),
                         stream.subscriptions.end());
        }
        for (const auto &request : pending)
        {
          stream.client.send(request.dump());
        }
        replayed += pending.size();
      }
    }
    catch (const std::exception &e)
    {
      stream.client.close();
      reportError(stream, provider.id, "connect to " + provider.wsUrl + " failed: " + e.what());
      settleFirstAttempt(stream, false);
      return false;
    }
    RPCMESH_LOG_INFO("Stream for " << stream.chain << " connected to " << provider.id << " ("
                                   << replayed << " subscription(s) replayed)");
    publish(EventType::StreamConnected, provider.id, stream.chain,
            "connected to " + provider.wsUrl, 0.0);
    settleFirstAttempt(stream, true);
    return true;
  }

  void pump(Stream &stream, const Provider &provider)
  {
    std::uint16_t code = network::WebSocketClient::kGoingAway;
    std::string reason = "stream closed";
    try
    {
      while (!stream.stopping)
      {
        if (auto text = stream.client.receive(_config.pollInterval))
        {
          deliver(stream, provider.id, *text);
        }
      }
    }
    catch (const network::WebSocketClosed &e)
    {
      code = e.code();
      reason = e.reason();
    }
    catch (const std::exception &e)
    {
      code = network::WebSocketClient::kAbnormalClosure;
      reason = e.what();
      reportError(stream, provider.id, e.what());
    }
    stream.client.close(network::WebSocketClient::kGoingAway);
    {
      std::lock_guard<std::mutex> lock(stream.mutex);
      stream.connected = false;
    }
    if (stream.stopping)
    {
      RPCMESH_LOG_INFO("Stream for " << stream.chain << " on " << provider.id << " closed");
    }
    else
    {
      RPCMESH_LOG_WARN("Stream for " << stream.chain << " on " << provider.id
                                     << " disconnected (" << code << " " << reason << ")");
    }
    publish(EventType::StreamDisconnected, provider.id, stream.chain, reason,
            static_cast<double>(code));
  }

  void deliver(Stream &stream, const std::string &providerId, const std::string &text)
  {
    auto message = core::tryParseJson(text);
    if (!message)
    {
      {
        std::lock_guard<std::mutex> lock(stream.mutex);
        ++stream.errors;
      }
      RPCMESH_LOG_ERROR("Unparseable message on the " << stream.chain << " stream from "
                                                      << providerId << ": "
                                                      << text.substr(0, 128));
      return;
    }
    {
      std::lock_guard<std::mutex> lock(stream.mutex);
      ++stream.messages;
    }
    MessageHandler handler;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      handler = _handler;
    }
    if (!handler)
    {
      return;
    }
    try
    {
      handler(StreamMessage{stream.chain, providerId, std::move(*message)});
    }
    catch (const std::exception &e)
    {
      RPCMESH_LOG_ERROR("Stream message handler failed on " << stream.chain << ": " << e.what());
    }
  }

  /// False once the stream is shut down during the wait.
  bool waitToReconnect(Stream &stream)
  {
    std::unique_lock<std::mutex> lock(stream.mutex);
    return !stream.wake.wait_for(lock, _config.reconnectDelay,
                                 [&stream]() { return stream.stopping.load(); });
  }

  static void settleFirstAttempt(Stream &stream, bool connected)
  {
    std::lock_guard<std::mutex> lock(stream.mutex);
    if (!stream.attempted)
    {
      stream.attempted = true;
      stream.firstAttempt.set_value(connected);
    }
  }

  void reportError(Stream &stream, const std::string &providerId, const std::string &message)
  {
    {
      std::lock_guard<std::mutex> lock(stream.mutex);
      ++stream.errors;
    }
    RPCMESH_LOG_ERROR("Stream for " << stream.chain
                                    << (providerId.empty() ? "" : " on " + providerId) << ": "
                                    << message);
    publish(EventType::StreamError, providerId, stream.chain, message, 0.0);
  }

  void publish(EventType type, const std::string &providerId, const std::string &chain,
               const std::string &message, double value) const
  {
    if (_events)
    {
      _events->publish(Event{type, providerId, chain, message, value, _clock->now()});
    }
  }

  StreamConfig _config;
  const ProviderSelector &_selector;
  std::shared_ptr<core::Clock> _clock;
  EventBus *_events;

  mutable std::mutex _mutex;
  std::map<std::string, std::shared_ptr<Stream>> _streams;
  MessageHandler _handler;
  std::atomic<std::uint64_t> _nextId{1};
  common::LifecycleState _state{common::LifecycleState::Created};
};

} // namespace rpc
} // namespace rpcmesh
