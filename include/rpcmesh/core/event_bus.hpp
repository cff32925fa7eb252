// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of RpcMesh, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include "rpcmesh/core/logger.hpp"

namespace rpcmesh
{
namespace core
{

/// \brief Synchronous publish/subscribe hub.
///
/// Handlers run on the publishing thread, in subscription order, after the
/// publisher has released its own locks. A throwing handler is logged and
/// does not stop delivery to the remaining handlers.
template <typename EventT> class EventBus
{
public:
  using Handler = std::function<void(const EventT &)>;
  using SubscriptionId = std::uint64_t;

  SubscriptionId subscribe(Handler handler)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    SubscriptionId id = ++_nextId;
    _handlers.emplace(id, std::make_shared<Handler>(std::move(handler)));
    return id;
  }

  bool unsubscribe(SubscriptionId id)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _handlers.erase(id) > 0;
  }

  void publish(const EventT &event) const
  {
    std::vector<std::shared_ptr<Handler>> handlers;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      handlers.reserve(_handlers.size());
      for (const auto &entry : _handlers)
      {
        handlers.push_back(entry.second);
      }
    }
    for (const auto &handler : handlers)
    {
      try
      {
        (*handler)(event);
      }
      catch (const std::exception &e)
      {
        Logger::error(std::string("EventBus: handler threw: ") + e.what());
      }
    }
  }

  void publishAll(const std::vector<EventT> &events) const
  {
    for (const auto &event : events)
    {
      publish(event);
    }
  }

  std::size_t subscriberCount() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _handlers.size();
  }

private:
  mutable std::mutex _mutex;
  std::map<SubscriptionId, std::shared_ptr<Handler>> _handlers;
  SubscriptionId _nextId{0};
};

/// \brief Buffers events from a bus so a caller can drain them in order.
/// Unsubscribes on destruction.
template <typename EventT> class EventChannel
{
public:
  explicit EventChannel(EventBus<EventT> &bus, std::size_t capacity = 4096)
    : _bus(bus), _capacity(capacity)
  {
    _subscription = _bus.subscribe([this](const EventT &event) { push(event); });
  }

  ~EventChannel() { _bus.unsubscribe(_subscription); }

  EventChannel(const EventChannel &) = delete;
  EventChannel &operator=(const EventChannel &) = delete;

  /// \brief Remove and return everything buffered so far.
  std::vector<EventT> drain()
  {
    std::lock_guard<std::mutex> lock(_mutex);
    std::vector<EventT> out(_events.begin(), _events.end());
    _events.clear();
    return out;
  }

  std::size_t size() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _events.size();
  }

  /// \brief Events discarded because the buffer was full.
  std::uint64_t dropped() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _dropped;
  }

private:
  void push(const EventT &event)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_events.size() >= _capacity)
    {
      _events.pop_front();
      ++_dropped;
    }
    _events.push_back(event);
  }

  EventBus<EventT> &_bus;
  std::size_t _capacity;
  typename EventBus<EventT>::SubscriptionId _subscription{0};
  mutable std::mutex _mutex;
  std::deque<EventT> _events;
  std::uint64_t _dropped{0};
};

} // namespace core
} // namespace rpcmesh
