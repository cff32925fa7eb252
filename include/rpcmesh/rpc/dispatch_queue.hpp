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
#include <condition_variable>
#include <deque>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "rpcmesh/common/i_lifecycle_managed.hpp"
#include "rpcmesh/core/logger.hpp"
#include "rpcmesh/core/thread_pool.hpp"
#include "rpcmesh/rpc/errors.hpp"
#include "rpcmesh/rpc/provider_selector.hpp"
#include "rpcmesh/rpc/request_executor.hpp"
#include "rpcmesh/rpc/types.hpp"

namespace rpcmesh
{
namespace rpc
{

struct DispatchQueueConfig
{
  /// Per-chain limit; enqueue() throws QueueSaturated beyond it.
  std::size_t maxQueueDepth = 1000;
  std::chrono::milliseconds tickInterval{1000};
};

/// \brief Handle for a queued request. The future resolves with the response
/// or with the error that ended it (including RequestCancelled).
struct QueuedCall
{
  std::string requestId;
  std::string chain;
  std::future<RpcResponse> result;
};

/// \brief Per-chain FIFO queues drained at a fixed tick under the best
/// provider's rate limit.
///
/// Each tick() pops up to rateLimit requests per chain, where rateLimit is
/// that of the chain's best eligible provider at the time of the tick, and
/// hands them to the worker pool for execution. A chain with no eligible
/// provider keeps its queue intact until one becomes available.
class DispatchQueue : public common::ILifecycleManaged
{
public:
  DispatchQueue(DispatchQueueConfig config, const ProviderSelector &selector,
                RequestExecutor &executor, core::ThreadPool &workers)
      : _config(config), _selector(selector), _executor(executor), _workers(workers)
  {
  }

  ~DispatchQueue() override
  {
    cancelAll("dispatch queue destroyed");
    waitForInFlight(std::chrono::steady_clock::now() + std::chrono::seconds(30));
  }

  DispatchQueue(const DispatchQueue &) = delete;
  DispatchQueue &operator=(const DispatchQueue &) = delete;

  /// \brief Queue a request without blocking.
  /// \throws QueueSaturated when the chain's queue is full.
  /// \throws RpcError when the queue is draining or stopped.
  QueuedCall enqueue(RpcRequest request)
  {
    auto item = std::make_shared<Item>();
    item->request = std::move(request);
    QueuedCall call;
    call.requestId = item->request.id;
    call.chain = item->request.chain;
    call.result = item->promise.get_future();
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_state != common::LifecycleState::Created && _state != common::LifecycleState::Running)
      {
        throw RpcError("Dispatch queue is not accepting requests (state " +
                       std::string(common::lifecycleStateToString(_state)) + ")");
      }
      auto &queue = _queues[call.chain];
      if (queue.size() >= _config.maxQueueDepth)
      {
        ++_rejected;
        RPCMESH_LOG_WARN("Dispatch queue for " << call.chain << " saturated at " << queue.size());
        throw QueueSaturated(call.chain, queue.size(), _config.maxQueueDepth);
      }
      queue.push_back(item);
      ++_enqueued;
    }
    return call;
  }

  /// \brief Remove a request that has not been dispatched yet. Its future
  /// fails with RequestCancelled. Returns false if it already left the queue.
  bool cancel(const std::string &requestId)
  {
    std::shared_ptr<Item> removed;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      for (auto &entry : _queues)
      {
        auto &queue = entry.second;
        auto it = std::find_if(queue.begin(), queue.end(), [&requestId](const auto &item) {
          return item->request.id == requestId;
        });
        if (it != queue.end())
        {
          removed = *it;
          queue.erase(it);
          break;
        }
      }
    }
    if (!removed)
    {
      return false;
    }
    ++_cancelled;
    removed->promise.set_exception(std::make_exception_ptr(RequestCancelled(requestId)));
    return true;
  }

  /// \brief One dispatch cycle across all chains. Returns the number of
  /// requests handed to the workers.
  std::size_t tick()
  {
    std::vector<std::string> chains;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      for (const auto &entry : _queues)
      {
        if (!entry.second.empty())
        {
          chains.push_back(entry.first);
        }
      }
    }

    std::size_t dispatched = 0;
    for (const auto &chain : chains)
    {
      auto best = _selector.best(chain);
      if (!best)
      {
        RPCMESH_LOG_DEBUG("No eligible provider for " << chain << ", "
                                                      << pending(chain) << " request(s) held");
        continue;
      }
      std::vector<std::shared_ptr<Item>> batch;
      {
        std::lock_guard<std::mutex> lock(_mutex);
        auto &queue = _queues[chain];
        std::size_t permits = std::min<std::size_t>(queue.size(), best->rateLimit);
        for (std::size_t i = 0; i < permits; ++i)
        {
          batch.push_back(std::move(queue.front()));
          queue.pop_front();
        }
      }
      for (auto &item : batch)
      {
        dispatch(std::move(item));
        ++dispatched;
      }
      if (!batch.empty())
      {
        RPCMESH_LOG_TRACE("Dispatched " << batch.size() << " request(s) for " << chain << " via "
                                        << best->id << ", " << pending(chain) << " left");
      }
    }
    return dispatched;
  }

  std::size_t pending(const std::string &chain) const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _queues.find(chain);
    return it == _queues.end() ? 0 : it->second.size();
  }

  std::size_t pending() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return pendingLocked();
  }

  std::map<std::string, std::size_t> depths() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    std::map<std::string, std::size_t> out;
    for (const auto &entry : _queues)
    {
      out[entry.first] = entry.second.size();
    }
    return out;
  }

  std::size_t inFlight() const { return _inFlight.load(); }
  std::uint64_t enqueuedCount() const { return _enqueued.load(); }
  std::uint64_t rejectedCount() const { return _rejected.load(); }
  std::uint64_t cancelledCount() const { return _cancelled.load(); }

  const DispatchQueueConfig &config() const { return _config; }

  // ═══════════════════════════════════════════════════════════════════
  // ILifecycleManaged
  // ═══════════════════════════════════════════════════════════════════

  common::LifecycleResult start() override
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_state == common::LifecycleState::Running)
    {
      return {true, _state, "DispatchQueue already running"};
    }
    if (_state != common::LifecycleState::Created && _state != common::LifecycleState::Reset)
    {
      return {false, _state, "DispatchQueue cannot start from state " +
                                 std::string(common::lifecycleStateToString(_state))};
    }
    _state = common::LifecycleState::Running;
    return {true, _state, "DispatchQueue started"};
  }

  /// Keeps ticking until every queue is empty or the timeout expires, then
  /// cancels what is left and waits for dispatched requests to finish.
  common::LifecycleResult drain(std::uint32_t timeoutMs = 30000) override
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_state != common::LifecycleState::Running && _state != common::LifecycleState::Created)
      {
        return {false, _state, "DispatchQueue is not running"};
      }
      _state = common::LifecycleState::Draining;
    }
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    auto atStart = static_cast<std::uint32_t>(pending() + inFlight());

    while (pending() > 0 && std::chrono::steady_clock::now() < deadline)
    {
      if (tick() == 0)
      {
        std::unique_lock<std::mutex> lock(_mutex);
        _doneCv.wait_until(lock, std::min(deadline, std::chrono::steady_clock::now() +
                                                        _config.tickInterval));
      }
    }
    auto cancelled = static_cast<std::uint32_t>(cancelAll("dispatch queue drained"));
    bool finished = waitForInFlight(deadline);
    auto remaining = static_cast<std::uint32_t>(inFlight());

    common::DrainStats stats(atStart, remaining, cancelled,
                             atStart >= cancelled + remaining ? atStart - cancelled - remaining
                                                              : 0);
    RPCMESH_LOG_INFO("Dispatch queue drained: " << stats.completed << " completed, " << cancelled
                                                << " cancelled, " << remaining << " in flight");
    return {finished && cancelled == 0, common::LifecycleState::Draining,
            finished ? "DispatchQueue drained" : "DispatchQueue drain timed out", stats};
  }

  common::LifecycleResult stop() override
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_state == common::LifecycleState::Stopped || _state == common::LifecycleState::Reset)
    {
      return {true, _state, "DispatchQueue already stopped"};
    }
    _state = common::LifecycleState::Stopped;
    return {true, _state, "DispatchQueue stopped"};
  }

  common::LifecycleResult reset() override
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_state != common::LifecycleState::Stopped)
    {
      return {false, _state, "DispatchQueue must be stopped before reset"};
    }
    _queues.clear();
    _state = common::LifecycleState::Reset;
    return {true, _state, "DispatchQueue reset"};
  }

  common::LifecycleState getState() const override
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _state;
  }

  std::uint32_t getInFlightCount() const override
  {
    return static_cast<std::uint32_t>(pending() + inFlight());
  }

private:
  struct Item
  {
    RpcRequest request;
    std::promise<RpcResponse> promise;
  };

  void dispatch(std::shared_ptr<Item> item)
  {
    ++_inFlight;
    auto run = [this, item]() {
      try
      {
        item->promise.set_value(_executor.execute(item->request));
      }
      catch (...)
      {
        item->promise.set_exception(std::current_exception());
      }
      finishOne();
    };
    try
    {
      _workers.enqueue(run);
    }
    catch (const std::exception &e)
    {
      RPCMESH_LOG_ERROR("Cannot dispatch " << item->request.id << ": " << e.what());
      item->promise.set_exception(std::current_exception());
      finishOne();
    }
  }

  /// Notifies under the lock: a waiter in the destructor may destroy
  /// _doneCv as soon as it observes zero.
  void finishOne()
  {
    std::lock_guard<std::mutex> lock(_mutex);
    --_inFlight;
    _doneCv.notify_all();
  }

  std::size_t cancelAll(const std::string &reason)
  {
    std::vector<std::shared_ptr<Item>> dropped;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      for (auto &entry : _queues)
      {
        for (auto &item : entry.second)
        {
          dropped.push_back(std::move(item));
        }
        entry.second.clear();
      }
    }
    for (auto &item : dropped)
    {
      item->promise.set_exception(std::make_exception_ptr(RequestCancelled(item->request.id)));
    }
    if (!dropped.empty())
    {
      _cancelled += dropped.size();
      RPCMESH_LOG_WARN("Cancelled " << dropped.size() << " queued request(s): " << reason);
    }
    return dropped.size();
  }

  bool waitForInFlight(std::chrono::steady_clock::time_point deadline)
  {
    std::unique_lock<std::mutex> lock(_mutex);
    return _doneCv.wait_until(lock, deadline, [this]() { return _inFlight.load() == 0; });
  }

  std::size_t pendingLocked() const
  {
    std::size_t total = 0;
    for (const auto &entry : _queues)
    {
      total += entry.second.size();
    }
    return total;
  }

  DispatchQueueConfig _config;
  const ProviderSelector &_selector;
  RequestExecutor &_executor;
  core::ThreadPool &_workers;

  mutable std::mutex _mutex;
  std::condition_variable _doneCv;
  std::map<std::string, std::deque<std::shared_ptr<Item>>> _queues;
  std::atomic<std::size_t> _inFlight{0};
  std::atomic<std::uint64_t> _enqueued{0};
  std::atomic<std::uint64_t> _rejected{0};
  std::atomic<std::uint64_t> _cancelled{0};
  common::LifecycleState _state{common::LifecycleState::Created};
};

} // namespace rpc
} // namespace rpcmesh
