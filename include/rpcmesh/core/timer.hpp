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
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "rpcmesh/common/i_lifecycle_managed.hpp"
#include "rpcmesh/core/logger.hpp"

namespace rpcmesh
{
namespace core
{

/// \brief Single-threaded scheduler for one-shot and periodic callbacks.
///
/// Drives the background loops of the orchestrator: health checks, dispatch
/// ticks, pool health checks, auto-scaling, cleanup and ledger purging.
/// Handlers run on the timer thread and must not block for long. A handler
/// that throws is logged; periodic timers keep firing afterwards.
class TimerService : public common::ILifecycleManaged
{
public:
  using Clock = std::chrono::steady_clock;
  using TimePoint = Clock::time_point;
  using Duration = std::chrono::milliseconds;
  using TimerId = std::uint64_t;

  explicit TimerService(std::string name = "rpcmesh-timer") : _name(std::move(name)) {}

  ~TimerService() override { shutdown(); }

  TimerService(const TimerService &) = delete;
  TimerService &operator=(const TimerService &) = delete;

  /// \brief Run handler once after d. Returns an id usable with cancel().
  TimerId scheduleAfter(Duration d, std::function<void()> handler)
  {
    return add(d, Duration::zero(), std::move(handler));
  }

  /// \brief Run handler every interval, first firing one interval from now.
  TimerId schedulePeriodic(Duration interval, std::function<void()> handler)
  {
    if (interval <= Duration::zero())
    {
      throw std::invalid_argument("TimerService: periodic interval must be positive");
    }
    return add(interval, interval, std::move(handler));
  }

  /// \brief Cancel a timer; returns true if it was still scheduled.
  bool cancel(TimerId id)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _timers.erase(id) > 0;
  }

  std::size_t scheduledCount() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _timers.size();
  }

  std::uint64_t firedCount() const { return _fired.load(); }

  // ═══════════════════════════════════════════════════════════════════
  // ILifecycleManaged
  // ═══════════════════════════════════════════════════════════════════

  common::LifecycleResult start() override
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_state == common::LifecycleState::Running)
    {
      return {true, _state, "TimerService already running"};
    }
    if (_state != common::LifecycleState::Created && _state != common::LifecycleState::Reset)
    {
      return {false, _state, "TimerService cannot start from state " +
                                 std::string(common::lifecycleStateToString(_state))};
    }
    _exit = false;
    _thread = std::thread([this]() { run(); });
    _state = common::LifecycleState::Running;
    return {true, _state, "TimerService '" + _name + "' started"};
  }

  /// Cancels every pending timer. Periodic loops are not waited on.
  common::LifecycleResult drain(std::uint32_t /*timeoutMs*/ = 30000) override
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_state != common::LifecycleState::Running)
    {
      return {false, _state, "TimerService is not running"};
    }
    auto pending = static_cast<std::uint32_t>(_timers.size());
    _timers.clear();
    _state = common::LifecycleState::Draining;
    return {true, _state, "TimerService drained",
            common::DrainStats(pending, 0, pending, 0)};
  }

  common::LifecycleResult stop() override
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_state == common::LifecycleState::Stopped || _state == common::LifecycleState::Reset)
      {
        return {true, _state, "TimerService already stopped"};
      }
    }
    shutdown();
    std::lock_guard<std::mutex> lock(_mutex);
    _state = common::LifecycleState::Stopped;
    return {true, _state, "TimerService stopped"};
  }

  common::LifecycleResult reset() override
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_state != common::LifecycleState::Stopped)
    {
      return {false, _state, "TimerService must be stopped before reset"};
    }
    _timers.clear();
    _heap = decltype(_heap)();
    _state = common::LifecycleState::Reset;
    return {true, _state, "TimerService reset"};
  }

  common::LifecycleState getState() const override
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _state;
  }

  std::uint32_t getInFlightCount() const override
  {
    return static_cast<std::uint32_t>(scheduledCount());
  }

private:
  struct Record
  {
    Duration interval;
    std::function<void()> handler;
  };

  struct HeapItem
  {
    TimePoint due;
    TimerId id;

    bool operator>(const HeapItem &other) const
    {
      return due != other.due ? due > other.due : id > other.id;
    }
  };

  TimerId add(Duration delay, Duration interval, std::function<void()> handler)
  {
    TimerId id;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_state != common::LifecycleState::Running && _state != common::LifecycleState::Created)
      {
        throw std::runtime_error("TimerService is not accepting timers");
      }
      id = ++_nextId;
      _timers.emplace(id, Record{interval, std::move(handler)});
      _heap.push(HeapItem{Clock::now() + delay, id});
    }
    _cv.notify_one();
    return id;
  }

  void run()
  {
    std::unique_lock<std::mutex> lock(_mutex);
    while (!_exit)
    {
      if (_heap.empty())
      {
        _cv.wait(lock, [this]() { return _exit || !_heap.empty(); });
        continue;
      }
      HeapItem next = _heap.top();
      if (Clock::now() < next.due)
      {
        _cv.wait_until(lock, next.due);
        continue;
      }
      _heap.pop();
      auto it = _timers.find(next.id);
      if (it == _timers.end())
      {
        continue;
      }
      std::function<void()> handler = it->second.handler;
      Duration interval = it->second.interval;
      if (interval > Duration::zero())
      {
        _heap.push(HeapItem{next.due + interval, next.id});
      }
      else
      {
        _timers.erase(it);
      }

      lock.unlock();
      invoke(next.id, handler);
      lock.lock();
    }
  }

  void invoke(TimerId id, const std::function<void()> &handler)
  {
    ++_fired;
    try
    {
      handler();
    }
    catch (const std::exception &e)
    {
      RPCMESH_LOG_ERROR("TimerService '" << _name << "': timer " << id << " threw: " << e.what());
    }
  }

  void shutdown()
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      _exit = true;
    }
    _cv.notify_all();
    if (_thread.joinable())
    {
      _thread.join();
    }
  }

  std::string _name;
  mutable std::mutex _mutex;
  std::condition_variable _cv;
  std::map<TimerId, Record> _timers;
  std::priority_queue<HeapItem, std::vector<HeapItem>, std::greater<HeapItem>> _heap;
  std::thread _thread;
  TimerId _nextId{0};
  std::atomic<std::uint64_t> _fired{0};
  bool _exit{false};
  common::LifecycleState _state{common::LifecycleState::Created};
};

} // namespace core
} // namespace rpcmesh
