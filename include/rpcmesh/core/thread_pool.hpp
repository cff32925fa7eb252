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
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

#include "rpcmesh/common/i_lifecycle_managed.hpp"
#include "rpcmesh/core/logger.hpp"

namespace rpcmesh
{
namespace core
{

/// Fixed-size worker pool with a bounded task queue. Runs queued RPC
/// dispatches, batch items and pool checks off the caller's thread.
/// Exceptions escaping void tasks are forwarded to onTaskError.
class ThreadPool : public common::ILifecycleManaged
{
public:
  using ErrorHandler = std::function<void(std::exception_ptr)>;

  /// @param workerCount   Number of worker threads (at least one).
  /// @param maxQueueSize  Queued task limit; enqueue() throws beyond it.
  /// @param onTaskError   Optional handler for exceptions from void tasks.
  explicit ThreadPool(std::size_t workerCount = 4, std::size_t maxQueueSize = 4096,
                      ErrorHandler onTaskError = nullptr)
      : _workerCount(workerCount == 0 ? 1 : workerCount), _maxQueueSize(maxQueueSize),
        _onTaskError(std::move(onTaskError))
  {
    start();
  }

  ~ThreadPool() override { joinWorkers(); }

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;

  /// Enqueue a fire-and-forget task. Throws std::runtime_error when the
  /// pool is not running or the queue is full.
  template <typename F, typename... Args> void enqueue(F &&func, Args &&...args)
  {
    enqueueImpl(wrapVoid(std::bind(std::forward<F>(func), std::forward<Args>(args)...)), true);
  }

  /// Enqueue a task and obtain its result (or exception) through a future.
  template <typename F, typename... Args>
  auto enqueueWithResult(F &&func, Args &&...args) -> std::future<std::invoke_result_t<F, Args...>>
  {
    using ResultType = std::invoke_result_t<F, Args...>;
    auto task = std::make_shared<std::packaged_task<ResultType()>>(
        std::bind(std::forward<F>(func), std::forward<Args>(args)...));
    auto future = task->get_future();
    enqueueImpl([task]() { (*task)(); }, true);
    return future;
  }

  /// Like enqueue() but returns false instead of throwing.
  template <typename F, typename... Args> bool tryEnqueue(F &&func, Args &&...args)
  {
    return enqueueImpl(
        wrapVoid(std::bind(std::forward<F>(func), std::forward<Args>(args)...)), false);
  }

  std::size_t getPendingTaskCount() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _tasks.size();
  }

  std::size_t getBusyWorkerCount() const { return _busy.load(); }

  std::size_t getWorkerCount() const { return _workerCount; }

  void setErrorHandler(ErrorHandler handler)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _onTaskError = std::move(handler);
  }

  // ═══════════════════════════════════════════════════════════════════
  // ILifecycleManaged
  // ═══════════════════════════════════════════════════════════════════

  common::LifecycleResult start() override
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_state == common::LifecycleState::Running)
    {
      return {true, _state, "ThreadPool already running"};
    }
    if (_state != common::LifecycleState::Created && _state != common::LifecycleState::Reset)
    {
      return {false, _state, "ThreadPool cannot start from state " +
                                 std::string(common::lifecycleStateToString(_state))};
    }
    _exit = false;
    for (std::size_t i = 0; i < _workerCount; ++i)
    {
      _workers.emplace_back([this]() { workerLoop(); });
    }
    _state = common::LifecycleState::Running;
    return {true, _state, "ThreadPool started with " + std::to_string(_workerCount) + " workers"};
  }

  common::LifecycleResult drain(std::uint32_t timeoutMs = 30000) override
  {
    std::unique_lock<std::mutex> lock(_mutex);
    if (_state != common::LifecycleState::Running && _state != common::LifecycleState::Draining)
    {
      return {false, _state, "ThreadPool is not running"};
    }
    _state = common::LifecycleState::Draining;
    auto atStart = static_cast<std::uint32_t>(_tasks.size() + _busy.load());
    auto idle = [this]() { return _tasks.empty() && _busy.load() == 0; };
    bool done = true;
    if (timeoutMs == 0)
    {
      _idleCv.wait(lock, idle);
    }
    else
    {
      done = _idleCv.wait_for(lock, std::chrono::milliseconds(timeoutMs), idle);
    }
    auto remaining = static_cast<std::uint32_t>(_tasks.size() + _busy.load());
    common::DrainStats stats(atStart, remaining, 0, atStart > remaining ? atStart - remaining : 0);
    return {done, _state, done ? "ThreadPool drained" : "ThreadPool drain timed out", stats};
  }

  common::LifecycleResult stop() override
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_state == common::LifecycleState::Stopped || _state == common::LifecycleState::Reset)
      {
        return {true, _state, "ThreadPool already stopped"};
      }
    }
    joinWorkers();
    std::lock_guard<std::mutex> lock(_mutex);
    _state = common::LifecycleState::Stopped;
    return {true, _state, "ThreadPool stopped"};
  }

  common::LifecycleResult reset() override
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_state != common::LifecycleState::Stopped)
    {
      return {false, _state, "ThreadPool must be stopped before reset"};
    }
    std::queue<std::function<void()>> empty;
    _tasks.swap(empty);
    _workers.clear();
    _state = common::LifecycleState::Reset;
    return {true, _state, "ThreadPool reset"};
  }

  common::LifecycleState getState() const override
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _state;
  }

  std::uint32_t getInFlightCount() const override
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return static_cast<std::uint32_t>(_tasks.size() + _busy.load());
  }

private:
  template <typename Bound> std::function<void()> wrapVoid(Bound bound)
  {
    return [bound = std::move(bound), this]() mutable
    {
      try
      {
        bound();
      }
      catch (...)
      {
        reportTaskError(std::current_exception());
      }
    };
  }

  void reportTaskError(std::exception_ptr error)
  {
    ErrorHandler handler;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      handler = _onTaskError;
    }
    if (handler)
    {
      handler(error);
      return;
    }
    try
    {
      std::rethrow_exception(error);
    }
    catch (const std::exception &e)
    {
      Logger::error(std::string("ThreadPool: unhandled exception in task: ") + e.what());
    }
    catch (...)
    {
      Logger::error("ThreadPool: unhandled non-standard exception in task");
    }
  }

  bool enqueueImpl(std::function<void()> task, bool throwOnReject)
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_state != common::LifecycleState::Running)
      {
        if (throwOnReject)
        {
          throw std::runtime_error("ThreadPool is not accepting tasks");
        }
        return false;
      }
      if (_tasks.size() >= _maxQueueSize)
      {
        if (throwOnReject)
        {
          throw std::runtime_error("ThreadPool task queue is full");
        }
        return false;
      }
      _tasks.emplace(std::move(task));
    }
    _taskCv.notify_one();
    return true;
  }

  void workerLoop()
  {
    while (true)
    {
      std::function<void()> task;
      {
        std::unique_lock<std::mutex> lock(_mutex);
        _taskCv.wait(lock, [this]() { return _exit || !_tasks.empty(); });
        if (_tasks.empty())
        {
          return;
        }
        task = std::move(_tasks.front());
        _tasks.pop();
        ++_busy;
      }
      task();
      {
        std::lock_guard<std::mutex> lock(_mutex);
        --_busy;
      }
      _idleCv.notify_all();
    }
  }

  // Workers finish every queued task before exiting.
  void joinWorkers()
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      _exit = true;
    }
    _taskCv.notify_all();
    for (auto &worker : _workers)
    {
      if (worker.joinable())
      {
        worker.join();
      }
    }
  }

  std::size_t _workerCount;
  std::size_t _maxQueueSize;
  ErrorHandler _onTaskError;
  mutable std::mutex _mutex;
  std::condition_variable _taskCv;
  std::condition_variable _idleCv;
  std::queue<std::function<void()>> _tasks;
  std::vector<std::thread> _workers;
  std::atomic<std::size_t> _busy{0};
  bool _exit{false};
  common::LifecycleState _state{common::LifecycleState::Created};
};

} // namespace core
} // namespace rpcmesh
