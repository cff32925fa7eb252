// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// Tests for the TimerService

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <atomic>
#include <thread>

using rpcmesh::common::LifecycleState;
using rpcmesh::core::TimerService;
using namespace std::chrono_literals;

namespace
{
template <typename Pred> bool eventually(Pred pred, std::chrono::milliseconds limit = 2000ms)
{
  auto deadline = std::chrono::steady_clock::now() + limit;
  while (!pred())
  {
    if (std::chrono::steady_clock::now() >= deadline)
    {
      return false;
    }
    std::this_thread::sleep_for(1ms);
  }
  return true;
}
} // namespace

TEST_CASE("TimerService fires one-shot timers once", "[timer][oneshot]")
{
  rpcmesh::test::initializeTestLogging();
  TimerService timer("test-timer");
  REQUIRE(timer.start().success);

  std::atomic<int> fired{0};
  auto start = std::chrono::steady_clock::now();
  std::atomic<long long> elapsedMs{-1};
  timer.scheduleAfter(20ms, [&]() {
    elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - start)
                    .count();
    ++fired;
  });
  REQUIRE(timer.scheduledCount() == 1);

  REQUIRE(eventually([&]() { return fired.load() == 1; }));
  REQUIRE(elapsedMs.load() >= 20);
  std::this_thread::sleep_for(40ms);
  REQUIRE(fired.load() == 1);
  REQUIRE(timer.scheduledCount() == 0);
  REQUIRE(timer.firedCount() == 1);
}

TEST_CASE("TimerService fires in due order", "[timer][order]")
{
  TimerService timer;
  timer.start();

  std::mutex mutex;
  std::vector<int> order;
  auto record = [&](int n) {
    return [&, n]() {
      std::lock_guard<std::mutex> lock(mutex);
      order.push_back(n);
    };
  };
  timer.scheduleAfter(30ms, record(3));
  timer.scheduleAfter(10ms, record(1));
  timer.scheduleAfter(20ms, record(2));

  REQUIRE(eventually([&]() {
    std::lock_guard<std::mutex> lock(mutex);
    return order.size() == 3;
  }));
  std::lock_guard<std::mutex> lock(mutex);
  REQUIRE(order == std::vector<int>{1, 2, 3});
}

TEST_CASE("TimerService periodic timers repeat until cancelled", "[timer][periodic]")
{
  TimerService timer;
  timer.start();

  std::atomic<int> ticks{0};
  auto id = timer.schedulePeriodic(5ms, [&]() { ++ticks; });
  REQUIRE(eventually([&]() { return ticks.load() >= 3; }));

  REQUIRE(timer.cancel(id));
  REQUIRE_FALSE(timer.cancel(id));
  int afterCancel = ticks.load();
  std::this_thread::sleep_for(30ms);
  REQUIRE(ticks.load() <= afterCancel + 1);

  REQUIRE_THROWS_AS(timer.schedulePeriodic(0ms, []() {}), std::invalid_argument);
}

TEST_CASE("TimerService survives throwing handlers", "[timer][errors]")
{
  TimerService timer;
  timer.start();

  std::atomic<int> ticks{0};
  timer.schedulePeriodic(5ms, [&]() {
    ++ticks;
    throw std::runtime_error("handler failed");
  });
  REQUIRE(eventually([&]() { return ticks.load() >= 3; }));
}

TEST_CASE("TimerService cancelled one-shot never fires", "[timer][cancel]")
{
  TimerService timer;
  timer.start();

  std::atomic<bool> fired{false};
  auto id = timer.scheduleAfter(20ms, [&]() { fired = true; });
  REQUIRE(timer.cancel(id));
  std::this_thread::sleep_for(40ms);
  REQUIRE_FALSE(fired.load());
}

TEST_CASE("TimerService lifecycle", "[timer][lifecycle]")
{
  TimerService timer;
  REQUIRE(timer.getState() == LifecycleState::Created);
  REQUIRE(timer.start().success);
  REQUIRE(timer.start().success);

  timer.scheduleAfter(1000ms, []() {});
  timer.schedulePeriodic(1000ms, []() {});
  REQUIRE(timer.getInFlightCount() == 2);

  auto drained = timer.drain();
  REQUIRE(drained.success);
  REQUIRE(drained.drainStats->cancelled == 2);
  REQUIRE(timer.scheduledCount() == 0);
  REQUIRE_THROWS_AS(timer.scheduleAfter(1ms, []() {}), std::runtime_error);

  REQUIRE_FALSE(timer.reset().success);
  REQUIRE(timer.stop().success);
  REQUIRE(timer.getState() == LifecycleState::Stopped);
  REQUIRE(timer.reset().success);
  REQUIRE(timer.start().success);

  std::atomic<bool> fired{false};
  timer.scheduleAfter(5ms, [&]() { fired = true; });
  REQUIRE(eventually([&]() { return fired.load(); }));
}
