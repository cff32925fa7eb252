// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// Tests for the ThreadPool

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <atomic>
#include <thread>

using rpcmesh::common::LifecycleState;
using rpcmesh::core::ThreadPool;
using namespace std::chrono_literals;

TEST_CASE("ThreadPool runs tasks and returns results", "[threadpool][basic]")
{
  rpcmesh::test::initializeTestLogging();
  ThreadPool pool(4, 64);
  REQUIRE(pool.getState() == LifecycleState::Running);
  REQUIRE(pool.getWorkerCount() == 4);

  SECTION("Fire-and-forget tasks")
  {
    std::atomic<int> counter{0};
    for (int i = 0; i < 20; ++i)
    {
      pool.enqueue([&counter]() { ++counter; });
    }
    REQUIRE(pool.drain(2000).success);
    REQUIRE(counter.load() == 20);
  }

  SECTION("Results travel through futures")
  {
    auto sum = pool.enqueueWithResult([](int a, int b) { return a + b; }, 2, 3);
    auto text = pool.enqueueWithResult([]() { return std::string("eth_blockNumber"); });
    REQUIRE(sum.get() == 5);
    REQUIRE(text.get() == "eth_blockNumber");
  }

  SECTION("Exceptions travel through futures")
  {
    auto failing = pool.enqueueWithResult([]() -> int { throw std::runtime_error("boom"); });
    REQUIRE_THROWS_WITH(failing.get(), "boom");
  }
}

TEST_CASE("ThreadPool forwards void task errors to the handler", "[threadpool][errors]")
{
  std::mutex mutex;
  std::vector<std::string> errors;
  ThreadPool pool(1, 16, [&](std::exception_ptr error) {
    try
    {
      std::rethrow_exception(error);
    }
    catch (const std::exception &e)
    {
      std::lock_guard<std::mutex> lock(mutex);
      errors.push_back(e.what());
    }
  });

  pool.enqueue([]() { throw std::runtime_error("task failed"); });
  std::atomic<bool> ran{false};
  pool.enqueue([&ran]() { ran = true; });
  REQUIRE(pool.drain(2000).success);

  REQUIRE(ran.load());
  std::lock_guard<std::mutex> lock(mutex);
  REQUIRE(errors == std::vector<std::string>{"task failed"});
}

TEST_CASE("ThreadPool bounds its queue", "[threadpool][queue]")
{
  ThreadPool pool(1, 2);
  std::promise<void> gate;
  auto opened = gate.get_future().share();
  std::atomic<bool> started{false};

  pool.enqueue([opened, &started]() {
    started = true;
    opened.wait();
  });
  while (!started.load())
  {
    std::this_thread::sleep_for(1ms);
  }
  REQUIRE(pool.getBusyWorkerCount() == 1);

  REQUIRE(pool.tryEnqueue([]() {}));
  REQUIRE(pool.tryEnqueue([]() {}));
  REQUIRE(pool.getPendingTaskCount() == 2);
  REQUIRE_FALSE(pool.tryEnqueue([]() {}));
  REQUIRE_THROWS_AS(pool.enqueue([]() {}), std::runtime_error);
  REQUIRE(pool.getInFlightCount() == 3);

  gate.set_value();
  REQUIRE(pool.drain(2000).success);
  REQUIRE(pool.getInFlightCount() == 0);
}

TEST_CASE("ThreadPool lifecycle", "[threadpool][lifecycle]")
{
  ThreadPool pool(2, 16);

  SECTION("Drain reports stats and stops intake")
  {
    for (int i = 0; i < 4; ++i)
    {
      pool.enqueue([]() { std::this_thread::sleep_for(5ms); });
    }
    auto result = pool.drain(2000);
    REQUIRE(result.success);
    REQUIRE(result.newState == LifecycleState::Draining);
    REQUIRE(result.drainStats.has_value());
    REQUIRE(result.drainStats->remaining == 0);
    REQUIRE_FALSE(pool.tryEnqueue([]() {}));
  }

  SECTION("Drain times out on a long task")
  {
    std::promise<void> gate;
    auto opened = gate.get_future().share();
    pool.enqueue([opened]() { opened.wait(); });
    std::this_thread::sleep_for(10ms);
    auto result = pool.drain(20);
    REQUIRE_FALSE(result.success);
    REQUIRE(result.drainStats->remaining == 1);
    gate.set_value();
  }

  SECTION("Stop finishes queued work, reset allows a restart")
  {
    std::atomic<int> counter{0};
    for (int i = 0; i < 10; ++i)
    {
      pool.enqueue([&counter]() { ++counter; });
    }
    REQUIRE_FALSE(pool.reset().success);
    REQUIRE(pool.stop().success);
    REQUIRE(counter.load() == 10);
    REQUIRE(pool.getState() == LifecycleState::Stopped);
    REQUIRE_THROWS_AS(pool.enqueue([]() {}), std::runtime_error);

    REQUIRE(pool.reset().success);
    REQUIRE(pool.start().success);
    auto answer = pool.enqueueWithResult([]() { return 42; });
    REQUIRE(answer.get() == 42);
  }
}
