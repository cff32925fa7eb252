// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// Tests for HealthTracker: rolling metrics, blacklist, budget and ledger

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <thread>

using namespace rpcmesh::rpc;
using rpcmesh::test::EventRecorder;
using rpcmesh::test::makeProvider;
using rpcmesh::test::ManualClock;
using namespace std::chrono_literals;

namespace
{
struct TrackerFixture
{
  TrackerFixture(HealthTrackerConfig cfg = {}) : clock(std::make_shared<ManualClock>()),
                                                 tracker(cfg, clock, &bus), recorder(bus)
  {
    rpcmesh::test::initializeTestLogging();
  }

  std::shared_ptr<ManualClock> clock;
  EventBus bus;
  HealthTracker tracker;
  EventRecorder recorder;
};
} // namespace

TEST_CASE("HealthTracker counts outcomes and folds latency", "[tracker][metrics]")
{
  TrackerFixture f;
  f.tracker.track(makeProvider("p1"));

  f.tracker.recordOutcome("p1", true, 100.0);
  auto m = f.tracker.metrics("p1");
  REQUIRE(m);
  REQUIRE(m->totalRequests == 1);
  REQUIRE(m->successfulRequests == 1);
  REQUIRE(m->averageLatencyMs == Approx(100.0));

  f.tracker.recordOutcome("p1", true, 200.0);
  f.tracker.recordOutcome("p1", false);
  m = f.tracker.metrics("p1");
  REQUIRE(m->totalRequests == 3);
  REQUIRE(m->failedRequests == 1);
  REQUIRE(m->averageLatencyMs == Approx(110.0));
  REQUIRE(m->successRate() == Approx(2.0 / 3.0));

  SECTION("expected latency seeds the average")
  {
    auto p = makeProvider("p2");
    p.expectedLatencyMs = 50.0;
    f.tracker.track(p);
    REQUIRE(f.tracker.metrics("p2")->averageLatencyMs == Approx(50.0));
    f.tracker.recordOutcome("p2", true, 150.0);
    REQUIRE(f.tracker.metrics("p2")->averageLatencyMs == Approx(60.0));
  }

  SECTION("untracked providers are ignored")
  {
    f.tracker.recordOutcome("ghost", true, 1.0);
    REQUIRE_FALSE(f.tracker.metrics("ghost"));
    REQUIRE_FALSE(f.tracker.isTracked("ghost"));
  }

  SECTION("a fresh provider reports a perfect success rate")
  {
    f.tracker.track(makeProvider("p3"));
    REQUIRE(f.tracker.metrics("p3")->successRate() == Approx(1.0));
  }
}

TEST_CASE("HealthTracker health needs enough samples", "[tracker][health]")
{
  TrackerFixture f;
  f.tracker.track(makeProvider("p1"));

  for (int i = 0; i < 4; ++i)
  {
    f.tracker.recordOutcome("p1", false);
  }
  REQUIRE(f.tracker.isHealthy("p1"));
  REQUIRE(f.recorder.count(EventType::HealthChanged) == 0);

  f.tracker.recordOutcome("p1", false);
  REQUIRE_FALSE(f.tracker.isHealthy("p1"));
  REQUIRE(f.recorder.count(EventType::HealthChanged) == 1);

  // 20 successes after 5 failures is exactly 0.8, which is not above it
  for (int i = 0; i < 20; ++i)
  {
    f.tracker.recordOutcome("p1", true, 10.0);
  }
  REQUIRE_FALSE(f.tracker.isHealthy("p1"));

  f.tracker.recordOutcome("p1", true, 10.0);
  REQUIRE(f.tracker.isHealthy("p1"));
  REQUIRE(f.recorder.count(EventType::HealthChanged) == 2);
}

TEST_CASE("HealthTracker blacklist expires without a reset", "[tracker][blacklist]")
{
  TrackerFixture f;
  f.tracker.track(makeProvider("p1"));

  f.tracker.blacklist("p1", 1000ms, "test");
  REQUIRE(f.tracker.isBlacklisted("p1"));
  REQUIRE(f.recorder.count(EventType::ProviderBlacklisted) == 1);
  auto until = f.tracker.metrics("p1")->blacklistedUntil;
  REQUIRE(until);

  f.clock->advance(999ms);
  REQUIRE(f.tracker.isBlacklisted("p1"));

  f.clock->advance(2ms);
  REQUIRE_FALSE(f.tracker.isBlacklisted("p1"));
  REQUIRE(f.clock->now() > *until);
  REQUIRE_FALSE(f.tracker.metrics("p1")->blacklistedUntil);

  SECTION("clearBlacklist lifts it immediately")
  {
    f.tracker.blacklist("p1");
    REQUIRE(f.tracker.isBlacklisted("p1"));
    f.tracker.clearBlacklist("p1");
    REQUIRE_FALSE(f.tracker.isBlacklisted("p1"));
  }
}

TEST_CASE("HealthTracker failed check blacklists and marks unhealthy", "[tracker][check]")
{
  HealthTrackerConfig cfg;
  cfg.blacklistDuration = 60000ms;
  TrackerFixture f(cfg);
  f.tracker.track(makeProvider("p1"));

  f.tracker.recordHealthCheck("p1", false, std::nullopt, "timeout");
  REQUIRE_FALSE(f.tracker.isHealthy("p1"));
  REQUIRE(f.tracker.isBlacklisted("p1"));
  REQUIRE(f.tracker.metrics("p1")->lastHealthCheck);

  f.clock->advance(60001ms);
  REQUIRE_FALSE(f.tracker.isBlacklisted("p1"));

  f.tracker.recordHealthCheck("p1", true, 40.0);
  REQUIRE(f.tracker.isHealthy("p1"));
}

TEST_CASE("HealthTracker budget gate follows the UTC day", "[tracker][budget]")
{
  TrackerFixture f;
  auto p = makeProvider("p1");
  p.dailyBudget = 1.0;
  f.tracker.track(p);

  f.tracker.recordCost("p1", 0.6);
  REQUIRE_FALSE(f.tracker.isOverBudget("p1"));
  f.tracker.recordCost("p1", 0.6);
  REQUIRE(f.tracker.isOverBudget("p1"));
  REQUIRE(f.tracker.costToday("p1") == Approx(1.2));
  REQUIRE(f.recorder.count(EventType::BudgetExceeded) == 1);

  // Further charges on the same day do not signal again
  f.tracker.recordCost("p1", 0.1);
  REQUIRE(f.recorder.count(EventType::BudgetExceeded) == 1);

  // The clock starts at 12:00 UTC; 11h59m later it is still the same day
  f.clock->advance(std::chrono::hours(11) + std::chrono::minutes(59));
  REQUIRE(f.tracker.isOverBudget("p1"));

  f.clock->advance(std::chrono::minutes(1));
  REQUIRE_FALSE(f.tracker.isOverBudget("p1"));
  REQUIRE(f.tracker.costToday("p1") == Approx(0.0));

  SECTION("zero budget disables the gate")
  {
    f.tracker.setBudget("p1", 0.0);
    f.tracker.recordCost("p1", 500.0);
    REQUIRE_FALSE(f.tracker.isOverBudget("p1"));
  }
}

TEST_CASE("HealthTracker global budget applies without a provider budget", "[tracker][budget]")
{
  HealthTrackerConfig cfg;
  cfg.dailyBudget = 2.0;
  TrackerFixture f(cfg);
  f.tracker.track(makeProvider("p1"));
  f.tracker.recordCost("p1", 1.5);
  REQUIRE_FALSE(f.tracker.isOverBudget("p1"));
  f.tracker.recordCost("p1", 0.5);
  REQUIRE(f.tracker.isOverBudget("p1"));
}

TEST_CASE("HealthTracker cost summary and ledger purge", "[tracker][ledger]")
{
  TrackerFixture f;
  f.tracker.track(makeProvider("p1"));
  f.tracker.track(makeProvider("p2"));

  f.tracker.recordCost("p1", 0.25);
  f.tracker.recordCost("p2", 0.5);
  f.tracker.recordCost("p2", 0.0); // ignored

  auto summary = f.tracker.totalCosts();
  REQUIRE(summary.daily == Approx(0.75));
  REQUIRE(summary.window == Approx(0.75));
  REQUIRE(summary.breakdown.at("p1") == Approx(0.25));
  REQUIRE(f.tracker.ledgerSize() == 2);

  f.clock->advance(std::chrono::hours(36));
  summary = f.tracker.totalCosts();
  REQUIRE(summary.daily == Approx(0.0));
  REQUIRE(summary.window == Approx(0.0));

  REQUIRE(f.tracker.purgeLedger() == 2);
  REQUIRE(f.tracker.ledgerSize() == 0);
}

TEST_CASE("HealthTracker untrack forgets the provider", "[tracker]")
{
  TrackerFixture f;
  f.tracker.track(makeProvider("p1"));
  f.tracker.recordOutcome("p1", true, 5.0);
  f.tracker.untrack("p1");
  REQUIRE_FALSE(f.tracker.isTracked("p1"));
  REQUIRE(f.tracker.snapshot().empty());
  REQUIRE(f.tracker.trackedIds().empty());
}

TEST_CASE("HealthTracker loses no updates under concurrent recording", "[tracker][concurrency]")
{
  HealthTrackerConfig cfg;
  cfg.dailyBudget = 0.0;
  TrackerFixture f(cfg);
  f.tracker.track(makeProvider("p1"));
  f.tracker.track(makeProvider("p2"));

  constexpr int kThreads = 8;
  constexpr int kCalls = 500;
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t)
  {
    threads.emplace_back([&f, t]() {
      for (int i = 0; i < kCalls; ++i)
      {
        bool success = (i + t) % 4 != 0;
        f.tracker.recordOutcome("p1", success, success ? std::optional<double>(20.0)
                                                      : std::nullopt);
        f.tracker.recordCost("p1", 0.25);
        f.tracker.recordOutcome("p2", true, 10.0);
      }
    });
  }
  for (auto &thread : threads)
  {
    thread.join();
  }

  auto m = f.tracker.metrics("p1");
  REQUIRE(m->totalRequests == kThreads * kCalls);
  REQUIRE(m->successfulRequests + m->failedRequests == m->totalRequests);
  REQUIRE(m->failedRequests == kThreads * kCalls / 4);
  REQUIRE(m->averageLatencyMs == Approx(20.0));
  REQUIRE(f.tracker.costToday("p1") == Approx(kThreads * kCalls * 0.25));
  REQUIRE(f.tracker.totalCosts().daily == Approx(kThreads * kCalls * 0.25));
  REQUIRE(f.tracker.metrics("p2")->totalRequests == kThreads * kCalls);
  REQUIRE(f.tracker.costToday("p2") == Approx(0.0));
}
