// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// Tests for RequestExecutor retry, backoff and failover

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

using namespace rpcmesh::rpc;
using rpcmesh::test::EventRecorder;
using rpcmesh::test::FixedRandom;
using rpcmesh::test::makeProvider;
using rpcmesh::test::ManualClock;
using rpcmesh::test::ScriptedTransport;
using namespace std::chrono_literals;

namespace
{
struct ExecutorFixture
{
  explicit ExecutorFixture(ExecutorConfig cfg = {})
      : clock(std::make_shared<ManualClock>()), random(std::make_shared<FixedRandom>(0.0)),
        transport(std::make_shared<ScriptedTransport>()), tracker(HealthTrackerConfig{}, clock, &bus),
        selector(registry, tracker, random),
        executor(cfg, selector, tracker, transport, clock, &bus), recorder(bus)
  {
    rpcmesh::test::initializeTestLogging();
  }

  void add(const Provider &p)
  {
    registry.registerProvider(p);
    tracker.track(p);
  }

  std::shared_ptr<ManualClock> clock;
  std::shared_ptr<FixedRandom> random;
  std::shared_ptr<ScriptedTransport> transport;
  EventBus bus;
  ProviderRegistry registry;
  HealthTracker tracker;
  ProviderSelector selector;
  RequestExecutor executor;
  EventRecorder recorder;
};
} // namespace

TEST_CASE("RequestExecutor succeeds on the first provider", "[executor]")
{
  ExecutorFixture f;
  auto p = makeProvider("p1", "ethereum", Tier::Premium, 0, 1000.0);
  f.add(p);
  f.transport->succeed("p1", "0x10");
  f.transport->setLatency(f.clock, 25ms);

  auto request = f.executor.makeRequest("ethereum", "eth_blockNumber");
  REQUIRE(request.maxRetries == 3);
  REQUIRE_FALSE(request.id.empty());

  auto response = f.executor.execute(request);
  REQUIRE(response.result == "0x10");
  REQUIRE(response.providerId == "p1");
  REQUIRE(response.attempts == 1);
  REQUIRE(response.latency == 25ms);
  REQUIRE(response.requestId == request.id);
  REQUIRE_FALSE(response.fromCache);

  auto m = f.tracker.metrics("p1");
  REQUIRE(m->successfulRequests == 1);
  REQUIRE(m->averageLatencyMs == Approx(25.0));
  REQUIRE(m->costToday == Approx(1.0));
  REQUIRE(f.transport->calls()[0].method == "eth_blockNumber");
}

TEST_CASE("RequestExecutor request ids are unique", "[executor]")
{
  ExecutorFixture f;
  auto a = f.executor.makeRequest("ethereum", "eth_chainId");
  auto b = f.executor.makeRequest("ethereum", "eth_chainId");
  REQUIRE(a.id != b.id);
}

TEST_CASE("RequestExecutor fails over to the next provider", "[executor][failover]")
{
  ExecutorFixture f;
  f.add(makeProvider("P1", "ethereum", Tier::Premium));
  f.add(makeProvider("P2", "ethereum", Tier::Standard));
  f.transport->failTransport("P1");
  f.transport->succeed("P2", "0xabc");

  auto response = f.executor.execute(f.executor.makeRequest("ethereum", "eth_getBalance"));
  REQUIRE(response.providerId == "P2");
  REQUIRE(response.attempts == 2);
  REQUIRE(response.result == "0xabc");

  REQUIRE(f.tracker.metrics("P1")->failedRequests == 1);
  REQUIRE(f.tracker.metrics("P2")->successfulRequests == 1);
  REQUIRE(f.recorder.count(EventType::RequestFailed) == 1);

  auto stats = f.executor.stats();
  REQUIRE(stats.failovers == 1);
  REQUIRE(stats.retries == 1);
  REQUIRE(stats.attempts == 2);
  REQUIRE(stats.succeeded == 1);

  // One backoff of retryDelay * 2 before the second attempt
  REQUIRE(f.clock->sleeps() == std::vector<std::chrono::milliseconds>{2000ms});
}

TEST_CASE("RequestExecutor stops after maxRetries + 1 attempts", "[executor][retry]")
{
  ExecutorConfig cfg;
  cfg.maxRetries = 3;
  cfg.retryDelay = 100ms;
  ExecutorFixture f(cfg);
  f.add(makeProvider("only"));
  f.transport->setFailing("only");

  try
  {
    f.executor.execute(f.executor.makeRequest("ethereum", "eth_call"));
    FAIL("expected RetriesExhausted");
  }
  catch (const RetriesExhausted &e)
  {
    REQUIRE(e.attempts() == 4);
    REQUIRE(e.attemptedProviders() ==
            std::vector<std::string>{"only", "only", "only", "only"});
    REQUIRE(e.chain() == "ethereum");
    REQUIRE(e.method() == "eth_call");
    REQUIRE(e.lastError());
    REQUIRE_THROWS_AS(std::rethrow_exception(e.lastError()), TransportError);
  }
  REQUIRE(f.transport->callCount("only") == 4);
  REQUIRE(f.clock->sleeps() == std::vector<std::chrono::milliseconds>{200ms, 400ms, 800ms});
  REQUIRE(f.executor.stats().exhausted == 1);

  SECTION("zero retries means exactly one attempt")
  {
    ExecutorConfig none;
    none.maxRetries = 0;
    ExecutorFixture g(none);
    g.add(makeProvider("only"));
    g.transport->setFailing("only");
    REQUIRE_THROWS_AS(g.executor.execute(g.executor.makeRequest("ethereum", "eth_call")),
                      RetriesExhausted);
    REQUIRE(g.transport->callCount() == 1);
    REQUIRE(g.clock->sleeps().empty());
  }
}

TEST_CASE("RequestExecutor backoff saturates for long retry runs", "[executor][retry]")
{
  ExecutorConfig cfg;
  cfg.maxRetries = 70;
  cfg.retryDelay = 100ms;
  cfg.maxRetryDelay = 5000ms;
  ExecutorFixture f(cfg);
  f.add(makeProvider("only"));
  f.transport->setFailing("only");

  REQUIRE_THROWS_AS(f.executor.execute(f.executor.makeRequest("ethereum", "eth_call")),
                    RetriesExhausted);
  REQUIRE(f.transport->callCount("only") == 71);

  auto sleeps = f.clock->sleeps();
  REQUIRE(sleeps.size() == 70);
  REQUIRE(std::vector<std::chrono::milliseconds>(sleeps.begin(), sleeps.begin() + 6) ==
          std::vector<std::chrono::milliseconds>{200ms, 400ms, 800ms, 1600ms, 3200ms, 5000ms});
  for (auto d : sleeps)
  {
    REQUIRE(d > 0ms);
    REQUIRE(d <= 5000ms);
  }
  REQUIRE(sleeps.back() == 5000ms);

  SECTION("a request may ask for more retries than the configuration")
  {
    auto request = f.executor.makeRequest("ethereum", "eth_call");
    request.maxRetries = 200;
    REQUIRE_THROWS_AS(f.executor.execute(request), RetriesExhausted);
    REQUIRE(f.clock->sleeps().size() == 270);
    REQUIRE(f.clock->sleeps().back() == 5000ms);
  }
}

TEST_CASE("RequestExecutor returns non-transient provider errors at once", "[executor][errors]")
{
  ExecutorFixture f;
  f.add(makeProvider("P1", "ethereum", Tier::Premium));
  f.add(makeProvider("P2"));
  f.transport->failProvider("P1", -32602, "invalid params");

  try
  {
    f.executor.execute(f.executor.makeRequest("ethereum", "eth_call"));
    FAIL("expected ProviderError");
  }
  catch (const ProviderError &e)
  {
    REQUIRE(e.code() == -32602);
    REQUIRE(e.providerId() == "P1");
  }
  REQUIRE(f.transport->callCount("P2") == 0);
  REQUIRE(f.executor.stats().nonTransientErrors == 1);
  REQUIRE(f.clock->sleeps().empty());
}

TEST_CASE("RequestExecutor retries transient provider errors", "[executor][errors]")
{
  ExecutorFixture f;
  f.add(makeProvider("P1", "ethereum", Tier::Premium));
  f.add(makeProvider("P2"));

  SECTION("by code")
  {
    f.transport->failProvider("P1", -32603, "internal error");
  }
  SECTION("by message pattern")
  {
    f.transport->failProvider("P1", -32099, "rate limit exceeded");
  }

  auto response = f.executor.execute(f.executor.makeRequest("ethereum", "eth_call"));
  REQUIRE(response.providerId == "P2");
  REQUIRE(response.attempts == 2);
}

TEST_CASE("RequestExecutor isTransient classification", "[executor][errors]")
{
  ExecutorFixture f;
  REQUIRE(f.executor.isTransient(ProviderError("p", 429, "too many")));
  REQUIRE(f.executor.isTransient(ProviderError("p", -32005, "limit")));
  REQUIRE(f.executor.isTransient(ProviderError("p", 1, "upstream timeout")));
  REQUIRE_FALSE(f.executor.isTransient(ProviderError("p", -32601, "method not found")));
}

TEST_CASE("RequestExecutor without providers", "[executor][errors]")
{
  ExecutorFixture f;
  REQUIRE_THROWS_AS(f.executor.execute(f.executor.makeRequest("solana", "getSlot")),
                    NoProviderAvailable);
  REQUIRE(f.transport->callCount() == 0);
}

TEST_CASE("RequestExecutor honours a pinned provider", "[executor][pinned]")
{
  ExecutorFixture f;
  f.add(makeProvider("P1", "ethereum", Tier::Premium));
  f.add(makeProvider("P2"));

  auto request = f.executor.makeRequest("ethereum", "eth_call");
  request.pinnedProvider = "P2";
  REQUIRE(f.executor.execute(request).providerId == "P2");

  SECTION("an ineligible pin falls back to selection")
  {
    f.registry.setActive("P2", false);
    REQUIRE(f.executor.execute(request).providerId == "P1");
  }
}

TEST_CASE("RequestExecutor uses the provider timeout", "[executor][timeout]")
{
  ExecutorFixture f;
  auto p = makeProvider("P1");
  p.timeout = 1500ms;
  f.add(p);
  f.executor.execute(f.executor.makeRequest("ethereum", "eth_call"));
  REQUIRE(f.transport->calls()[0].timeout == 1500ms);

  auto request = f.executor.makeRequest("ethereum", "eth_call");
  request.timeout = 700ms;
  f.executor.execute(request);
  REQUIRE(f.transport->calls()[1].timeout == 700ms);
}
