// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// Tests for the Orchestrator facade

#define CATCH_CONFIG_MAIN
#include "rpcmesh_test_net_utils.hpp"
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

using rpcmesh::Orchestrator;
using rpcmesh::OrchestratorConfig;
using rpcmesh::common::LifecycleState;
using rpcmesh::core::Json;
using rpcmesh::test::EventRecorder;
using rpcmesh::test::FixedRandom;
using rpcmesh::test::ManualClock;
using rpcmesh::test::ScriptedTransport;
using rpcmesh::test::makeProvider;
using namespace rpcmesh::rpc;
using namespace std::chrono_literals;

namespace
{
OrchestratorConfig baseConfig()
{
  OrchestratorConfig cfg;
  cfg.providers.push_back(makeProvider("p1", "ethereum", Tier::Premium));
  cfg.providers.push_back(makeProvider("p2", "ethereum", Tier::Standard));
  cfg.providers.push_back(makeProvider("p3", "bsc", Tier::Standard));
  cfg.workers.threads = 2;
  cfg.dispatch.tickInterval = 60000ms;
  return cfg;
}

struct MeshFixture
{
  explicit MeshFixture(OrchestratorConfig cfg = baseConfig())
      : clock(std::make_shared<ManualClock>()), transport(std::make_shared<ScriptedTransport>()),
        random(std::make_shared<FixedRandom>(0.0)),
        mesh(std::move(cfg), Orchestrator::Dependencies{transport, clock, random})
  {
    rpcmesh::test::initializeTestLogging();
  }

  std::shared_ptr<ManualClock> clock;
  std::shared_ptr<ScriptedTransport> transport;
  std::shared_ptr<FixedRandom> random;
  Orchestrator mesh;
};
} // namespace

TEST_CASE("Orchestrator registers and removes providers", "[orchestrator][registry]")
{
  MeshFixture f;
  EventRecorder events(f.mesh.events());
  REQUIRE(f.mesh.providers().size() == 3);
  REQUIRE(f.mesh.connectionPool().hasProvider("p1"));

  f.mesh.registerProvider(makeProvider("p4", "ethereum"));
  REQUIRE(events.count(EventType::ProviderAdded) == 1);
  REQUIRE(f.mesh.connectionPool().hasProvider("p4"));
  REQUIRE(f.mesh.tracker().isTracked("p4"));
  REQUIRE_THROWS_AS(f.mesh.registerProvider(makeProvider("p4", "ethereum")), ConfigError);

  REQUIRE(f.mesh.removeProvider("p4"));
  REQUIRE_FALSE(f.mesh.removeProvider("p4"));
  REQUIRE(events.count(EventType::ProviderRemoved) == 1);
  REQUIRE_FALSE(f.mesh.connectionPool().hasProvider("p4"));
  REQUIRE_FALSE(f.mesh.tracker().isTracked("p4"));

  REQUIRE(f.mesh.setProviderActive("p2", false));
  REQUIRE_FALSE(f.mesh.setProviderActive("missing", false));
  auto changes = events.events();
  REQUIRE(changes.back().type == EventType::ProviderStatusChanged);
  REQUIRE(changes.back().providerId == "p2");
  REQUIRE(changes.back().value == Approx(0.0));
  REQUIRE_FALSE(f.mesh.registry().find("p2")->isActive);
}

TEST_CASE("Orchestrator call routes, caches and fails over", "[orchestrator][call]")
{
  MeshFixture f;

  SECTION("Best provider answers")
  {
    auto response = f.mesh.call("ethereum", "eth_getLogs");
    REQUIRE(response.providerId == "p1");
    REQUIRE(response.attempts == 1);
    REQUIRE(response.result == Json("0x1"));
    REQUIRE_FALSE(response.fromCache);
  }

  SECTION("Cacheable methods are served from the cache while fresh")
  {
    auto first = f.mesh.call("ethereum", "eth_blockNumber");
    auto second = f.mesh.call("ethereum", "eth_blockNumber");
    REQUIRE_FALSE(first.fromCache);
    REQUIRE(second.fromCache);
    REQUIRE(second.requestId != first.requestId);
    REQUIRE(f.transport->callCount() == 1);

    f.clock->advance(1001ms);
    auto third = f.mesh.call("ethereum", "eth_blockNumber");
    REQUIRE_FALSE(third.fromCache);
    REQUIRE(f.transport->callCount() == 2);
    REQUIRE(f.mesh.getMetrics().cacheHits == 1);
  }

  SECTION("Transport failure fails over to the next provider")
  {
    f.transport->failTransport("p1");
    auto response = f.mesh.call("ethereum", "eth_getLogs");
    REQUIRE(response.providerId == "p2");
    REQUIRE(response.attempts == 2);
    REQUIRE(f.clock->sleeps() == std::vector<std::chrono::milliseconds>{2000ms});
  }

  SECTION("Unknown chain has no provider")
  {
    REQUIRE_THROWS_AS(f.mesh.call("solana", "getSlot"), NoProviderAvailable);
  }

  SECTION("Non-transient provider errors are not retried")
  {
    f.transport->failProvider("p1", -32602, "invalid params");
    REQUIRE_THROWS_AS(f.mesh.call("ethereum", "eth_getLogs"), ProviderError);
    REQUIRE(f.transport->callCount() == 1);
  }
}

TEST_CASE("Orchestrator batchCall keeps item order", "[orchestrator][batch]")
{
  MeshFixture f;

  SECTION("All items succeed")
  {
    std::vector<Orchestrator::BatchItem> items(3);
    for (std::size_t i = 0; i < items.size(); ++i)
    {
      items[i].method = "eth_getLogs";
      items[i].params = Json::array({static_cast<int>(i)});
    }
    auto responses = f.mesh.batchCall("ethereum", items);
    REQUIRE(responses.size() == 3);
    std::set<std::string> ids;
    for (const auto &r : responses)
    {
      REQUIRE(r.providerId == "p1");
      ids.insert(r.requestId);
    }
    REQUIRE(ids.size() == 3);
    REQUIRE(f.transport->callCount() == 3);
  }

  SECTION("A failed item fails the batch")
  {
    f.transport->setFailing("p1");
    f.transport->setFailing("p2");
    std::vector<Orchestrator::BatchItem> items(2);
    items[0].method = "eth_getLogs";
    items[1].method = "eth_getLogs";
    REQUIRE_THROWS_AS(f.mesh.batchCall("ethereum", items), RpcError);
  }
}

TEST_CASE("Orchestrator queueCall goes through the dispatch queue", "[orchestrator][queue]")
{
  MeshFixture f;

  SECTION("A dispatch tick resolves queued calls")
  {
    auto queued = f.mesh.queueCall("ethereum", "eth_getLogs");
    REQUIRE(f.mesh.getMetrics().queuedRequests == 1);
    REQUIRE(f.mesh.runDispatchTick() == 1);
    auto response = queued.result.get();
    REQUIRE(response.requestId == queued.requestId);
    REQUIRE(response.providerId == "p1");
  }

  SECTION("A fresh cached result resolves immediately")
  {
    f.mesh.call("ethereum", "eth_blockNumber");
    auto queued = f.mesh.queueCall("ethereum", "eth_blockNumber");
    REQUIRE(queued.result.wait_for(0ms) == std::future_status::ready);
    REQUIRE(queued.result.get().fromCache);
    REQUIRE(f.mesh.getMetrics().queuedRequests == 0);
  }

  SECTION("Cancelled calls fail with RequestCancelled")
  {
    auto queued = f.mesh.queueCall("bsc", "eth_getLogs");
    REQUIRE(f.mesh.cancelQueued(queued.requestId));
    REQUIRE_FALSE(f.mesh.cancelQueued(queued.requestId));
    REQUIRE_THROWS_AS(queued.result.get(), RequestCancelled);
    REQUIRE(f.transport->callCount() == 0);
  }
}

TEST_CASE("Orchestrator priority optimizers", "[orchestrator][optimize]")
{
  SECTION("Cost efficiency")
  {
    auto cfg = baseConfig();
    cfg.providers[0].costPerThousand = 1000.0;
    MeshFixture f(std::move(cfg));
    f.mesh.call("ethereum", "eth_getLogs");
    f.mesh.call("ethereum", "eth_getLogs");

    f.mesh.optimizeForCost();
    REQUIRE(f.mesh.registry().find("p1")->priority == 66);
    REQUIRE(f.mesh.registry().find("p2")->priority == 0);
  }

  SECTION("Speed")
  {
    MeshFixture f;
    f.transport->setLatency(f.clock, 9ms);
    f.mesh.call("ethereum", "eth_getLogs");

    f.mesh.optimizeForSpeed();
    REQUIRE(f.mesh.registry().find("p1")->priority == 100);
    REQUIRE(f.mesh.registry().find("p2")->priority == 1000);
  }

  SECTION("Latency ranking with ties broken by id")
  {
    MeshFixture f;
    EventRecorder events(f.mesh.events());
    auto boosts = f.mesh.optimizeForLatency("ethereum");
    REQUIRE(boosts == std::map<std::string, int>{{"p1", 20}, {"p2", 18}});
    REQUIRE(f.mesh.registry().find("p1")->priority == 20);
    REQUIRE(events.count(EventType::Optimized) == 1);
  }

  SECTION("Failed checks rank last")
  {
    MeshFixture f;
    f.transport->failTransport("p1");
    auto boosts = f.mesh.optimizeForLatency("ethereum");
    REQUIRE(boosts.at("p2") == 20);
    REQUIRE(boosts.at("p1") == 18);
  }

  SECTION("Inactive providers are skipped")
  {
    MeshFixture f;
    f.mesh.setProviderActive("p2", false);
    auto boosts = f.mesh.optimizeForLatency("ethereum");
    REQUIRE(boosts == std::map<std::string, int>{{"p1", 20}});
    REQUIRE(f.mesh.registry().find("p2")->priority == 0);
  }
}

TEST_CASE("Orchestrator metrics and provider status", "[orchestrator][metrics]")
{
  MeshFixture f;

  SECTION("Empty state")
  {
    auto m = f.mesh.getMetrics();
    REQUIRE(m.totalRequests == 0);
    REQUIRE(m.successRate == Approx(1.0));
    REQUIRE(m.providers == 3);
    REQUIRE(m.healthyProviders == 3);
    REQUIRE(m.pool.total == 3);
  }

  SECTION("Aggregates across providers")
  {
    f.transport->setLatency(f.clock, 10ms);
    f.mesh.call("ethereum", "eth_getLogs");
    f.transport->failTransport("p1");
    f.mesh.call("ethereum", "eth_getLogs");

    auto m = f.mesh.getMetrics();
    REQUIRE(m.totalRequests == 3);
    REQUIRE(m.successfulRequests == 2);
    REQUIRE(m.failedRequests == 1);
    REQUIRE(m.successRate == Approx(2.0 / 3.0));
    REQUIRE(m.averageLatencyMs == Approx(10.0));
    REQUIRE(m.executor.requests == 2);
    REQUIRE(m.executor.attempts == 3);
    REQUIRE(m.executor.failovers == 1);

    auto json = rpcmesh::metricsToJson(m);
    REQUIRE(json["totalRequests"] == 3);
    REQUIRE(json["executor"]["failovers"] == 1);
    REQUIRE(json["pool"]["providers"].contains("p3"));
  }

  SECTION("Provider status by chain")
  {
    auto status = f.mesh.getProviderStatus("ethereum");
    REQUIRE(status.size() == 2);
    REQUIRE(status[0].provider.id == "p1");
    REQUIRE(status[0].score == Approx(3100.0));
    REQUIRE(status[0].eligible);
    REQUIRE(f.mesh.getProviderStatus().size() == 3);

    auto json = rpcmesh::providerStatusToJson(status);
    REQUIRE(json.size() == 2);
    REQUIRE(json[0]["tier"] == "premium");
  }

  SECTION("Health checks blacklist failing providers")
  {
    EventRecorder events(f.mesh.events());
    f.transport->setFailing("p2");
    auto report = f.mesh.runHealthChecks();
    REQUIRE(report.checked == 3);
    REQUIRE(report.healthy == 2);
    REQUIRE(report.failed == 1);
    REQUIRE(events.count(EventType::ProviderBlacklisted) == 1);

    auto status = f.mesh.getProviderStatus("ethereum");
    REQUIRE(status[1].provider.id == "p2");
    REQUIRE(status[1].blacklisted);
    REQUIRE_FALSE(status[1].eligible);
    REQUIRE(f.mesh.getMetrics().blacklistedProviders == 1);
    REQUIRE(f.mesh.getConnectionStatus() ==
            std::map<std::string, bool>{{"bsc", true}, {"ethereum", true}});

    f.transport->setFailing("p1");
    f.mesh.runHealthChecks();
    REQUIRE_FALSE(f.mesh.getConnectionStatus().at("ethereum"));
    REQUIRE_THROWS_AS(f.mesh.call("ethereum", "eth_getLogs"), NoProviderAvailable);
  }
}

TEST_CASE("Orchestrator routes around exhausted budgets", "[orchestrator][budget]")
{
  auto cfg = baseConfig();
  cfg.providers[0].costPerThousand = 1000.0;
  cfg.providers[0].dailyBudget = 2.0;
  MeshFixture f(std::move(cfg));
  EventRecorder events(f.mesh.events());

  REQUIRE(f.mesh.call("ethereum", "eth_sendRawTransaction").providerId == "p1");
  REQUIRE(f.mesh.call("ethereum", "eth_sendRawTransaction").providerId == "p1");
  REQUIRE(events.count(EventType::BudgetExceeded) == 1);

  REQUIRE(f.mesh.call("ethereum", "eth_sendRawTransaction").providerId == "p2");
  auto costs = f.mesh.getTotalCosts();
  REQUIRE(costs.daily == Approx(2.0));
  REQUIRE(costs.breakdown.at("p1") == Approx(2.0));

  auto status = f.mesh.getProviderStatus("ethereum");
  REQUIRE(status[0].overBudget);
  REQUIRE(f.mesh.getMetrics().costToday == Approx(2.0));
}

TEST_CASE("Orchestrator lifecycle", "[orchestrator][lifecycle]")
{
  SECTION("Drain dispatches queued calls before refusing new ones")
  {
    MeshFixture f;
    REQUIRE(f.mesh.getState() == LifecycleState::Created);
    REQUIRE(f.mesh.start().success);
    REQUIRE(f.mesh.start().success);
    REQUIRE(f.mesh.getState() == LifecycleState::Running);

    auto queued = f.mesh.queueCall("ethereum", "eth_getLogs");
    auto drained = f.mesh.drain(2000);
    REQUIRE(drained.success);
    REQUIRE(queued.result.get().providerId == "p1");
    REQUIRE(f.mesh.getState() == LifecycleState::Draining);
    REQUIRE_THROWS_AS(f.mesh.call("ethereum", "eth_getLogs"), RpcError);
    REQUIRE_THROWS_AS(f.mesh.queueCall("ethereum", "eth_getLogs"), RpcError);

    REQUIRE_FALSE(f.mesh.reset().success);
    REQUIRE(f.mesh.stop().success);
    REQUIRE(f.mesh.getState() == LifecycleState::Stopped);
    REQUIRE(f.mesh.reset().success);
    REQUIRE(f.mesh.start().success);
    REQUIRE(f.mesh.call("ethereum", "eth_getLogs").providerId == "p1");
  }

  SECTION("Drain requires a running orchestrator")
  {
    MeshFixture f;
    REQUIRE_FALSE(f.mesh.drain(100).success);
  }

  SECTION("The dispatch timer resolves queued calls")
  {
    auto cfg = baseConfig();
    cfg.dispatch.tickInterval = 10ms;
    MeshFixture f(std::move(cfg));
    REQUIRE(f.mesh.start().success);

    auto queued = f.mesh.queueCall("bsc", "eth_getLogs");
    REQUIRE(queued.result.wait_for(2s) == std::future_status::ready);
    REQUIRE(queued.result.get().providerId == "p3");
  }
}

TEST_CASE("Orchestrator streams subscriptions from WebSocket providers", "[orchestrator][streams]")
{
  testnet::LoopbackWebSocketServer server;
  auto cfg = baseConfig();
  cfg.providers[1].wsUrl = server.url("/eth");
  cfg.streams.reconnectDelay = 50ms;
  cfg.streams.pollInterval = 20ms;
  MeshFixture f(std::move(cfg));
  EventRecorder events(f.mesh.events());

  std::mutex mutex;
  std::vector<StreamMessage> messages;
  f.mesh.setStreamHandler([&](const StreamMessage &message) {
    std::lock_guard<std::mutex> lock(mutex);
    messages.push_back(message);
  });
  auto receivedCount = [&]() {
    std::lock_guard<std::mutex> lock(mutex);
    return messages.size();
  };

  REQUIRE_FALSE(f.mesh.openStream("bsc"));
  REQUIRE(f.mesh.openStream("ethereum"));
  REQUIRE(f.mesh.streams().status("ethereum")->providerId == "p2");
  REQUIRE(events.count(EventType::StreamConnected) == 1);

  auto id = f.mesh.subscribe("ethereum", "eth_subscribe", Json::array({"newHeads"}));
  REQUIRE(testnet::eventually([&]() { return receivedCount() == 1; }));
  {
    std::lock_guard<std::mutex> lock(mutex);
    REQUIRE(messages[0].providerId == "p2");
    REQUIRE(messages[0].message["id"] == id);
  }

  REQUIRE(f.mesh.stop().success);
  REQUIRE_FALSE(f.mesh.streams().status("ethereum"));
  REQUIRE(events.count(EventType::StreamDisconnected) == 1);
  REQUIRE_THROWS_AS(f.mesh.openStream("ethereum"), RpcError);
  REQUIRE(testnet::eventually([&]() { return server.closeCodes().size() == 1; }));
}
