// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// Tests for the ResponseCache

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

using namespace rpcmesh::rpc;
using rpcmesh::core::Json;
using rpcmesh::test::ManualClock;
using namespace std::chrono_literals;

TEST_CASE("ResponseCache serves fresh results only", "[cache]")
{
  auto clock = std::make_shared<ManualClock>();
  ResponseCache cache(ResponseCacheConfig{}, clock);

  REQUIRE(cache.isCacheable("eth_blockNumber"));
  REQUIRE_FALSE(cache.isCacheable("eth_sendRawTransaction"));
  REQUIRE(cache.ttlFor("eth_blockNumber") == 1000ms);

  cache.put("ethereum", "eth_blockNumber", Json::array(), "0x10");
  auto hit = cache.get("ethereum", "eth_blockNumber", Json::array());
  REQUIRE(hit);
  REQUIRE(*hit == "0x10");
  REQUIRE(cache.hits() == 1);

  SECTION("keys include chain and params")
  {
    REQUIRE_FALSE(cache.get("bsc", "eth_blockNumber", Json::array()));
    REQUIRE_FALSE(cache.get("ethereum", "eth_blockNumber", Json::array({"latest"})));
    REQUIRE(cache.misses() == 2);
  }

  SECTION("entries expire with the clock")
  {
    clock->advance(999ms);
    REQUIRE(cache.get("ethereum", "eth_blockNumber", Json::array()));
    clock->advance(1ms);
    REQUIRE_FALSE(cache.get("ethereum", "eth_blockNumber", Json::array()));
    REQUIRE(cache.size() == 0);
  }

  SECTION("non-cacheable methods are never stored")
  {
    cache.put("ethereum", "eth_sendRawTransaction", Json::array({"0x1"}), "0xhash");
    REQUIRE(cache.size() == 1);
    REQUIRE_FALSE(cache.get("ethereum", "eth_sendRawTransaction", Json::array({"0x1"})));
  }

  SECTION("purgeExpired and clear")
  {
    cache.put("ethereum", "eth_call", Json::array(), "0x");
    clock->advance(2000ms);
    REQUIRE(cache.purgeExpired() == 1);
    REQUIRE(cache.size() == 1);
    cache.clear();
    REQUIRE(cache.size() == 0);
  }
}

TEST_CASE("ResponseCache evicts at capacity", "[cache][capacity]")
{
  auto clock = std::make_shared<ManualClock>();
  ResponseCacheConfig cfg;
  cfg.maxEntries = 2;
  ResponseCache cache(cfg, clock);

  cache.put("ethereum", "eth_call", Json::array({1}), 1);
  clock->advance(10ms);
  cache.put("ethereum", "eth_call", Json::array({2}), 2);
  clock->advance(10ms);
  cache.put("ethereum", "eth_call", Json::array({3}), 3);

  REQUIRE(cache.size() == 2);
  REQUIRE_FALSE(cache.get("ethereum", "eth_call", Json::array({1})));
  REQUIRE(cache.get("ethereum", "eth_call", Json::array({3})));

  SECTION("expired entries go before live ones")
  {
    cache.put("ethereum", "eth_blockNumber", Json::array(), "0x1");
    REQUIRE(cache.size() == 2);
    clock->advance(1000ms);
    cache.put("ethereum", "eth_call", Json::array({4}), 4);
    REQUIRE(cache.get("ethereum", "eth_call", Json::array({3})));
    REQUIRE(cache.get("ethereum", "eth_call", Json::array({4})));
  }
}

TEST_CASE("ResponseCache configuration", "[cache][config]")
{
  auto clock = std::make_shared<ManualClock>();

  SECTION("disabled cache stores nothing")
  {
    ResponseCacheConfig cfg;
    cfg.enabled = false;
    ResponseCache cache(cfg, clock);
    cache.put("ethereum", "eth_blockNumber", Json::array(), "0x1");
    REQUIRE(cache.size() == 0);
    REQUIRE_FALSE(cache.isCacheable("eth_blockNumber"));
  }

  SECTION("extra methods use the default ttl")
  {
    ResponseCacheConfig cfg;
    cfg.extraMethods.insert("net_version");
    cfg.defaultTtl = 500ms;
    ResponseCache cache(cfg, clock);
    REQUIRE(cache.isCacheable("net_version"));
    REQUIRE(cache.ttlFor("net_version") == 500ms);
  }

  REQUIRE(ResponseCache::makeKey("bsc", "eth_call", Json::array({1, "a"})) ==
          R"(bsc:eth_call:[1,"a"])");
}
