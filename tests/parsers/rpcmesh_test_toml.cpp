// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// Tests for the minimal TOML parser

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

namespace toml = rpcmesh::parsers::toml;

TEST_CASE("TOML scalar values", "[toml][scalars]")
{
  auto tbl = toml::parse(R"(
# leading comment
name = "alchemy-eth"   # trailing comment
literal = 'C:\path\no\escapes'
escaped = "line\none \"quoted\""
count = 1_000
negative = -42
ratio = 0.8
exp = 1e3
enabled = true
disabled = false
)");

  REQUIRE(tbl.at_path("name").as<std::string>() == std::string("alchemy-eth"));
  REQUIRE(tbl.at_path("literal").as<std::string>() == std::string("C:\\path\\no\\escapes"));
  REQUIRE(tbl.at_path("escaped").as<std::string>() == std::string("line\none \"quoted\""));
  REQUIRE(tbl.at_path("count").as<std::int64_t>() == 1000);
  REQUIRE(tbl.at_path("negative").as<std::int64_t>() == -42);
  REQUIRE(*tbl.at_path("ratio").as<double>() == Approx(0.8));
  REQUIRE(*tbl.at_path("exp").as<double>() == Approx(1000.0));
  REQUIRE(tbl.at_path("enabled").as<bool>() == true);
  REQUIRE(tbl.at_path("disabled").as<bool>() == false);

  SECTION("Integers widen to double but nothing else converts")
  {
    REQUIRE(*tbl.at_path("count").as<double>() == Approx(1000.0));
    REQUIRE_FALSE(tbl.at_path("ratio").as<std::int64_t>().has_value());
    REQUIRE_FALSE(tbl.at_path("name").as<bool>().has_value());
    REQUIRE(tbl.at_path("count").is_integer());
    REQUIRE(tbl.at_path("ratio").is_floating_point());
  }

  SECTION("Missing keys give an empty node")
  {
    REQUIRE_FALSE(tbl.at_path("missing"));
    REQUIRE_FALSE(tbl.at_path("name.deeper"));
    REQUIRE_FALSE(tbl.contains("missing"));
  }
}

TEST_CASE("TOML tables and dotted keys", "[toml][tables]")
{
  auto tbl = toml::parse(R"(
[rpc]
max_retries = 3
backoff.base_ms = 1000

[rpc.check_methods]
solana = "getSlot"

[cache.ttl_ms]
eth_call = 30000
)");

  REQUIRE(tbl.at_path("rpc.max_retries").as<std::int64_t>() == 3);
  REQUIRE(tbl.at_path("rpc.backoff.base_ms").as<std::int64_t>() == 1000);
  REQUIRE(tbl.at_path("rpc.check_methods.solana").as<std::string>() == std::string("getSlot"));
  REQUIRE(tbl.at_path("cache.ttl_ms.eth_call").as<std::int64_t>() == 30000);

  const toml::table *rpc = tbl.at_path("rpc").as_table();
  REQUIRE(rpc != nullptr);
  REQUIRE(rpc->size() == 3);
  REQUIRE(rpc->contains("check_methods"));
}

TEST_CASE("TOML arrays and inline tables", "[toml][arrays]")
{
  auto tbl = toml::parse(R"(
codes = [-32005, -32603, 429]
patterns = [
  "ECONNRESET",   # reset by peer
  "timeout",
]
empty = []
limits = { rate = 25, burst = 50 }
)");

  const toml::array *codes = tbl.at_path("codes").as_array();
  REQUIRE(codes != nullptr);
  REQUIRE(codes->size() == 3);
  REQUIRE((*codes)[0].as<std::int64_t>() == -32005);
  REQUIRE((*codes)[2].as<std::int64_t>() == 429);

  const toml::array *patterns = tbl.at_path("patterns").as_array();
  REQUIRE(patterns->size() == 2);
  REQUIRE((*patterns)[1].as<std::string>() == std::string("timeout"));

  REQUIRE(tbl.at_path("empty").as_array()->empty());
  REQUIRE(tbl.at_path("limits.rate").as<std::int64_t>() == 25);
  REQUIRE(tbl.at_path("limits.burst").as<std::int64_t>() == 50);
}

TEST_CASE("TOML arrays of tables", "[toml][array-of-tables]")
{
  auto tbl = toml::parse(R"(
[[providers]]
id = "alchemy-eth"
chain = "ethereum"

[[providers]]
id = "ankr-bsc"
chain = "bsc"

[providers.headers]
Authorization = "Bearer token"
)");

  const toml::array *providers = tbl.at_path("providers").as_array();
  REQUIRE(providers != nullptr);
  REQUIRE(providers->size() == 2);

  const toml::table *first = (*providers)[0].as_table();
  const toml::table *second = (*providers)[1].as_table();
  REQUIRE(first->get("id").as<std::string>() == std::string("alchemy-eth"));
  REQUIRE(second->get("chain").as<std::string>() == std::string("bsc"));
  // A sub-table header after [[providers]] attaches to the last entry
  REQUIRE(second->at_path("headers.Authorization").as<std::string>() ==
          std::string("Bearer token"));
  REQUIRE_FALSE(first->contains("headers"));
}

TEST_CASE("TOML reports malformed input with its line", "[toml][errors]")
{
  SECTION("Duplicate key")
  {
    try
    {
      toml::parse("a = 1\na = 2\n");
      FAIL("expected a parse error");
    }
    catch (const toml::parse_error &e)
    {
      REQUIRE(e.line() == 2);
      REQUIRE(std::string(e.what()).find("duplicate key 'a'") != std::string::npos);
    }
  }

  SECTION("Other errors")
  {
    REQUIRE_THROWS_AS(toml::parse("name = \"unterminated\n"), toml::parse_error);
    REQUIRE_THROWS_AS(toml::parse("value = 12abc\n"), toml::parse_error);
    REQUIRE_THROWS_AS(toml::parse("flag = maybe\n"), toml::parse_error);
    REQUIRE_THROWS_AS(toml::parse("[section\n"), toml::parse_error);
    REQUIRE_THROWS_AS(toml::parse("key \"value\"\n"), toml::parse_error);
    REQUIRE_THROWS_AS(toml::parse("a = 1 b = 2\n"), toml::parse_error);
    REQUIRE_THROWS_AS(toml::parse("list = [1, 2\n"), toml::parse_error);
    REQUIRE_THROWS_AS(toml::parse("a = 1\n[a]\n"), toml::parse_error);
    REQUIRE_THROWS_AS(toml::parse("s = \"bad \\q escape\"\n"), toml::parse_error);
  }

  SECTION("Missing file")
  {
    REQUIRE_THROWS_AS(toml::parse_file("/nonexistent/rpcmesh.toml"), std::runtime_error);
  }
}
