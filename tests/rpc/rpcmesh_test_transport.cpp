// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// Tests for the JSON-RPC over HTTP transport

#define CATCH_CONFIG_MAIN
#include "rpcmesh_test_net_utils.hpp"
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

using namespace rpcmesh::rpc;
using rpcmesh::core::Json;
using rpcmesh::test::makeProvider;
using testnet::LoopbackHttpServer;
using namespace std::chrono_literals;

TEST_CASE("HttpRpcTransport builds JSON-RPC 2.0 envelopes", "[transport][envelope]")
{
  auto envelope = HttpRpcTransport::makeRequestEnvelope("eth_getBalance",
                                                        Json::array({"0xabc", "latest"}), 7);
  REQUIRE(envelope["jsonrpc"] == "2.0");
  REQUIRE(envelope["method"] == "eth_getBalance");
  REQUIRE(envelope["params"] == Json::array({"0xabc", "latest"}));
  REQUIRE(envelope["id"] == 7);

  auto noParams = HttpRpcTransport::makeRequestEnvelope("eth_chainId", nullptr, 1);
  REQUIRE_FALSE(noParams.contains("params"));
}

TEST_CASE("HttpRpcTransport interprets response objects", "[transport][parse]")
{
  SECTION("result")
  {
    auto result = HttpRpcTransport::parseResponseOrThrow(
        "p1", Json::parse(R"({"jsonrpc":"2.0","id":1,"result":"0x10"})"));
    REQUIRE(result == "0x10");
  }

  SECTION("null result is still a result")
  {
    auto result = HttpRpcTransport::parseResponseOrThrow(
        "p1", Json::parse(R"({"jsonrpc":"2.0","id":1,"result":null})"));
    REQUIRE(result.is_null());
  }

  SECTION("error object")
  {
    try
    {
      HttpRpcTransport::parseResponseOrThrow(
          "p1", Json::parse(R"({"jsonrpc":"2.0","id":1,
                               "error":{"code":-32602,"message":"invalid params","data":"x"}})"));
      FAIL("expected ProviderError");
    }
    catch (const ProviderError &e)
    {
      REQUIRE(e.code() == -32602);
      REQUIRE(e.message() == "invalid params");
      REQUIRE(e.data() == "x");
      REQUIRE(e.providerId() == "p1");
    }
  }

  SECTION("error string")
  {
    try
    {
      HttpRpcTransport::parseResponseOrThrow("p1", Json::parse(R"({"error":"boom"})"));
      FAIL("expected ProviderError");
    }
    catch (const ProviderError &e)
    {
      REQUIRE(e.code() == -32000);
      REQUIRE(e.message() == "boom");
    }
  }

  SECTION("malformed")
  {
    REQUIRE_THROWS_AS(HttpRpcTransport::parseResponseOrThrow("p1", Json::array()),
                      TransportError);
    REQUIRE_THROWS_AS(HttpRpcTransport::parseResponseOrThrow("p1", Json::parse(R"({"id":1})")),
                      TransportError);
  }
}

TEST_CASE("HttpRpcTransport talks to a JSON-RPC endpoint", "[transport][http]")
{
  rpcmesh::test::initializeTestLogging();
  LoopbackHttpServer server({
      LoopbackHttpServer::jsonResponse(R"({"jsonrpc":"2.0","id":1,"result":"0x1b4"})"),
      LoopbackHttpServer::jsonResponse(
          R"({"jsonrpc":"2.0","id":2,"error":{"code":-32601,"message":"method not found"}})"),
      LoopbackHttpServer::jsonResponse("busy", 503, "Service Unavailable"),
      LoopbackHttpServer::jsonResponse("not json"),
  });

  auto provider = makeProvider("local");
  provider.url = server.url("/rpc");
  provider.apiKey = "secret";
  HttpRpcTransport transport;

  REQUIRE(transport.send(provider, "eth_blockNumber", Json::array(), 2000ms) == "0x1b4");
  REQUIRE_THROWS_AS(transport.send(provider, "eth_foo", Json::array(), 2000ms), ProviderError);
  REQUIRE_THROWS_AS(transport.send(provider, "eth_blockNumber", Json::array(), 2000ms),
                    TransportError);
  REQUIRE_THROWS_AS(transport.send(provider, "eth_blockNumber", Json::array(), 2000ms),
                    TransportError);

  auto requests = server.requests();
  REQUIRE(requests.size() == 4);
  const auto &first = requests[0];
  REQUIRE(first.rfind("POST /rpc HTTP/1.1\r\n", 0) == 0);
  REQUIRE(first.find("Authorization: Bearer secret") != std::string::npos);
  auto body = Json::parse(first.substr(first.find("\r\n\r\n") + 4));
  REQUIRE(body["method"] == "eth_blockNumber");
  REQUIRE(body["jsonrpc"] == "2.0");
}

TEST_CASE("HttpRpcTransport reports unreachable endpoints as transport errors",
          "[transport][http]")
{
  auto provider = makeProvider("nowhere");
  provider.url = "http://127.0.0.1:1/";
  HttpRpcTransport transport;
  REQUIRE_THROWS_AS(transport.send(provider, "eth_blockNumber", Json::array(), 500ms),
                    TransportError);

  provider.url = "not a url";
  REQUIRE_THROWS_AS(transport.send(provider, "eth_blockNumber", Json::array(), 500ms),
                    TransportError);
}
