// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// Tests for the WebSocket client framing, handshake and message exchange

#define CATCH_CONFIG_MAIN
#include "rpcmesh_test_net_utils.hpp"
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

using rpcmesh::network::HttpError;
using rpcmesh::network::WebSocketClient;
using rpcmesh::network::WebSocketClosed;
using rpcmesh::network::WebSocketError;
using testnet::eventually;
using testnet::LoopbackWebSocketServer;
using namespace std::chrono_literals;

namespace
{
using Opcode = WebSocketClient::Opcode;

const std::uint8_t kMask[4] = {0x37, 0xfa, 0x21, 0x3d};

WebSocketClient::Config quickConfig()
{
  WebSocketClient::Config config;
  config.connectTimeout = 1000ms;
  config.writeTimeout = 1000ms;
  return config;
}
} // namespace

TEST_CASE("WebSocketClient URL parsing", "[websocket][url]")
{
  rpcmesh::test::initializeTestLogging();

  auto plain = WebSocketClient::parseUrl("ws://node.local:8546/stream");
  REQUIRE_FALSE(plain.secure());
  REQUIRE(plain.host == "node.local");
  REQUIRE(plain.port == 8546);
  REQUIRE(plain.target == "/stream");

  auto secure = WebSocketClient::parseUrl("wss://eth.example.com/v2/key");
  REQUIRE(secure.secure());
  REQUIRE(secure.port == 443);
  REQUIRE(secure.target == "/v2/key");

  REQUIRE(WebSocketClient::parseUrl("ws://node").port == 80);
  REQUIRE_THROWS_AS(WebSocketClient::parseUrl("https://node/rpc"), std::invalid_argument);
  REQUIRE_THROWS_AS(WebSocketClient::parseUrl("node:8546"), std::invalid_argument);
}

TEST_CASE("WebSocketClient frame encoding", "[websocket][frame]")
{
  SECTION("RFC 6455 masked and unmasked text frames")
  {
    auto unmasked = WebSocketClient::encodeFrame(Opcode::Text, "Hello", nullptr);
    REQUIRE(unmasked == std::string("\x81\x05Hello", 7));

    auto masked = WebSocketClient::encodeFrame(Opcode::Text, "Hello", kMask);
    REQUIRE(masked == std::string("\x81\x85\x37\xfa\x21\x3d\x7f\x9f\x4d\x51\x58", 11));

    auto buffer = masked;
    auto frame = WebSocketClient::decodeFrame(buffer, 1024);
    REQUIRE(frame);
    REQUIRE(frame->fin);
    REQUIRE(frame->opcode == Opcode::Text);
    REQUIRE(frame->payload == "Hello");
    REQUIRE(buffer.empty());
  }

  SECTION("Payload length selects the length encoding")
  {
    REQUIRE(WebSocketClient::encodeFrame(Opcode::Binary, std::string(125, 'a'), nullptr).size() ==
            2 + 125);
    auto medium = WebSocketClient::encodeFrame(Opcode::Binary, std::string(300, 'b'), nullptr);
    REQUIRE(medium.size() == 4 + 300);
    REQUIRE(static_cast<std::uint8_t>(medium[1]) == 126);
    auto large = WebSocketClient::encodeFrame(Opcode::Binary, std::string(70000, 'c'), kMask);
    REQUIRE(large.size() == 10 + 4 + 70000);
    REQUIRE(static_cast<std::uint8_t>(large[1]) == (0x80 | 127));

    auto frame = WebSocketClient::decodeFrame(large, 1 << 20);
    REQUIRE(frame);
    REQUIRE(frame->payload == std::string(70000, 'c'));
  }

  SECTION("Incomplete frames stay in the buffer")
  {
    auto bytes = WebSocketClient::encodeFrame(Opcode::Text, std::string(300, 'x'), nullptr);
    std::string buffer = bytes.substr(0, 3);
    REQUIRE_FALSE(WebSocketClient::decodeFrame(buffer, 1024));
    buffer = bytes.substr(0, bytes.size() - 1);
    REQUIRE_FALSE(WebSocketClient::decodeFrame(buffer, 1024));
    REQUIRE(buffer.size() == bytes.size() - 1);

    buffer += bytes.back();
    buffer += WebSocketClient::encodeFrame(Opcode::Ping, "p", nullptr);
    REQUIRE(WebSocketClient::decodeFrame(buffer, 1024)->payload.size() == 300);
    auto ping = WebSocketClient::decodeFrame(buffer, 1024);
    REQUIRE(ping->opcode == Opcode::Ping);
    REQUIRE(buffer.empty());
  }

  SECTION("Continuation frames keep the fin bit clear until the last")
  {
    auto first = WebSocketClient::encodeFrame(Opcode::Text, "ab", nullptr, false);
    auto frame = WebSocketClient::decodeFrame(first, 1024);
    REQUIRE_FALSE(frame->fin);
    REQUIRE(frame->opcode == Opcode::Text);
  }

  SECTION("Reserved bits and oversized payloads are rejected")
  {
    std::string reserved("\xC1\x00", 2);
    REQUIRE_THROWS_AS(WebSocketClient::decodeFrame(reserved, 1024), WebSocketError);

    auto big = WebSocketClient::encodeFrame(Opcode::Text, std::string(2048, 'z'), nullptr);
    REQUIRE_THROWS_AS(WebSocketClient::decodeFrame(big, 1024), WebSocketError);
  }
}

TEST_CASE("WebSocketClient accept key", "[websocket][handshake]")
{
  REQUIRE(WebSocketClient::acceptKey("dGhlIHNhbXBsZSBub25jZQ==") == "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=");
}

TEST_CASE("WebSocketClient exchanges messages with a server", "[websocket][exchange]")
{
  rpcmesh::test::initializeTestLogging();
  LoopbackWebSocketServer server({R"({"hello":true})"});
  WebSocketClient client(quickConfig());

  REQUIRE_FALSE(client.isOpen());
  client.connect(server.url("/v2/key"));
  REQUIRE(client.isOpen());

  auto handshakes = server.handshakes();
  REQUIRE(handshakes.size() == 1);
  REQUIRE(handshakes[0].rfind("GET /v2/key HTTP/1.1\r\n", 0) == 0);
  REQUIRE(handshakes[0].find("Upgrade: websocket") != std::string::npos);
  REQUIRE(handshakes[0].find("Sec-WebSocket-Version: 13") != std::string::npos);

  auto greeting = client.receive(2000ms);
  REQUIRE(greeting);
  REQUIRE(*greeting == R"({"hello":true})");

  client.send(R"({"id":1,"method":"eth_subscribe"})");
  auto echo = client.receive(2000ms);
  REQUIRE(echo);
  REQUIRE(*echo == R"({"id":1,"method":"eth_subscribe"})");
  REQUIRE(server.received() == std::vector<std::string>{R"({"id":1,"method":"eth_subscribe"})"});

  SECTION("Idle receive returns nothing")
  {
    auto start = std::chrono::steady_clock::now();
    REQUIRE_FALSE(client.receive(100ms));
    REQUIRE(std::chrono::steady_clock::now() - start >= 100ms);
    REQUIRE(client.isOpen());
  }

  SECTION("Fragmented messages are reassembled")
  {
    server.sendRaw(WebSocketClient::encodeFrame(Opcode::Text, "{\"par", nullptr, false) +
                   WebSocketClient::encodeFrame(Opcode::Ping, "mid", nullptr) +
                   WebSocketClient::encodeFrame(Opcode::Continuation, "ts\":", nullptr, false) +
                   WebSocketClient::encodeFrame(Opcode::Continuation, "3}", nullptr));
    auto message = client.receive(2000ms);
    REQUIRE(message);
    REQUIRE(*message == R"({"parts":3})");
  }

  SECTION("Server pings are answered")
  {
    server.sendRaw(WebSocketClient::encodeFrame(Opcode::Ping, "are you there", nullptr));
    REQUIRE_FALSE(client.receive(200ms));
    REQUIRE(eventually([&]() { return server.pongs() == 1; }));
  }

  SECTION("A server close ends the connection with its code")
  {
    server.closeWith(WebSocketClient::kGoingAway, "bye");
    try
    {
      client.receive(2000ms);
      FAIL("receive returned after the server closed");
    }
    catch (const WebSocketClosed &e)
    {
      REQUIRE(e.code() == WebSocketClient::kGoingAway);
      REQUIRE(e.reason() == "bye");
    }
    REQUIRE_FALSE(client.isOpen());
    REQUIRE_THROWS_AS(client.send("late"), WebSocketError);
  }

  SECTION("A dropped connection reports an abnormal closure")
  {
    server.drop();
    try
    {
      client.receive(2000ms);
      FAIL("receive returned after the connection dropped");
    }
    catch (const WebSocketClosed &e)
    {
      REQUIRE(e.code() == WebSocketClient::kAbnormalClosure);
    }
    REQUIRE_FALSE(client.isOpen());
  }

  SECTION("A client close sends its code")
  {
    client.close(WebSocketClient::kNormalClosure, "done");
    REQUIRE_FALSE(client.isOpen());
    REQUIRE(eventually([&]() { return server.closeCodes().size() == 1; }));
    REQUIRE(server.closeCodes()[0] == WebSocketClient::kNormalClosure);
  }

  SECTION("Reconnecting after a close")
  {
    client.close();
    client.connect(server.url("/again"));
    REQUIRE(client.isOpen());
    REQUIRE(eventually([&]() { return server.connections() == 2; }));
    auto again = client.receive(2000ms);
    REQUIRE(again);
    REQUIRE(*again == R"({"hello":true})");
  }
}

TEST_CASE("WebSocketClient connect failures", "[websocket][errors]")
{
  rpcmesh::test::initializeTestLogging();

  SECTION("A refused upgrade")
  {
    LoopbackWebSocketServer server({}, false);
    WebSocketClient client(quickConfig());
    REQUIRE_THROWS_AS(client.connect(server.url()), WebSocketError);
    REQUIRE_FALSE(client.isOpen());
  }

  SECTION("A server that never answers the upgrade")
  {
    testnet::SilentListener silent;
    auto config = quickConfig();
    config.connectTimeout = 300ms;
    WebSocketClient client(config);
    auto start = std::chrono::steady_clock::now();
    REQUIRE_THROWS_AS(client.connect(silent.url()), HttpError);
    REQUIRE(std::chrono::steady_clock::now() - start < 3000ms);
    REQUIRE_FALSE(client.isOpen());
  }

  SECTION("Nothing listening")
  {
    std::string url;
    {
      LoopbackWebSocketServer gone;
      url = gone.url();
    }
    WebSocketClient client(quickConfig());
    REQUIRE_THROWS_AS(client.connect(url), HttpError);
  }

  SECTION("Sending before connecting")
  {
    WebSocketClient client(quickConfig());
    REQUIRE_THROWS_AS(client.send("x"), WebSocketError);
    REQUIRE_THROWS_AS(client.receive(10ms), WebSocketClosed);
  }
}
