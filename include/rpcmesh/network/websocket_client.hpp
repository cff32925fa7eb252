// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of RpcMesh, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

#include <poll.h>

#include <openssl/evp.h>
#include <openssl/rand.h>

#include "rpcmesh/core/logger.hpp"
#include "rpcmesh/network/http_client.hpp"

namespace rpcmesh
{
namespace network
{

/// \brief Raised for a refused upgrade or a protocol violation.
class WebSocketError : public std::runtime_error
{
public:
  explicit WebSocketError(const std::string &what) : std::runtime_error(what) {}
};

/// \brief Raised by receive() once the connection is gone. code() is the
/// peer's close code, or 1006 when the stream ended without a close frame.
class WebSocketClosed : public WebSocketError
{
public:
  WebSocketClosed(std::uint16_t code, const std::string &reason)
      : WebSocketError("WebSocket closed (" + std::to_string(code) +
                       (reason.empty() ? std::string() : ": " + reason) + ")"),
        _code(code), _reason(reason)
  {
  }

  std::uint16_t code() const { return _code; }
  const std::string &reason() const { return _reason; }

private:
  std::uint16_t _code;
  std::string _reason;
};

/// \brief Client side of RFC 6455 on top of the HttpClient stream.
///
/// \details
///   - ws:// and wss:// URLs; wss goes through the HttpClient TLS path
///   - connect() bounds TCP connect, TLS and the upgrade by connectTimeout
///   - Text and binary messages, fragmented or not; pings are answered
///   - One thread calls receive(); send() and ping() may come from any thread
///   - close() is called by the receiving thread or after it has stopped
class WebSocketClient
{
public:
  static constexpr std::uint16_t kNormalClosure = 1000;
  static constexpr std::uint16_t kGoingAway = 1001;
  static constexpr std::uint16_t kNoStatus = 1005;
  static constexpr std::uint16_t kAbnormalClosure = 1006;

  enum class Opcode : std::uint8_t
  {
    Continuation = 0x0,
    Text = 0x1,
    Binary = 0x2,
    Close = 0x8,
    Ping = 0x9,
    Pong = 0xA
  };

  struct Frame
  {
    bool fin = true;
    Opcode opcode = Opcode::Text;
    std::string payload;
  };

  struct Config
  {
    std::chrono::milliseconds connectTimeout{10000};
    std::chrono::milliseconds writeTimeout{5000};
    std::size_t maxMessageSize{16 * 1024 * 1024};
    std::string userAgent{"RpcMesh-WebSocket/1.0"};
    HttpClient::TlsConfig tls;
  };

  WebSocketClient() : WebSocketClient(Config{}) {}

  explicit WebSocketClient(Config config) : _config(std::move(config)), _http(httpConfig(_config))
  {
  }

  ~WebSocketClient() { close(kGoingAway); }

  WebSocketClient(const WebSocketClient &) = delete;
  WebSocketClient &operator=(const WebSocketClient &) = delete;

  /// \brief Parse a ws:// or wss:// URL. The scheme is reported as its HTTP
  /// counterpart, so secure() holds for wss.
  static HttpClient::ParsedUrl parseUrl(const std::string &url)
  {
    auto colon = url.find("://");
    std::string scheme = colon == std::string::npos ? std::string() : lower(url.substr(0, colon));
    if (scheme == "ws")
    {
      return HttpClient::parseUrl("http" + url.substr(colon));
    }
    if (scheme == "wss")
    {
      return HttpClient::parseUrl("https" + url.substr(colon));
    }
    throw std::invalid_argument("Invalid WebSocket URL: " + url);
  }

  /// \brief Open the connection and complete the upgrade handshake.
  /// Replaces any previous connection.
  /// \throws HttpError for connect, TLS and I/O failures or a timeout.
  /// \throws WebSocketError when the server refuses the upgrade.
  void connect(const std::string &url)
  {
    auto target = parseUrl(url);
    auto deadline = std::chrono::steady_clock::now() + _config.connectTimeout;
    auto stream = _http.open(target, url, _config.connectTimeout);
    stream->setIoTimeout(remaining(deadline, url));

    std::string key = makeKey();
    stream->write(buildHandshake(target, key), deadline);

    std::string raw;
    char buffer[4096];
    std::size_t headerEnd;
    while ((headerEnd = raw.find("\r\n\r\n")) == std::string::npos)
    {
      stream->setIoTimeout(remaining(deadline, url));
      long n = stream->read(buffer, sizeof(buffer));
      if (n == 0)
      {
        throw WebSocketError("Connection to " + url + " closed during the upgrade");
      }
      raw.append(buffer, static_cast<std::size_t>(n));
      if (raw.size() > kMaxHandshakeSize)
      {
        throw WebSocketError("Upgrade response from " + url + " is too large");
      }
    }
    checkHandshake(HttpClient::parseHttpResponse(raw.substr(0, headerEnd + 4)), key, url);

    std::lock_guard<std::mutex> lock(_ioMutex);
    if (_stream)
    {
      _stream->shutdown();
    }
    _stream = std::move(stream);
    _url = url;
    _inbound = raw.substr(headerEnd + 4);
    _fragments.clear();
    _inMessage = false;
  }

  bool isOpen() const
  {
    std::lock_guard<std::mutex> lock(_ioMutex);
    return _stream != nullptr;
  }

  /// \brief Send one unfragmented message.
  /// \throws WebSocketError when not connected, HttpError on write failure.
  void send(const std::string &message, Opcode opcode = Opcode::Text)
  {
    std::lock_guard<std::mutex> lock(_ioMutex);
    writeFrameLocked(opcode, message);
  }

  void ping(const std::string &payload = std::string())
  {
    std::lock_guard<std::mutex> lock(_ioMutex);
    writeFrameLocked(Opcode::Ping, payload);
  }

  /// \brief Next complete data message, or nullopt when none arrives within
  /// timeout. Pings are answered and pongs dropped on the way.
  /// \throws WebSocketClosed once the peer closes or the stream ends.
  /// \throws WebSocketError for a protocol violation.
  std::optional<std::string> receive(std::chrono::milliseconds timeout)
  {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;)
    {
      int fd = -1;
      {
        std::lock_guard<std::mutex> lock(_ioMutex);
        if (!_stream)
        {
          throw WebSocketClosed(kAbnormalClosure, "not connected");
        }
        while (auto frame = decodeFrame(_inbound, _config.maxMessageSize))
        {
          if (auto message = handleFrameLocked(*frame))
          {
            return message;
          }
        }
        if (_stream->hasPending())
        {
          readLocked();
          continue;
        }
        fd = _stream->fd();
      }

      auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now());
      if (left.count() <= 0)
      {
        return std::nullopt;
      }
      pollfd pfd{fd, POLLIN, 0};
      int ready = ::poll(&pfd, 1, static_cast<int>(left.count()));
      if (ready < 0 && errno != EINTR)
      {
        throw WebSocketError(std::string("poll failed: ") + std::strerror(errno));
      }
      if (ready > 0)
      {
        std::lock_guard<std::mutex> lock(_ioMutex);
        if (_stream)
        {
          readLocked();
        }
      }
    }
  }

  /// \brief Send a close frame and drop the connection without waiting for
  /// the peer's reply. Does nothing when not connected.
  void close(std::uint16_t code = kNormalClosure, const std::string &reason = std::string())
  {
    std::lock_guard<std::mutex> lock(_ioMutex);
    if (!_stream)
    {
      return;
    }
    std::string payload{static_cast<char>(code >> 8), static_cast<char>(code & 0xFF)};
    payload += reason;
    try
    {
      writeFrameLocked(Opcode::Close, payload);
    }
    catch (const std::exception &e)
    {
      RPCMESH_LOG_DEBUG("Close frame to " << _url << " not sent: " << e.what());
    }
    dropLocked();
  }

  /// \brief Serialize one frame. Client frames carry a 4-byte mask; pass
  /// nullptr for an unmasked server frame.
  static std::string encodeFrame(Opcode opcode, const std::string &payload,
                                 const std::uint8_t *mask, bool fin = true)
  {
    std::string out;
    out.push_back(static_cast<char>((fin ? 0x80 : 0x00) | static_cast<std::uint8_t>(opcode)));
    std::uint8_t maskBit = mask ? 0x80 : 0x00;
    std::uint64_t size = payload.size();
    if (size < 126)
    {
      out.push_back(static_cast<char>(maskBit | size));
    }
    else if (size <= 0xFFFF)
    {
      out.push_back(static_cast<char>(maskBit | 126));
      out.push_back(static_cast<char>((size >> 8) & 0xFF));
      out.push_back(static_cast<char>(size & 0xFF));
    }
    else
    {
      out.push_back(static_cast<char>(maskBit | 127));
      for (int shift = 56; shift >= 0; shift -= 8)
      {
        out.push_back(static_cast<char>((size >> shift) & 0xFF));
      }
    }
    if (!mask)
    {
      return out + payload;
    }
    out.append(reinterpret_cast<const char *>(mask), 4);
    for (std::size_t i = 0; i < payload.size(); ++i)
    {
      out.push_back(static_cast<char>(payload[i] ^ mask[i % 4]));
    }
    return out;
  }

  /// \brief Take one complete frame off the front of buffer, unmasking it.
  /// Returns nullopt while the frame is still incomplete.
  /// \throws WebSocketError for reserved bits or an oversized payload.
  static std::optional<Frame> decodeFrame(std::string &buffer, std::size_t maxPayload)
  {
    if (buffer.size() < 2)
    {
      return std::nullopt;
    }
    auto byte = [&buffer](std::size_t i) { return static_cast<std::uint8_t>(buffer[i]); };
    if (byte(0) & 0x70)
    {
      throw WebSocketError("WebSocket frame uses reserved bits");
    }
    std::size_t offset = 2;
    std::uint64_t length = byte(1) & 0x7F;
    if (length == 126)
    {
      if (buffer.size() < 4)
      {
        return std::nullopt;
      }
      length = (static_cast<std::uint64_t>(byte(2)) << 8) | byte(3);
      offset = 4;
    }
    else if (length == 127)
    {
      if (buffer.size() < 10)
      {
        return std::nullopt;
      }
      length = 0;
      for (std::size_t i = 2; i < 10; ++i)
      {
        length = (length << 8) | byte(i);
      }
      offset = 10;
    }
    if (length > maxPayload)
    {
      throw WebSocketError("WebSocket frame of " + std::to_string(length) +
                           " bytes exceeds the limit of " + std::to_string(maxPayload));
    }
    bool masked = (byte(1) & 0x80) != 0;
    std::uint8_t mask[4] = {0, 0, 0, 0};
    if (masked)
    {
      if (buffer.size() < offset + 4)
      {
        return std::nullopt;
      }
      for (std::size_t i = 0; i < 4; ++i)
      {
        mask[i] = byte(offset + i);
      }
      offset += 4;
    }
    if (buffer.size() < offset + length)
    {
      return std::nullopt;
    }

    Frame frame;
    frame.fin = (byte(0) & 0x80) != 0;
    frame.opcode = static_cast<Opcode>(byte(0) & 0x0F);
    frame.payload = buffer.substr(offset, static_cast<std::size_t>(length));
    if (masked)
    {
      for (std::size_t i = 0; i < frame.payload.size(); ++i)
      {
        frame.payload[i] = static_cast<char>(frame.payload[i] ^ mask[i % 4]);
      }
    }
    buffer.erase(0, offset + static_cast<std::size_t>(length));
    return frame;
  }

  /// \brief Sec-WebSocket-Accept value the server must return for key.
  static std::string acceptKey(const std::string &key)
  {
    static const std::string kGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
    std::string input = key + kGuid;
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_Digest(input.data(), input.size(), digest, &length, EVP_sha1(), nullptr) != 1)
    {
      throw WebSocketError("SHA-1 digest failed");
    }
    return base64(digest, length);
  }

private:
  static constexpr std::size_t kMaxHandshakeSize = 64 * 1024;
  static constexpr std::chrono::milliseconds kReadTimeout{1000};

  static HttpClient::Config httpConfig(const Config &config)
  {
    HttpClient::Config http;
    http.connectTimeout = config.connectTimeout;
    http.userAgent = config.userAgent;
    http.tls = config.tls;
    return http;
  }

  static std::string lower(std::string s)
  {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
  }

  static std::chrono::milliseconds remaining(std::chrono::steady_clock::time_point deadline,
                                             const std::string &url)
  {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (left.count() <= 0)
    {
      throw HttpError("ETIMEDOUT: WebSocket connect to " + url + " timed out");
    }
    return left;
  }

  static std::string base64(const unsigned char *data, std::size_t size)
  {
    std::string out(4 * ((size + 2) / 3) + 1, '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(&out[0]), data,
                            static_cast<int>(size));
    out.resize(static_cast<std::size_t>(n));
    return out;
  }

  static void randomBytes(unsigned char *out, int size)
  {
    if (RAND_bytes(out, size) != 1)
    {
      throw WebSocketError("RAND_bytes failed");
    }
  }

  static std::string makeKey()
  {
    unsigned char nonce[16];
    randomBytes(nonce, sizeof(nonce));
    return base64(nonce, sizeof(nonce));
  }

  std::string buildHandshake(const HttpClient::ParsedUrl &target, const std::string &key) const
  {
    std::string host = target.host;
    if (host.find(':') != std::string::npos)
    {
      host = "[" + host + "]";
    }
    if (target.port != (target.secure() ? 443 : 80))
    {
      host += ":" + std::to_string(target.port);
    }
    return "GET " + target.target + " HTTP/1.1\r\n" + "Host: " + host + "\r\n" +
           "User-Agent: " + _config.userAgent + "\r\n" + "Upgrade: websocket\r\n" +
           "Connection: Upgrade\r\n" + "Sec-WebSocket-Key: " + key + "\r\n" +
           "Sec-WebSocket-Version: 13\r\n\r\n";
  }

  static void checkHandshake(const HttpClient::Response &response, const std::string &key,
                             const std::string &url)
  {
    if (response.statusCode != 101)
    {
      throw WebSocketError("WebSocket upgrade to " + url + " refused: " +
                           std::to_string(response.statusCode) + " " + response.statusText);
    }
    auto upgrade = response.headers.find("upgrade");
    if (upgrade == response.headers.end() || lower(upgrade->second) != "websocket")
    {
      throw WebSocketError("WebSocket upgrade to " + url + " is missing 'Upgrade: websocket'");
    }
    auto accept = response.headers.find("sec-websocket-accept");
    if (accept == response.headers.end() || accept->second != acceptKey(key))
    {
      throw WebSocketError("WebSocket upgrade to " + url + " returned a bad Sec-WebSocket-Accept");
    }
  }

  void writeFrameLocked(Opcode opcode, const std::string &payload)
  {
    if (!_stream)
    {
      throw WebSocketError("WebSocket is not connected");
    }
    unsigned char mask[4];
    randomBytes(mask, sizeof(mask));
    _stream->setIoTimeout(_config.writeTimeout);
    _stream->write(encodeFrame(opcode, payload, mask),
                   std::chrono::steady_clock::now() + _config.writeTimeout);
  }

  /// A read that times out mid TLS record leaves the stream usable; any
  /// other failure or end of stream drops it.
  void readLocked()
  {
    char buffer[16384];
    long n = 0;
    try
    {
      _stream->setIoTimeout(kReadTimeout);
      n = _stream->read(buffer, sizeof(buffer));
    }
    catch (const HttpError &e)
    {
      std::string what = e.what();
      if (what.rfind("ETIMEDOUT", 0) == 0)
      {
        return;
      }
      dropLocked();
      throw WebSocketClosed(kAbnormalClosure, what);
    }
    if (n == 0)
    {
      dropLocked();
      throw WebSocketClosed(kAbnormalClosure, "connection closed by peer");
    }
    _inbound.append(buffer, static_cast<std::size_t>(n));
  }

  std::optional<std::string> handleFrameLocked(Frame &frame)
  {
    switch (frame.opcode)
    {
    case Opcode::Ping:
      writeFrameLocked(Opcode::Pong, frame.payload);
      return std::nullopt;
    case Opcode::Pong:
      return std::nullopt;
    case Opcode::Close:
    {
      std::uint16_t code = kNoStatus;
      std::string reason;
      if (frame.payload.size() >= 2)
      {
        code = static_cast<std::uint16_t>((static_cast<std::uint8_t>(frame.payload[0]) << 8) |
                                          static_cast<std::uint8_t>(frame.payload[1]));
        reason = frame.payload.substr(2);
      }
      try
      {
        writeFrameLocked(Opcode::Close, frame.payload.substr(0, 2));
      }
      catch (const std::exception &e)
      {
        RPCMESH_LOG_DEBUG("Close reply to " << _url << " not sent: " << e.what());
      }
      dropLocked();
      throw WebSocketClosed(code, reason);
    }
    case Opcode::Text:
    case Opcode::Binary:
      if (_inMessage)
      {
        throw WebSocketError("WebSocket data frame inside a fragmented message");
      }
      if (frame.fin)
      {
        return std::move(frame.payload);
      }
      _fragments = std::move(frame.payload);
      _inMessage = true;
      return std::nullopt;
    case Opcode::Continuation:
      if (!_inMessage)
      {
        throw WebSocketError("Unexpected WebSocket continuation frame");
      }
      if (_fragments.size() + frame.payload.size() > _config.maxMessageSize)
      {
        throw WebSocketError("Fragmented WebSocket message exceeds the limit of " +
                             std::to_string(_config.maxMessageSize));
      }
      _fragments += frame.payload;
      if (!frame.fin)
      {
        return std::nullopt;
      }
      _inMessage = false;
      return std::move(_fragments);
    default:
      throw WebSocketError("Unknown WebSocket opcode " +
                           std::to_string(static_cast<int>(frame.opcode)));
    }
  }

  void dropLocked()
  {
    if (_stream)
    {
      _stream->shutdown();
      _stream.reset();
    }
    _inbound.clear();
    _fragments.clear();
    _inMessage = false;
  }

  Config _config;
  HttpClient _http;
  mutable std::mutex _ioMutex;
  std::unique_ptr<HttpClient::Stream> _stream;
  std::string _url;
  std::string _inbound;
  std::string _fragments;
  bool _inMessage = false;
};

} // namespace network
} // namespace rpcmesh
