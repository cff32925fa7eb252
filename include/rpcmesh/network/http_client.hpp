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
#include <map>
#include <memory>
#include <mutex>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>

namespace rpcmesh
{
namespace network
{

/// \brief Raised for connect, TLS, I/O and timeout failures. An HTTP error
/// status is not an HttpError; it is returned in Response::statusCode.
class HttpError : public std::runtime_error
{
public:
  explicit HttpError(const std::string &what) : std::runtime_error(what) {}
};

/// \brief Minimal blocking HTTP/1.1 client for JSON-RPC over HTTP(S).
///
/// \details
///   - One TCP connection per request, closed afterwards (Connection: close)
///   - Non-blocking connect bounded by connectTimeout, then socket
///     send/receive timeouts bounded by the per-request timeout
///   - HTTPS through OpenSSL with SNI and host-name verification
///   - Content-Length, chunked and read-until-close bodies
class HttpClient
{
public:
  struct TlsConfig
  {
    std::string caFile;
    bool verifyPeer = true;
  };

  struct Response
  {
    int statusCode = 0;
    std::string statusText;
    /// Header names are lower-cased.
    std::map<std::string, std::string> headers;
    std::string body;
    bool success() const { return statusCode >= 200 && statusCode < 300; }
  };

  struct Config
  {
    std::chrono::milliseconds connectTimeout{2000};
    std::chrono::milliseconds requestTimeout{30000};
    std::string userAgent{"RpcMesh-HttpClient/1.0"};
    std::size_t maxResponseSize{16 * 1024 * 1024};
    TlsConfig tls;
  };

  struct ParsedUrl
  {
    std::string scheme;
    std::string host;
    std::uint16_t port = 0;
    std::string target;

    bool secure() const { return scheme == "https"; }
  };

  /// \brief One open TCP connection, wrapped in TLS for secure targets.
  /// Shared by request() and the WebSocket client.
  class Stream
  {
  public:
    Stream(int fd, std::string url) : _fd(fd), _url(std::move(url)) {}

    ~Stream()
    {
      if (_ssl)
      {
        SSL_free(_ssl);
      }
      if (_fd >= 0)
      {
        ::close(_fd);
      }
    }

    Stream(const Stream &) = delete;
    Stream &operator=(const Stream &) = delete;

    int fd() const { return _fd; }
    bool secure() const { return _ssl != nullptr; }
    const std::string &url() const { return _url; }

    /// Bytes already decrypted inside TLS, invisible to poll() on fd().
    bool hasPending() const { return _ssl && SSL_pending(_ssl) > 0; }

    /// Bounds each blocking send and receive.
    void setIoTimeout(std::chrono::milliseconds timeout)
    {
      HttpClient::setIoTimeout(_fd, timeout);
    }

    void write(const std::string &data, std::chrono::steady_clock::time_point deadline)
    {
      HttpClient::writeAll(_fd, _ssl, data, deadline, _url);
    }

    /// Returns 0 at end of stream.
    /// \throws HttpError, with an ETIMEDOUT message when the I/O timeout expires.
    long read(char *buffer, std::size_t size)
    {
      return HttpClient::readSome(_fd, _ssl, buffer, size, _url);
    }

    void shutdown()
    {
      if (_ssl)
      {
        SSL_shutdown(_ssl);
      }
      ::shutdown(_fd, SHUT_RDWR);
    }

  private:
    friend class HttpClient;

    int _fd;
    SSL *_ssl = nullptr;
    std::string _url;
  };

  HttpClient() : HttpClient(Config{}) {}

  explicit HttpClient(Config config) : _config(std::move(config)) {}

  HttpClient(const HttpClient &) = delete;
  HttpClient &operator=(const HttpClient &) = delete;

  const Config &config() const { return _config; }

  /// \brief POST body to url. timeout bounds the whole exchange after
  /// connect; zero means Config::requestTimeout.
  Response post(const std::string &url, const std::string &body,
                const std::map<std::string, std::string> &headers = {},
                std::chrono::milliseconds timeout = std::chrono::milliseconds(0))
  {
    return request("POST", url, body, headers, timeout);
  }

  Response get(const std::string &url, const std::map<std::string, std::string> &headers = {},
               std::chrono::milliseconds timeout = std::chrono::milliseconds(0))
  {
    return request("GET", url, "", headers, timeout);
  }

  Response request(const std::string &method, const std::string &url, const std::string &body,
                   const std::map<std::string, std::string> &headers,
                   std::chrono::milliseconds timeout)
  {
    ParsedUrl target = parseUrl(url);
    if (timeout.count() <= 0)
    {
      timeout = _config.requestTimeout;
    }
    auto deadline = std::chrono::steady_clock::now() + timeout;

    auto stream = open(target, url, std::min(timeout, _config.connectTimeout));
    stream->setIoTimeout(remaining(deadline, url));
    stream->write(buildRequest(method, target, body, headers), deadline);

    std::string raw;
    char buffer[16384];
    while (!isCompleteHttpResponse(raw))
    {
      stream->setIoTimeout(remaining(deadline, url));
      long n = stream->read(buffer, sizeof(buffer));
      if (n == 0)
      {
        break;
      }
      raw.append(buffer, static_cast<std::size_t>(n));
      if (raw.size() > _config.maxResponseSize)
      {
        throw HttpError("HTTP response from " + url + " exceeds " +
                        std::to_string(_config.maxResponseSize) + " bytes");
      }
    }
    stream->shutdown();
    if (raw.empty())
    {
      throw HttpError("Empty HTTP response from " + url);
    }
    return parseHttpResponse(raw);
  }

  /// \brief Connect to target within connectTimeout, adding TLS for https.
  /// url only labels errors.
  std::unique_ptr<Stream> open(const ParsedUrl &target, const std::string &url,
                               std::chrono::milliseconds connectTimeout)
  {
    auto stream = std::make_unique<Stream>(connectTo(target, connectTimeout), url);
    if (target.secure())
    {
      stream->_ssl = startTls(stream->_fd, target.host).release();
    }
    return stream;
  }

  static ParsedUrl parseUrl(const std::string &url)
  {
    static const std::regex urlRegex(
        R"(^(https?)://(\[[^\]]+\]|[^:/?#\s]+)(?::(\d+))?([^#\s]*)(?:#.*)?$)",
        std::regex::icase);
    std::smatch match;
    if (!std::regex_match(url, match, urlRegex))
    {
      throw std::invalid_argument("Invalid URL format: " + url);
    }
    ParsedUrl parsed;
    parsed.scheme = lower(match[1].str());
    parsed.host = match[2].str();
    if (parsed.host.size() > 2 && parsed.host.front() == '[')
    {
      parsed.host = parsed.host.substr(1, parsed.host.size() - 2);
    }
    if (match[3].matched)
    {
      int port = std::stoi(match[3].str());
      if (port <= 0 || port > 65535)
      {
        throw std::invalid_argument("Invalid port in URL: " + url);
      }
      parsed.port = static_cast<std::uint16_t>(port);
    }
    else
    {
      parsed.port = parsed.secure() ? 443 : 80;
    }
    parsed.target = match[4].str();
    if (parsed.target.empty() || parsed.target.front() != '/')
    {
      parsed.target = "/" + parsed.target;
    }
    return parsed;
  }

  /// \brief True once headers and the full body (per Content-Length or the
  /// terminating chunk) are present. Without either, the body runs to EOF.
  static bool isCompleteHttpResponse(const std::string &data)
  {
    auto headerEnd = data.find("\r\n\r\n");
    if (headerEnd == std::string::npos)
    {
      return false;
    }
    std::string head = lower(data.substr(0, headerEnd));
    std::size_t bodySize = data.size() - headerEnd - 4;

    static const std::regex lengthRegex(R"(\ncontent-length:\s*(\d+))");
    std::smatch match;
    if (std::regex_search(head, match, lengthRegex))
    {
      return bodySize >= std::stoul(match[1].str());
    }
    static const std::regex chunkedRegex(R"(\ntransfer-encoding:[^\n]*chunked)");
    if (std::regex_search(head, chunkedRegex))
    {
      return data.compare(data.size() - std::min<std::size_t>(data.size(), 5), 5, "0\r\n\r\n") ==
             0;
    }
    return false;
  }

  static Response parseHttpResponse(const std::string &data)
  {
    auto headerEnd = data.find("\r\n\r\n");
    if (headerEnd == std::string::npos)
    {
      throw HttpError("Invalid HTTP response: no header separator found");
    }
    Response response;
    std::istringstream head(data.substr(0, headerEnd));
    std::string line;
    std::getline(head, line);
    if (!line.empty() && line.back() == '\r')
    {
      line.pop_back();
    }
    static const std::regex statusRegex(R"(HTTP/\d(?:\.\d)?\s+(\d{3})\s*(.*))");
    std::smatch status;
    if (!std::regex_match(line, status, statusRegex))
    {
      throw HttpError("Invalid HTTP status line: " + line);
    }
    response.statusCode = std::stoi(status[1].str());
    response.statusText = status[2].str();

    while (std::getline(head, line))
    {
      if (!line.empty() && line.back() == '\r')
      {
        line.pop_back();
      }
      auto colon = line.find(':');
      if (colon == std::string::npos)
      {
        continue;
      }
      response.headers[lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }

    std::string body = data.substr(headerEnd + 4);
    auto length = response.headers.find("content-length");
    auto encoding = response.headers.find("transfer-encoding");
    if (length != response.headers.end())
    {
      response.body = body.substr(0, std::stoul(length->second));
    }
    else if (encoding != response.headers.end() &&
             lower(encoding->second).find("chunked") != std::string::npos)
    {
      response.body = decodeChunkedBody(body);
    }
    else
    {
      response.body = std::move(body);
    }
    return response;
  }

  static std::string decodeChunkedBody(const std::string &chunked)
  {
    std::string out;
    std::size_t pos = 0;
    while (pos < chunked.size())
    {
      auto lineEnd = chunked.find("\r\n", pos);
      if (lineEnd == std::string::npos)
      {
        throw HttpError("Malformed chunked body: missing size line terminator");
      }
      std::string sizeText = chunked.substr(pos, lineEnd - pos);
      auto extension = sizeText.find(';');
      if (extension != std::string::npos)
      {
        sizeText.resize(extension);
      }
      std::size_t size = 0;
      try
      {
        size = std::stoul(sizeText, nullptr, 16);
      }
      catch (const std::logic_error &)
      {
        throw HttpError("Malformed chunked body: bad chunk size '" + sizeText + "'");
      }
      if (size == 0)
      {
        break;
      }
      pos = lineEnd + 2;
      if (pos + size > chunked.size())
      {
        throw HttpError("Malformed chunked body: truncated chunk");
      }
      out.append(chunked, pos, size);
      pos += size + 2;
    }
    return out;
  }

private:
  struct Socket
  {
    explicit Socket(int f) : fd(f) {}
    ~Socket()
    {
      if (fd >= 0)
      {
        ::close(fd);
      }
    }
    Socket(const Socket &) = delete;
    Socket &operator=(const Socket &) = delete;
    int fd;
  };

  struct SslDeleter
  {
    void operator()(SSL *ssl) const { SSL_free(ssl); }
  };

  struct SslCtxDeleter
  {
    void operator()(SSL_CTX *ctx) const { SSL_CTX_free(ctx); }
  };

  struct AddrInfoDeleter
  {
    void operator()(addrinfo *info) const { freeaddrinfo(info); }
  };

  static std::string lower(std::string s)
  {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
  }

  static std::string trim(const std::string &s)
  {
    auto first = s.find_first_not_of(" \t");
    if (first == std::string::npos)
    {
      return "";
    }
    auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
  }

  static std::string sslErrorString()
  {
    unsigned long code = ERR_get_error();
    if (code == 0)
    {
      return "unknown TLS error";
    }
    char buffer[256];
    ERR_error_string_n(code, buffer, sizeof(buffer));
    return buffer;
  }

  static std::chrono::milliseconds remaining(std::chrono::steady_clock::time_point deadline,
                                             const std::string &url)
  {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (left.count() <= 0)
    {
      throw HttpError("HTTP request to " + url + " timed out");
    }
    return left;
  }

  static void setIoTimeout(int fd, std::chrono::milliseconds timeout)
  {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
  }

  int connectTo(const ParsedUrl &target, std::chrono::milliseconds timeout)
  {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo *raw = nullptr;
    std::string port = std::to_string(target.port);
    int rc = ::getaddrinfo(target.host.c_str(), port.c_str(), &hints, &raw);
    if (rc != 0)
    {
      throw HttpError("ENOTFOUND: cannot resolve " + target.host + ": " + gai_strerror(rc));
    }
    std::unique_ptr<addrinfo, AddrInfoDeleter> results(raw);

    std::string lastError = "no addresses";
    for (addrinfo *ai = results.get(); ai; ai = ai->ai_next)
    {
      int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
      if (fd < 0)
      {
        lastError = std::strerror(errno);
        continue;
      }
      Socket guard(fd);
      int flags = ::fcntl(fd, F_GETFL, 0);
      ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);

      rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
      if (rc != 0 && errno != EINPROGRESS)
      {
        lastError = errno == ECONNREFUSED ? "ECONNREFUSED" : std::strerror(errno);
        continue;
      }
      if (rc != 0)
      {
        pollfd pfd{fd, POLLOUT, 0};
        int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
        if (ready == 0)
        {
          lastError = "ETIMEDOUT: connect timeout";
          continue;
        }
        int soError = 0;
        socklen_t len = sizeof(soError);
        ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &len);
        if (ready < 0 || soError != 0)
        {
          int err = ready < 0 ? errno : soError;
          lastError = err == ECONNREFUSED ? "ECONNREFUSED" : std::strerror(err);
          continue;
        }
      }
      ::fcntl(fd, F_SETFL, flags);
      guard.fd = -1;
      return fd;
    }
    throw HttpError("Cannot connect to " + target.host + ":" + port + ": " + lastError);
  }

  SSL_CTX *sslContext()
  {
    std::lock_guard<std::mutex> lock(_sslMutex);
    if (_sslCtx)
    {
      return _sslCtx.get();
    }
    std::unique_ptr<SSL_CTX, SslCtxDeleter> ctx(SSL_CTX_new(TLS_client_method()));
    if (!ctx)
    {
      throw HttpError("SSL_CTX_new failed: " + sslErrorString());
    }
    SSL_CTX_set_min_proto_version(ctx.get(), TLS1_2_VERSION);
    if (_config.tls.verifyPeer)
    {
      SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_PEER, nullptr);
      bool loaded = _config.tls.caFile.empty()
                        ? SSL_CTX_set_default_verify_paths(ctx.get()) == 1
                        : SSL_CTX_load_verify_locations(ctx.get(), _config.tls.caFile.c_str(),
                                                        nullptr) == 1;
      if (!loaded)
      {
        throw HttpError("Cannot load CA certificates: " + sslErrorString());
      }
    }
    else
    {
      SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_NONE, nullptr);
    }
    _sslCtx = std::move(ctx);
    return _sslCtx.get();
  }

  std::unique_ptr<SSL, SslDeleter> startTls(int fd, const std::string &host)
  {
    std::unique_ptr<SSL, SslDeleter> ssl(SSL_new(sslContext()));
    if (!ssl)
    {
      throw HttpError("SSL_new failed: " + sslErrorString());
    }
    SSL_set_fd(ssl.get(), fd);
    SSL_set_tlsext_host_name(ssl.get(), host.c_str());
    if (_config.tls.verifyPeer)
    {
      SSL_set1_host(ssl.get(), host.c_str());
    }
    if (SSL_connect(ssl.get()) != 1)
    {
      throw HttpError("TLS handshake with " + host + " failed: " + sslErrorString());
    }
    return ssl;
  }

  std::string buildRequest(const std::string &method, const ParsedUrl &target,
                           const std::string &body,
                           const std::map<std::string, std::string> &headers) const
  {
    std::ostringstream out;
    out << method << " " << target.target << " HTTP/1.1\r\n";
    bool defaultPort = target.port == (target.secure() ? 443 : 80);
    out << "Host: " << target.host;
    if (!defaultPort)
    {
      out << ":" << target.port;
    }
    out << "\r\n";
    out << "User-Agent: " << _config.userAgent << "\r\n";
    out << "Accept: application/json\r\n";
    out << "Connection: close\r\n";
    for (const auto &header : headers)
    {
      out << header.first << ": " << header.second << "\r\n";
    }
    if (!body.empty() || method == "POST")
    {
      out << "Content-Length: " << body.size() << "\r\n";
    }
    out << "\r\n" << body;
    return out.str();
  }

  static void writeAll(int fd, SSL *ssl, const std::string &data,
                       std::chrono::steady_clock::time_point deadline, const std::string &url)
  {
    std::size_t sent = 0;
    while (sent < data.size())
    {
      remaining(deadline, url);
      long n = 0;
      if (ssl)
      {
        n = SSL_write(ssl, data.data() + sent, static_cast<int>(data.size() - sent));
        if (n <= 0)
        {
          throw HttpError("TLS write to " + url + " failed: " + sslErrorString());
        }
      }
      else
      {
        n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0)
        {
          if (errno == EINTR)
          {
            continue;
          }
          throw HttpError(ioErrorText("write", url, errno));
        }
      }
      sent += static_cast<std::size_t>(n);
    }
  }

  static long readSome(int fd, SSL *ssl, char *buffer, std::size_t size, const std::string &url)
  {
    if (ssl)
    {
      int n = SSL_read(ssl, buffer, static_cast<int>(size));
      if (n > 0)
      {
        return n;
      }
      int err = SSL_get_error(ssl, n);
      if (err == SSL_ERROR_ZERO_RETURN)
      {
        return 0;
      }
      if (err == SSL_ERROR_SYSCALL && errno == 0)
      {
        return 0;
      }
      if (err == SSL_ERROR_SYSCALL || err == SSL_ERROR_WANT_READ)
      {
        throw HttpError(ioErrorText("read", url, errno == 0 ? EAGAIN : errno));
      }
      throw HttpError("TLS read from " + url + " failed: " + sslErrorString());
    }
    for (;;)
    {
      ssize_t n = ::recv(fd, buffer, size, 0);
      if (n >= 0)
      {
        return static_cast<long>(n);
      }
      if (errno != EINTR)
      {
        throw HttpError(ioErrorText("read", url, errno));
      }
    }
  }

  static std::string ioErrorText(const char *op, const std::string &url, int err)
  {
    if (err == EAGAIN || err == EWOULDBLOCK)
    {
      return std::string("ETIMEDOUT: ") + op + " timeout on " + url;
    }
    if (err == ECONNRESET)
    {
      return std::string("ECONNRESET: connection reset during ") + op + " on " + url;
    }
    return std::string(op) + " on " + url + " failed: " + std::strerror(err);
  }

  Config _config;
  std::mutex _sslMutex;
  std::unique_ptr<SSL_CTX, SslCtxDeleter> _sslCtx;
};

} // namespace network
} // namespace rpcmesh
