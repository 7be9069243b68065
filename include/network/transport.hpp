// Copyright (c) 2025 The Courier Developers
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace courier {
namespace network {

// Abstract transport interfaces consumed by discovery, selection and dispatch.
// Allows dependency injection of different implementations:
// - BeastHttpClient / TcpReachabilityProbe: real sockets via boost::asio
// - MockHttpClient / MockReachabilityProbe: in-memory doubles (in test/infra)
//
// Contract shared by all implementations: the completion callback is invoked
// exactly once, always from the io_context and never inline from the call
// that started the operation.

enum class HttpMethod { Get, Post };

const char *HttpMethodName(HttpMethod method);

struct HttpRequest {
  HttpMethod method{HttpMethod::Get};
  std::string host;
  uint16_t port{0};
  std::string target{"/"}; // path + query
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;
};

struct HttpResponse {
  unsigned status{0};
  std::string body;

  bool IsSuccess() const { return status >= 200 && status < 300; }
};

enum class HttpErrorKind {
  Resolve,    // Host name could not be resolved
  Connection, // Connect, write or read failed
  Timeout     // Deadline expired before the response was complete
};

struct HttpError {
  HttpErrorKind kind{HttpErrorKind::Connection};
  std::string message;
};

// Outcome of one HTTP exchange: exactly one of response / error is set
struct HttpResult {
  std::optional<HttpResponse> response;
  std::optional<HttpError> error;

  static HttpResult Ok(HttpResponse r) { return HttpResult{std::move(r), std::nullopt}; }
  static HttpResult Fail(HttpErrorKind kind, std::string message) {
    return HttpResult{std::nullopt, HttpError{kind, std::move(message)}};
  }

  bool ok() const { return response.has_value(); }
};

using HttpCallback = std::function<void(HttpResult result)>;
using ProbeCallback = std::function<void(bool reachable)>;

// HttpClient - issues single HTTP/1.1 request/response exchanges
class HttpClient {
public:
  virtual ~HttpClient() = default;

  // The whole exchange (resolve, connect, write, read) must finish within
  // `timeout`, otherwise the callback receives HttpErrorKind::Timeout.
  virtual void async_request(const HttpRequest &request,
                             std::chrono::milliseconds timeout,
                             HttpCallback callback) = 0;
};

// ReachabilityProbe - lightweight connectivity check (TCP handshake only,
// no application traffic)
class ReachabilityProbe {
public:
  virtual ~ReachabilityProbe() = default;

  virtual void async_probe(const std::string &host, uint16_t port,
                           ProbeCallback callback) = 0;
};

} // namespace network
} // namespace courier
