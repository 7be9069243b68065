// Copyright (c) 2025 The Courier Developers
// Distributed under the MIT software license

#pragma once

#include "network/transport.hpp"
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <memory>
#include <string>

namespace courier {
namespace network {

// Default timeout for a reachability probe (TCP handshake only)
inline constexpr std::chrono::milliseconds DEFAULT_PROBE_TIMEOUT{1000};

// Host header value for a request ("[::1]:4003" for IPv6 literals)
std::string HostHeader(const HttpRequest &request);

/**
 * BeastHttpClient - HttpClient over Boost.Beast
 *
 * One TCP connection per request ("Connection: close"), plain HTTP/1.1.
 * A single steady_timer bounds the whole exchange; on expiry the resolver
 * and socket are cancelled and the result is HttpErrorKind::Timeout.
 *
 * Must be driven by a single-threaded io_context.
 */
class BeastHttpClient : public HttpClient {
public:
  explicit BeastHttpClient(boost::asio::io_context &io_context);

  BeastHttpClient(const BeastHttpClient&) = delete;
  BeastHttpClient& operator=(const BeastHttpClient&) = delete;

  void async_request(const HttpRequest &request,
                     std::chrono::milliseconds timeout,
                     HttpCallback callback) override;

private:
  boost::asio::io_context &io_context_;
};

/**
 * TcpReachabilityProbe - ReachabilityProbe via asynchronous TCP connect
 *
 * A peer is reachable if a TCP handshake to host:port completes within the
 * probe timeout. The socket is closed straight away.
 */
class TcpReachabilityProbe : public ReachabilityProbe {
public:
  explicit TcpReachabilityProbe(boost::asio::io_context &io_context,
                                std::chrono::milliseconds timeout = DEFAULT_PROBE_TIMEOUT);

  TcpReachabilityProbe(const TcpReachabilityProbe&) = delete;
  TcpReachabilityProbe& operator=(const TcpReachabilityProbe&) = delete;

  void async_probe(const std::string &host, uint16_t port,
                   ProbeCallback callback) override;

  std::chrono::milliseconds timeout() const { return timeout_; }

private:
  boost::asio::io_context &io_context_;
  std::chrono::milliseconds timeout_;
};

} // namespace network
} // namespace courier
