// Copyright (c) 2025 The Courier Developers
// Distributed under the MIT software license

#include "network/real_transport.hpp"
#include "network/peer.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace courier {
namespace network {

namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

const char *HttpMethodName(HttpMethod method) {
  switch (method) {
  case HttpMethod::Get:
    return "GET";
  case HttpMethod::Post:
    return "POST";
  }
  return "UNKNOWN";
}

std::string HostHeader(const HttpRequest &request) {
  return Peer{request.host, request.port}.ToString();
}

namespace {

// ============================================================================
// HttpExchange - state of one in-flight request
// ============================================================================

class HttpExchange : public std::enable_shared_from_this<HttpExchange> {
public:
  HttpExchange(boost::asio::io_context &io_context, HttpCallback callback)
      : resolver_(io_context), stream_(io_context), deadline_(io_context),
        callback_(std::move(callback)) {}

  void start(const HttpRequest &request, std::chrono::milliseconds timeout) {
    req_.version(11);
    req_.method(request.method == HttpMethod::Post ? http::verb::post
                                                   : http::verb::get);
    req_.target(request.target);
    req_.set(http::field::host, HostHeader(request));
    req_.set(http::field::user_agent, GetUserAgent());
    req_.set(http::field::connection, "close");
    for (const auto &[name, value] : request.headers) {
      req_.set(name, value);
    }
    if (request.method == HttpMethod::Post || !request.body.empty()) {
      req_.body() = request.body;
      req_.prepare_payload();
    }

    deadline_.expires_after(timeout);
    deadline_.async_wait([self = shared_from_this(), timeout](const boost::system::error_code &ec) {
      if (ec == boost::asio::error::operation_aborted || self->done_) {
        return;
      }
      self->resolver_.cancel();
      beast::error_code ignored;
      self->stream_.socket().close(ignored);
      self->finish(HttpResult::Fail(
          HttpErrorKind::Timeout,
          "request timed out after " + std::to_string(timeout.count()) + " ms"));
    });

    resolver_.async_resolve(
        request.host, std::to_string(request.port),
        [self = shared_from_this()](const beast::error_code &ec,
                                    tcp::resolver::results_type results) {
          self->on_resolve(ec, std::move(results));
        });
  }

private:
  void on_resolve(const beast::error_code &ec, tcp::resolver::results_type results) {
    if (done_) return;
    if (ec) {
      finish(HttpResult::Fail(HttpErrorKind::Resolve, "resolve failed: " + ec.message()));
      return;
    }
    stream_.async_connect(
        results, [self = shared_from_this()](const beast::error_code &ec,
                                             const tcp::endpoint &) {
          self->on_connect(ec);
        });
  }

  void on_connect(const beast::error_code &ec) {
    if (done_) return;
    if (ec) {
      finish(HttpResult::Fail(HttpErrorKind::Connection, "connect failed: " + ec.message()));
      return;
    }
    http::async_write(stream_, req_,
                      [self = shared_from_this()](const beast::error_code &ec, std::size_t) {
                        self->on_write(ec);
                      });
  }

  void on_write(const beast::error_code &ec) {
    if (done_) return;
    if (ec) {
      finish(HttpResult::Fail(HttpErrorKind::Connection, "write failed: " + ec.message()));
      return;
    }
    http::async_read(stream_, buffer_, res_,
                     [self = shared_from_this()](const beast::error_code &ec, std::size_t) {
                       self->on_read(ec);
                     });
  }

  void on_read(const beast::error_code &ec) {
    if (done_) return;
    if (ec) {
      finish(HttpResult::Fail(HttpErrorKind::Connection, "read failed: " + ec.message()));
      return;
    }

    beast::error_code ignored;
    stream_.socket().shutdown(tcp::socket::shutdown_both, ignored);

    HttpResponse response;
    response.status = res_.result_int();
    response.body = std::move(res_.body());
    finish(HttpResult::Ok(std::move(response)));
  }

  void finish(HttpResult result) {
    if (done_) return;
    done_ = true;
    deadline_.cancel();
    auto callback = std::move(callback_);
    callback(std::move(result));
  }

  tcp::resolver resolver_;
  beast::tcp_stream stream_;
  boost::asio::steady_timer deadline_;
  beast::flat_buffer buffer_;
  http::request<http::string_body> req_;
  http::response<http::string_body> res_;
  HttpCallback callback_;
  bool done_{false};
};

// ============================================================================
// ProbeAttempt - state of one in-flight reachability probe
// ============================================================================

class ProbeAttempt : public std::enable_shared_from_this<ProbeAttempt> {
public:
  ProbeAttempt(boost::asio::io_context &io_context, ProbeCallback callback)
      : resolver_(io_context), socket_(io_context), timer_(io_context),
        callback_(std::move(callback)) {}

  void start(const std::string &host, uint16_t port, std::chrono::milliseconds timeout) {
    timer_.expires_after(timeout);
    timer_.async_wait([self = shared_from_this()](const boost::system::error_code &ec) {
      if (ec == boost::asio::error::operation_aborted || self->done_) {
        return;
      }
      self->resolver_.cancel();
      boost::system::error_code ignored;
      self->socket_.close(ignored);
      self->finish(false);
    });

    resolver_.async_resolve(
        host, std::to_string(port),
        [self = shared_from_this()](const boost::system::error_code &ec,
                                    tcp::resolver::results_type results) {
          if (self->done_) return;
          if (ec) {
            self->finish(false);
            return;
          }
          boost::asio::async_connect(
              self->socket_, results,
              [self](const boost::system::error_code &ec, const tcp::endpoint &) {
                if (self->done_) return;
                boost::system::error_code ignored;
                self->socket_.close(ignored);
                self->finish(!ec);
              });
        });
  }

private:
  void finish(bool reachable) {
    if (done_) return;
    done_ = true;
    timer_.cancel();
    auto callback = std::move(callback_);
    callback(reachable);
  }

  tcp::resolver resolver_;
  tcp::socket socket_;
  boost::asio::steady_timer timer_;
  ProbeCallback callback_;
  bool done_{false};
};

} // namespace

// ============================================================================
// BeastHttpClient
// ============================================================================

BeastHttpClient::BeastHttpClient(boost::asio::io_context &io_context)
    : io_context_(io_context) {}

void BeastHttpClient::async_request(const HttpRequest &request,
                                    std::chrono::milliseconds timeout,
                                    HttpCallback callback) {
  LOG_NET_TRACE("{} http://{}:{}{}", HttpMethodName(request.method), request.host,
                request.port, request.target);
  auto exchange = std::make_shared<HttpExchange>(io_context_, std::move(callback));
  exchange->start(request, timeout);
}

// ============================================================================
// TcpReachabilityProbe
// ============================================================================

TcpReachabilityProbe::TcpReachabilityProbe(boost::asio::io_context &io_context,
                                           std::chrono::milliseconds timeout)
    : io_context_(io_context), timeout_(timeout) {}

void TcpReachabilityProbe::async_probe(const std::string &host, uint16_t port,
                                       ProbeCallback callback) {
  auto attempt = std::make_shared<ProbeAttempt>(io_context_, std::move(callback));
  attempt->start(host, port, timeout_);
}

} // namespace network
} // namespace courier
