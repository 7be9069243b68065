// Copyright (c) 2025 The Courier Developers
// Distributed under the MIT software license

#pragma once

#include "network/peer.hpp"
#include "network/peer_selector.hpp"
#include "network/protocol.hpp"
#include "network/transport.hpp"
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace courier {
namespace network {

// One API call: GET/POST http://<peer>/api/<path>[?query]
struct RequestSpec {
  HttpMethod method{HttpMethod::Get};
  std::string path;                              // Relative to /api/, e.g. "blockchain"
  nlohmann::json query = nlohmann::json::object();
  nlohmann::json body;                           // null = no body; strings are sent verbatim

  static RequestSpec Get(std::string path, nlohmann::json query = nlohmann::json::object());
  static RequestSpec Post(std::string path, nlohmann::json body);
};

enum class DispatchError {
  None,
  Timeout,           // Peer did not answer within the request timeout
  ConnectionError,   // Resolve/connect/read/write failed
  HttpStatus,        // Non-2xx status
  ParseError,        // 2xx with a body that is not JSON
  NoPeerAvailable,   // Selector found no usable peer for this attempt
  AllPeersExhausted  // Every attempt failed; see last_cause
};

const char *DispatchErrorName(DispatchError error);

/**
 * DispatchResult - outcome of RequestDispatcher::Dispatch
 *
 * Success carries the parsed body and the peer that served it. Failure is
 * always AllPeersExhausted with the cause of the final attempt in
 * last_cause, so callers can tell "the peer returned nothing" (ok() with an
 * empty document) from "no peer answered".
 */
struct DispatchResult {
  std::optional<nlohmann::json> data;
  DispatchError error{DispatchError::None};
  DispatchError last_cause{DispatchError::None};
  std::string message;            // Description of the final failure
  std::optional<unsigned> status; // HTTP status of the final attempt, if any
  std::optional<Peer> peer;       // Peer of the final attempt
  int attempts{0};

  bool ok() const { return data.has_value(); }
};

using DispatchCallback = std::function<void(DispatchResult result)>;

/**
 * RequestDispatcher - sends API requests with automatic failover
 *
 * Each attempt re-runs peer selection, builds the URI, sends the request
 * with the versioned API headers and a fixed timeout, and parses the body as
 * JSON. Failures are logged once per attempt. After MAX_REQUEST_ATTEMPTS
 * failed attempts a final error is logged and the result reports
 * AllPeersExhausted. Attempts run strictly one after another; no exclusion
 * set is carried across attempts, so a retry may land on the same peer.
 */
class RequestDispatcher {
public:
  struct Config {
    std::string network;                 // Used in log lines only
    int max_attempts;
    std::chrono::milliseconds timeout;

    Config()
        : max_attempts(protocol::MAX_REQUEST_ATTEMPTS),
          timeout(protocol::REQUEST_TIMEOUT) {}
  };

  RequestDispatcher(PeerSelector &selector, std::shared_ptr<HttpClient> http,
                    Config config = Config{});

  RequestDispatcher(const RequestDispatcher&) = delete;
  RequestDispatcher& operator=(const RequestDispatcher&) = delete;

  // Dispatch a request; the callback is never invoked inline
  void Dispatch(RequestSpec spec, DispatchCallback callback);

  // Build the HTTP request for `spec` against `peer` (exposed for tests)
  static HttpRequest BuildRequest(const RequestSpec &spec, const Peer &peer);

  // Request target: /api/<path>[?k=v&...]
  static std::string BuildTarget(const RequestSpec &spec);

  const Config &config() const { return config_; }

private:
  struct Call;

  void Attempt(std::shared_ptr<Call> call);
  void OnResponse(std::shared_ptr<Call> call, const Peer &peer, HttpResult result);
  void Fail(std::shared_ptr<Call> call, DispatchError cause, std::string message,
            std::optional<unsigned> status, std::optional<Peer> peer);

  PeerSelector &selector_;
  std::shared_ptr<HttpClient> http_;
  Config config_;
};

} // namespace network
} // namespace courier
