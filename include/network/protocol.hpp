// Copyright (c) 2025 The Courier Developers
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>

namespace courier {
namespace protocol {

// Request headers sent with every API call (public API v2)
namespace headers {
constexpr const char *ACCEPT = "application/vnd.core-api.v2+json";
constexpr const char *CONTENT_TYPE = "application/json";
} // namespace headers

// Plugin a peer must advertise in its "ports" map to serve the public API
constexpr const char *CORE_API_PLUGIN = "core-api";

// Every API path is rooted here: http://host:port/api/<path>
constexpr const char *API_ROOT = "/api/";

// Endpoints used by the client itself
namespace paths {
constexpr const char *PEERS = "peers";           // peer list (discovery)
constexpr const char *BLOCKCHAIN = "blockchain"; // chain height (milestone watcher)
} // namespace paths

// Timeout for one API request (resolve + connect + write + read)
constexpr auto REQUEST_TIMEOUT = std::chrono::milliseconds(3000);

// Total attempts per dispatched request; each attempt re-selects a peer
constexpr int MAX_REQUEST_ATTEMPTS = 3;

// Default maximum peer latency accepted from discovery
constexpr int DEFAULT_MAX_LATENCY_MS = 300;

} // namespace protocol
} // namespace courier
