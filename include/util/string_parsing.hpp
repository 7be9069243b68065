// Copyright (c) 2025 The Courier Developers
// Distributed under the MIT software license

#pragma once

/*
 String Parsing Utilities

 Purpose:
 - Safe parsing of untrusted strings (CLI arguments, peer lists) to numeric
   types and network endpoints
 - URL helpers for building API request targets

 All parsing functions validate that the entire input is consumed and return
 std::nullopt on any error (they never throw).
*/

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace courier {
namespace util {

/**
 * Parse integer string with bounds checking
 *
 * @param str String to parse
 * @param min Minimum allowed value (inclusive)
 * @param max Maximum allowed value (inclusive)
 * @return Parsed integer or std::nullopt if invalid
 *
 * Examples:
 *   SafeParseInt("42", 0, 100) -> 42
 *   SafeParseInt("999", 0, 100) -> std::nullopt (out of range)
 *   SafeParseInt("42x", 0, 100) -> std::nullopt (trailing chars)
 */
std::optional<int> SafeParseInt(const std::string& str, int min, int max);

/**
 * Parse port number string (1-65535)
 *
 * Examples:
 *   SafeParsePort("4003") -> 4003
 *   SafeParsePort("0") -> std::nullopt (port 0 invalid)
 *   SafeParsePort("99999") -> std::nullopt (out of range)
 */
std::optional<uint16_t> SafeParsePort(const std::string& str);

/**
 * Split "host:port" into its parts
 *
 * Bracketed IPv6 literals are accepted ("[::1]:4003" -> {"::1", 4003}).
 *
 * Examples:
 *   SplitHostPort("10.0.0.1:4003") -> {"10.0.0.1", 4003}
 *   SplitHostPort("10.0.0.1") -> std::nullopt (no port)
 *   SplitHostPort(":4003") -> std::nullopt (no host)
 */
std::optional<std::pair<std::string, uint16_t>> SplitHostPort(const std::string& str);

// Components of a plain http:// URL
struct HttpUrl {
  std::string host;
  uint16_t port{80};
  std::string target{"/"}; // path plus optional query, always starts with '/'
};

/**
 * Parse a plain http:// URL
 *
 * Examples:
 *   ParseHttpUrl("http://1.2.3.4:4003/api/peers") -> {"1.2.3.4", 4003, "/api/peers"}
 *   ParseHttpUrl("http://node.example") -> {"node.example", 80, "/"}
 *   ParseHttpUrl("https://node.example") -> std::nullopt (TLS not supported)
 */
std::optional<HttpUrl> ParseHttpUrl(const std::string& url);

// True if the string looks like an http:// URL rather than a network name
bool IsHttpUrl(const std::string& str);

/**
 * Percent-encode a query component (RFC 3986 unreserved characters are kept)
 *
 * Example:
 *   UrlEncode("a b&c") -> "a%20b%26c"
 */
std::string UrlEncode(const std::string& str);

} // namespace util
} // namespace courier
