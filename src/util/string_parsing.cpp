// Copyright (c) 2025 The Courier Developers
// Distributed under the MIT software license

#include "util/string_parsing.hpp"
#include <cctype>
#include <stdexcept>

namespace courier {
namespace util {

namespace {

// Shared core for the integer parsers: rejects empty input, leading
// whitespace and trailing garbage.
std::optional<long long> ParseWholeInteger(const std::string& str) {
  if (str.empty() || std::isspace(static_cast<unsigned char>(str[0]))) {
    return std::nullopt;
  }

  try {
    size_t pos = 0;
    long long value = std::stoll(str, &pos);
    if (pos != str.size()) {
      return std::nullopt;
    }
    return value;
  } catch (const std::invalid_argument&) {
    return std::nullopt;
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

} // namespace

std::optional<int> SafeParseInt(const std::string& str, int min, int max) {
  auto value = ParseWholeInteger(str);
  if (!value || *value < min || *value > max) {
    return std::nullopt;
  }
  return static_cast<int>(*value);
}

std::optional<uint16_t> SafeParsePort(const std::string& str) {
  auto value = ParseWholeInteger(str);
  if (!value || *value < 1 || *value > 65535) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(*value);
}

std::optional<std::pair<std::string, uint16_t>> SplitHostPort(const std::string& str) {
  std::string host;
  std::string port_str;

  if (!str.empty() && str.front() == '[') {
    // [v6]:port
    size_t close = str.find(']');
    if (close == std::string::npos || close + 1 >= str.size() || str[close + 1] != ':') {
      return std::nullopt;
    }
    host = str.substr(1, close - 1);
    port_str = str.substr(close + 2);
  } else {
    size_t colon = str.rfind(':');
    if (colon == std::string::npos) {
      return std::nullopt;
    }
    host = str.substr(0, colon);
    port_str = str.substr(colon + 1);
    // Unbracketed IPv6 is ambiguous
    if (host.find(':') != std::string::npos) {
      return std::nullopt;
    }
  }

  if (host.empty()) {
    return std::nullopt;
  }

  auto port = SafeParsePort(port_str);
  if (!port) {
    return std::nullopt;
  }
  return std::make_pair(host, *port);
}

bool IsHttpUrl(const std::string& str) {
  return str.rfind("http://", 0) == 0;
}

std::optional<HttpUrl> ParseHttpUrl(const std::string& url) {
  if (!IsHttpUrl(url)) {
    return std::nullopt;
  }

  std::string rest = url.substr(7);
  HttpUrl out;

  size_t slash = rest.find('/');
  std::string authority = rest.substr(0, slash);
  if (slash != std::string::npos) {
    out.target = rest.substr(slash);
  }

  if (authority.empty()) {
    return std::nullopt;
  }

  bool has_port = authority.front() == '['
                      ? authority.find("]:") != std::string::npos
                      : authority.find(':') != std::string::npos;
  if (has_port) {
    auto host_port = SplitHostPort(authority);
    if (!host_port) {
      return std::nullopt;
    }
    out.host = host_port->first;
    out.port = host_port->second;
  } else {
    if (authority.front() == '[') {
      if (authority.back() != ']') {
        return std::nullopt;
      }
      authority = authority.substr(1, authority.size() - 2);
    }
    out.host = authority;
  }

  if (out.host.empty()) {
    return std::nullopt;
  }
  return out;
}

std::string UrlEncode(const std::string& str) {
  static constexpr char kHex[] = "0123456789ABCDEF";

  std::string out;
  out.reserve(str.size());
  for (unsigned char c : str) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0F]);
    }
  }
  return out;
}

} // namespace util
} // namespace courier
