// Copyright (c) 2025 The Courier Developers
// Distributed under the MIT software license

#include "network/request_dispatcher.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include <stdexcept>

namespace courier {
namespace network {

using json = nlohmann::json;

const char *DispatchErrorName(DispatchError error) {
  switch (error) {
  case DispatchError::None:
    return "none";
  case DispatchError::Timeout:
    return "timeout";
  case DispatchError::ConnectionError:
    return "connection error";
  case DispatchError::HttpStatus:
    return "http status";
  case DispatchError::ParseError:
    return "parse error";
  case DispatchError::NoPeerAvailable:
    return "no peer available";
  case DispatchError::AllPeersExhausted:
    return "all peers exhausted";
  }
  return "unknown";
}

RequestSpec RequestSpec::Get(std::string path, json query) {
  RequestSpec spec;
  spec.method = HttpMethod::Get;
  spec.path = std::move(path);
  spec.query = std::move(query);
  return spec;
}

RequestSpec RequestSpec::Post(std::string path, json body) {
  RequestSpec spec;
  spec.method = HttpMethod::Post;
  spec.path = std::move(path);
  spec.body = std::move(body);
  return spec;
}

// State of one Dispatch() call across its attempts
struct RequestDispatcher::Call {
  RequestSpec spec;
  DispatchCallback callback;
  int attempts{0};
};

RequestDispatcher::RequestDispatcher(PeerSelector &selector,
                                     std::shared_ptr<HttpClient> http,
                                     Config config)
    : selector_(selector), http_(std::move(http)), config_(std::move(config)) {
  if (!http_) {
    throw std::invalid_argument("RequestDispatcher requires an HttpClient");
  }
  if (config_.max_attempts < 1) {
    throw std::invalid_argument("RequestDispatcher max_attempts must be >= 1");
  }
}

std::string RequestDispatcher::BuildTarget(const RequestSpec &spec) {
  std::string path = spec.path;
  while (!path.empty() && path.front() == '/') {
    path.erase(path.begin());
  }

  std::string target = std::string(protocol::API_ROOT) + path;

  if (spec.query.is_object() && !spec.query.empty()) {
    char sep = target.find('?') == std::string::npos ? '?' : '&';
    for (const auto &[key, value] : spec.query.items()) {
      if (value.is_null()) continue;
      const std::string text = value.is_string() ? value.get<std::string>() : value.dump();
      target += sep;
      target += util::UrlEncode(key) + "=" + util::UrlEncode(text);
      sep = '&';
    }
  }
  return target;
}

HttpRequest RequestDispatcher::BuildRequest(const RequestSpec &spec, const Peer &peer) {
  HttpRequest req;
  req.method = spec.method;
  req.host = peer.host;
  req.port = peer.port;
  req.target = BuildTarget(spec);
  req.headers = {{"Accept", protocol::headers::ACCEPT},
                 {"Content-Type", protocol::headers::CONTENT_TYPE}};
  if (!spec.body.is_null()) {
    req.body = spec.body.is_string() ? spec.body.get<std::string>() : spec.body.dump();
  }
  return req;
}

void RequestDispatcher::Dispatch(RequestSpec spec, DispatchCallback callback) {
  auto call = std::make_shared<Call>();
  call->spec = std::move(spec);
  call->callback = std::move(callback);
  Attempt(call);
}

void RequestDispatcher::Attempt(std::shared_ptr<Call> call) {
  ++call->attempts;

  selector_.SelectPeer([this, call](SelectionResult selection) {
    if (!selection.ok()) {
      Fail(call, DispatchError::NoPeerAvailable,
           std::string("peer selection failed: ") + SelectionErrorName(selection.error),
           std::nullopt, std::nullopt);
      return;
    }

    const Peer peer = *selection.peer;
    HttpRequest request = BuildRequest(call->spec, peer);

    LOG_NET_INFO("Sending request on \"{}\" to \"http://{}{}\"", config_.network,
                 peer.ToString(), request.target);

    http_->async_request(request, config_.timeout,
                         [this, call, peer](HttpResult result) {
                           OnResponse(call, peer, std::move(result));
                         });
  });
}

void RequestDispatcher::OnResponse(std::shared_ptr<Call> call, const Peer &peer,
                                   HttpResult result) {
  if (!result.ok()) {
    const auto cause = result.error->kind == HttpErrorKind::Timeout
                           ? DispatchError::Timeout
                           : DispatchError::ConnectionError;
    Fail(call, cause, result.error->message, std::nullopt, peer);
    return;
  }

  const HttpResponse &response = *result.response;
  if (!response.IsSuccess()) {
    Fail(call, DispatchError::HttpStatus,
         "Response code " + std::to_string(response.status) + " from " + peer.ToString(),
         response.status, peer);
    return;
  }

  json parsed;
  try {
    parsed = json::parse(response.body);
  } catch (const json::parse_error &e) {
    Fail(call, DispatchError::ParseError,
         std::string("invalid JSON from ") + peer.ToString() + ": " + e.what(),
         response.status, peer);
    return;
  }

  DispatchResult out;
  out.data = std::move(parsed);
  out.status = response.status;
  out.peer = peer;
  out.attempts = call->attempts;
  auto callback = std::move(call->callback);
  callback(std::move(out));
}

void RequestDispatcher::Fail(std::shared_ptr<Call> call, DispatchError cause,
                             std::string message, std::optional<unsigned> status,
                             std::optional<Peer> peer) {
  LOG_NET_ERROR("{}", message);

  if (call->attempts < config_.max_attempts) {
    Attempt(call);
    return;
  }

  LOG_NET_ERROR("Failed to find a responsive peer after {} tries.", call->attempts);

  DispatchResult out;
  out.error = DispatchError::AllPeersExhausted;
  out.last_cause = cause;
  out.message = std::move(message);
  out.status = status;
  out.peer = std::move(peer);
  out.attempts = call->attempts;
  auto callback = std::move(call->callback);
  callback(std::move(out));
}

} // namespace network
} // namespace courier
