// Copyright (c) 2025 The Courier Developers
// Distributed under the MIT software license
// Tests for RequestDispatcher (request building, failover, bounded retries)

#include <catch2/catch_test_macros.hpp>
#include "infra/mock_peer_discovery.hpp"
#include "infra/mock_transport.hpp"
#include "network/request_dispatcher.hpp"
#include "util/logging.hpp"
#include <boost/asio/io_context.hpp>
#include <sstream>
#include <spdlog/sinks/ostream_sink.h>

using namespace courier;
using namespace courier::network;
using namespace courier::test;
using namespace std::chrono_literals;
using json = nlohmann::json;

namespace {

const Peer P1{"10.0.0.1", 4003};
const Peer P2{"10.0.0.2", 4003};

PeerSelector::Config ExplicitPeer(const Peer& peer) {
    PeerSelector::Config config;
    config.explicit_peer = peer;
    return config;
}

RequestDispatcher::Config Devnet() {
    RequestDispatcher::Config config;
    config.network = "devnet";
    return config;
}

DispatchResult RunDispatch(boost::asio::io_context& io, RequestDispatcher& dispatcher,
                           RequestSpec spec) {
    DispatchResult out;
    bool called = false;
    dispatcher.Dispatch(std::move(spec), [&](DispatchResult r) {
        called = true;
        out = std::move(r);
    });
    CHECK_FALSE(called);  // never inline
    io.run();
    io.restart();
    REQUIRE(called);
    return out;
}

size_t CountLines(const std::string& logs, const std::string& needle) {
    size_t n = 0;
    std::istringstream in(logs);
    std::string line;
    while (std::getline(in, line)) {
        if (line.find(needle) != std::string::npos) ++n;
    }
    return n;
}

// Attach a temporary sink to the network logger for the lifetime of the object
class NetworkLogCapture {
public:
    explicit NetworkLogCapture(spdlog::level::level_enum level)
        : logger_(util::LogManager::GetLogger("network")), old_level_(logger_->level()) {
        logger_->set_level(level);
        sink_ = std::make_shared<spdlog::sinks::ostream_sink_mt>(oss_);
        sink_->set_level(level);
        sink_->set_pattern("%l|%v");
        logger_->sinks().push_back(sink_);
    }

    ~NetworkLogCapture() {
        logger_->sinks().pop_back();
        logger_->set_level(old_level_);
    }

    std::string str() const { return oss_.str(); }

private:
    std::shared_ptr<spdlog::logger> logger_;
    spdlog::level::level_enum old_level_;
    std::ostringstream oss_;
    std::shared_ptr<spdlog::sinks::ostream_sink_mt> sink_;
};

} // namespace

TEST_CASE("RequestDispatcher - request construction", "[network][dispatcher]") {
    SECTION("GET target with encoded query") {
        auto spec = RequestSpec::Get("wallets/search", {{"address", "D 1&x"}, {"page", 2},
                                                        {"skip", nullptr}});
        auto req = RequestDispatcher::BuildRequest(spec, P1);

        CHECK(req.method == HttpMethod::Get);
        CHECK(req.host == "10.0.0.1");
        CHECK(req.port == 4003);
        CHECK(req.target == "/api/wallets/search?address=D%201%26x&page=2");
        CHECK(req.body.empty());
    }

    SECTION("Leading slashes are stripped from the path") {
        CHECK(RequestDispatcher::BuildTarget(RequestSpec::Get("//blockchain")) ==
              "/api/blockchain");
    }

    SECTION("Versioned API headers are always present") {
        auto req = RequestDispatcher::BuildRequest(RequestSpec::Get("blockchain"), P1);
        std::map<std::string, std::string> headers(req.headers.begin(), req.headers.end());
        CHECK(headers["Accept"] == "application/vnd.core-api.v2+json");
        CHECK(headers["Content-Type"] == "application/json");
    }

    SECTION("POST bodies: JSON dumped, strings verbatim") {
        auto json_req = RequestDispatcher::BuildRequest(
            RequestSpec::Post("transactions", {{"transactions", json::array()}}), P1);
        CHECK(json_req.method == HttpMethod::Post);
        CHECK(json::parse(json_req.body) == json{{"transactions", json::array()}});

        auto raw_req = RequestDispatcher::BuildRequest(
            RequestSpec::Post("transactions", "{\"raw\":true}"), P1);
        CHECK(raw_req.body == "{\"raw\":true}");
    }
}

TEST_CASE("RequestDispatcher - successful GET", "[network][dispatcher]") {
    boost::asio::io_context io;
    auto http = std::make_shared<MockHttpClient>(io);
    http->Route(P1.host, P1.port, "/api/blockchain", JsonResponse(HeightBody(42)));

    PeerSelector selector(io, nullptr, nullptr, ExplicitPeer(P1));
    RequestDispatcher dispatcher(selector, http, Devnet());

    auto result = RunDispatch(io, dispatcher, RequestSpec::Get("blockchain"));

    REQUIRE(result.ok());
    CHECK((*result.data)["data"]["block"]["height"] == 42);
    CHECK(result.error == DispatchError::None);
    CHECK(result.attempts == 1);
    CHECK(*result.peer == P1);
    CHECK(result.status == 200u);

    REQUIRE(http->recorded().size() == 1);
    CHECK(http->recorded()[0].timeout == 3000ms);
}

TEST_CASE("RequestDispatcher - POST echo", "[network][dispatcher]") {
    boost::asio::io_context io;
    auto http = std::make_shared<MockHttpClient>(io);
    http->Route(P1.host, P1.port, "/api/transactions", [](const HttpRequest& req) {
        if (req.method != HttpMethod::Post) return TextResponse("", 405);
        return JsonResponse(json{{"echo", json::parse(req.body)}});
    });

    PeerSelector selector(io, nullptr, nullptr, ExplicitPeer(P1));
    RequestDispatcher dispatcher(selector, http, Devnet());

    json body{{"transactions", {{{"amount", 1}, {"fee", "0.1"}}}}};
    auto result = RunDispatch(io, dispatcher, RequestSpec::Post("transactions", body));

    REQUIRE(result.ok());
    CHECK((*result.data)["echo"] == body);
}

TEST_CASE("RequestDispatcher - empty JSON document is a success", "[network][dispatcher]") {
    boost::asio::io_context io;
    auto http = std::make_shared<MockHttpClient>(io);
    http->Route(P1.host, P1.port, "/api/", TextResponse("{}"));

    PeerSelector selector(io, nullptr, nullptr, ExplicitPeer(P1));
    RequestDispatcher dispatcher(selector, http, Devnet());

    auto result = RunDispatch(io, dispatcher, RequestSpec::Get("node/status"));
    REQUIRE(result.ok());
    CHECK(result.data->empty());
}

TEST_CASE("RequestDispatcher - exactly three attempts against a dead peer", "[network][dispatcher]") {
    boost::asio::io_context io;
    auto http = std::make_shared<MockHttpClient>(io);  // everything refused

    PeerSelector selector(io, nullptr, nullptr, ExplicitPeer(P1));
    RequestDispatcher dispatcher(selector, http, Devnet());

    NetworkLogCapture capture(spdlog::level::info);
    auto result = RunDispatch(io, dispatcher, RequestSpec::Get("blockchain"));
    auto logs = capture.str();

    REQUIRE_FALSE(result.ok());
    CHECK(result.error == DispatchError::AllPeersExhausted);
    CHECK(result.last_cause == DispatchError::ConnectionError);
    CHECK(result.attempts == 3);
    CHECK(*result.peer == P1);
    CHECK(http->CountTo(P1.host, P1.port, "/api/blockchain") == 3);

    // One error per failed attempt plus the final summary
    CHECK(CountLines(logs, "error|") == 4);
    CHECK(CountLines(logs, "Failed to find a responsive peer after 3 tries.") == 1);
    CHECK(CountLines(logs, "info|Sending request on \"devnet\" to \"http://10.0.0.1:4003/api/blockchain\"") == 3);
}

TEST_CASE("RequestDispatcher - failure causes", "[network][dispatcher]") {
    boost::asio::io_context io;
    auto http = std::make_shared<MockHttpClient>(io);
    PeerSelector selector(io, nullptr, nullptr, ExplicitPeer(P1));
    RequestDispatcher dispatcher(selector, http, Devnet());

    SECTION("Timeout") {
        http->Route(P1.host, P1.port, "/", TimedOut());
        auto result = RunDispatch(io, dispatcher, RequestSpec::Get("blockchain"));
        CHECK(result.last_cause == DispatchError::Timeout);
        CHECK(result.attempts == 3);
    }

    SECTION("Non-2xx status") {
        http->Route(P1.host, P1.port, "/", TextResponse("{\"error\":\"nope\"}", 404));
        auto result = RunDispatch(io, dispatcher, RequestSpec::Get("wallets/none"));
        CHECK(result.error == DispatchError::AllPeersExhausted);
        CHECK(result.last_cause == DispatchError::HttpStatus);
        CHECK(result.status == 404u);
        CHECK(result.message.find("404") != std::string::npos);
    }

    SECTION("Body that is not JSON") {
        http->Route(P1.host, P1.port, "/", TextResponse("<html>"));
        auto result = RunDispatch(io, dispatcher, RequestSpec::Get("blockchain"));
        CHECK(result.last_cause == DispatchError::ParseError);
        CHECK(std::string(DispatchErrorName(result.error)) == "all peers exhausted");
    }
}

TEST_CASE("RequestDispatcher - failover re-selects the peer", "[network][dispatcher]") {
    boost::asio::io_context io;
    auto http = std::make_shared<MockHttpClient>(io);
    http->Route(P1.host, P1.port, "/", Refused());
    http->Route(P2.host, P2.port, "/api/blockchain", JsonResponse(HeightBody(7)));

    // First selection can only find P1, later ones only P2
    auto discovery = std::make_shared<MockPeerDiscovery>(io);
    discovery->Script({{P1}, {P2}});
    auto probe = std::make_shared<MockReachabilityProbe>(io, true);

    PeerSelector::Config selector_config;
    selector_config.base_backoff = 1ms;
    PeerSelector selector(io, discovery, probe, selector_config);
    RequestDispatcher dispatcher(selector, http, Devnet());

    auto result = RunDispatch(io, dispatcher, RequestSpec::Get("blockchain"));

    REQUIRE(result.ok());
    CHECK(*result.peer == P2);
    CHECK(result.attempts == 2);
    CHECK(discovery->calls() == 2);
    CHECK(http->CountTo(P1.host, P1.port) == 1);
    CHECK(http->CountTo(P2.host, P2.port) == 1);
}

TEST_CASE("RequestDispatcher - selection failures consume attempts", "[network][dispatcher]") {
    boost::asio::io_context io;
    auto http = std::make_shared<MockHttpClient>(io);
    auto discovery = std::make_shared<MockPeerDiscovery>(io);  // no candidates at all
    auto probe = std::make_shared<MockReachabilityProbe>(io, true);

    PeerSelector selector(io, discovery, probe);
    RequestDispatcher dispatcher(selector, http, Devnet());

    auto result = RunDispatch(io, dispatcher, RequestSpec::Get("blockchain"));

    REQUIRE_FALSE(result.ok());
    CHECK(result.error == DispatchError::AllPeersExhausted);
    CHECK(result.last_cause == DispatchError::NoPeerAvailable);
    CHECK_FALSE(result.peer.has_value());
    CHECK(result.attempts == 3);
    CHECK(discovery->calls() == 3);
    CHECK(http->recorded().empty());
}

TEST_CASE("RequestDispatcher - configuration", "[network][dispatcher]") {
    boost::asio::io_context io;
    auto http = std::make_shared<MockHttpClient>(io);
    PeerSelector selector(io, nullptr, nullptr, ExplicitPeer(P1));

    SECTION("Defaults") {
        RequestDispatcher dispatcher(selector, http);
        CHECK(dispatcher.config().max_attempts == 3);
        CHECK(dispatcher.config().timeout == 3000ms);
    }

    SECTION("Custom attempt count") {
        auto config = Devnet();
        config.max_attempts = 5;
        RequestDispatcher dispatcher(selector, http, config);
        auto result = RunDispatch(io, dispatcher, RequestSpec::Get("blockchain"));
        CHECK(result.attempts == 5);
        CHECK(http->recorded().size() == 5);
    }

    SECTION("Invalid arguments") {
        REQUIRE_THROWS_AS(RequestDispatcher(selector, nullptr), std::invalid_argument);
        auto config = Devnet();
        config.max_attempts = 0;
        REQUIRE_THROWS_AS(RequestDispatcher(selector, http, config), std::invalid_argument);
    }
}
