// Copyright (c) 2025 The Courier Developers
// Distributed under the MIT software license
// Tests for MilestoneWatcher polling and cancellation

#include <catch2/catch_test_macros.hpp>
#include "infra/mock_peer_discovery.hpp"
#include "infra/mock_transport.hpp"
#include "network/milestone_watcher.hpp"
#include <boost/asio/io_context.hpp>

using namespace courier;
using namespace courier::network;
using namespace courier::test;
using namespace std::chrono_literals;
using json = nlohmann::json;

namespace {

const Peer P1{"10.0.0.1", 4003};

// aip11 activates at height 100, blocks every 8s before and 4s after
std::unique_ptr<chain::NetworkParams> WatchParams() {
    return chain::NetworkParams::Custom("watchnet", 4003, {"10.0.0.1:4003"},
                                        {{1, 8, 51, false}, {100, 4, std::nullopt, true}});
}

struct Fixture {
    boost::asio::io_context io;
    std::shared_ptr<MockHttpClient> http = std::make_shared<MockHttpClient>(io);
    chain::NetworkConfigManager config_manager;
    PeerSelector::Config selector_config;
    std::unique_ptr<PeerSelector> selector;
    std::unique_ptr<RequestDispatcher> dispatcher;

    Fixture() {
        config_manager.SetParams(WatchParams());
        selector_config.explicit_peer = P1;
        selector = std::make_unique<PeerSelector>(io, nullptr, nullptr, selector_config);
        dispatcher = std::make_unique<RequestDispatcher>(*selector, http);
    }

    MilestoneWatcher::Config FastWatch() {
        MilestoneWatcher::Config config;
        config.interval_unit = 1ms;
        return config;
    }
};

} // namespace

TEST_CASE("ParseHeight", "[network][watcher]") {
    CHECK(ParseHeight(HeightBody(2922000)) == int64_t{2922000});
    CHECK_FALSE(ParseHeight(json::object()).has_value());
    CHECK_FALSE(ParseHeight(json{{"data", {{"block", {{"height", "12"}}}}}}).has_value());
    CHECK_FALSE(ParseHeight(json{{"data", json::array()}}).has_value());
    CHECK_FALSE(ParseHeight(json::array()).has_value());
}

TEST_CASE("FetchHeight", "[network][watcher]") {
    Fixture f;

    SECTION("Success") {
        f.http->Route(P1.host, P1.port, "/api/blockchain", JsonResponse(HeightBody(77)));
        std::optional<int64_t> height;
        FetchHeight(*f.dispatcher, [&](std::optional<int64_t> h) { height = h; });
        f.io.run();
        CHECK(height == int64_t{77});
    }

    SECTION("Missing height") {
        f.http->Route(P1.host, P1.port, "/api/blockchain", JsonResponse(json{{"data", {}}}));
        bool called = false;
        FetchHeight(*f.dispatcher, [&](std::optional<int64_t> h) {
            called = true;
            CHECK_FALSE(h.has_value());
        });
        f.io.run();
        CHECK(called);
    }
}

TEST_CASE("MilestoneWatcher - polls until the feature activates", "[network][watcher]") {
    Fixture f;
    std::vector<int64_t> heights{10, 50, 120};
    size_t served = 0;
    f.http->Route(P1.host, P1.port, "/api/blockchain", [&](const HttpRequest&) {
        auto h = heights[std::min(served, heights.size() - 1)];
        ++served;
        return JsonResponse(HeightBody(h));
    });

    auto config = f.FastWatch();
    std::optional<int64_t> activated_at;
    config.on_feature_active = [&](int64_t h) { activated_at = h; };
    MilestoneWatcher watcher(f.io, *f.dispatcher, f.config_manager, config);

    watcher.Start();
    CHECK(watcher.IsRunning());
    f.io.run();

    CHECK(watcher.IsFeatureActive());
    CHECK_FALSE(watcher.IsRunning());
    CHECK(watcher.Ticks() == 3);
    CHECK(served == 3);
    CHECK(activated_at == int64_t{120});
    CHECK(f.config_manager.GetHeight() == 120);
    // Last reschedule used the pre-activation block interval
    REQUIRE(watcher.LastInterval().has_value());
    CHECK(*watcher.LastInterval() == 8s);
}

TEST_CASE("MilestoneWatcher - stops at once when already active", "[network][watcher]") {
    Fixture f;
    f.http->Route(P1.host, P1.port, "/api/blockchain", JsonResponse(HeightBody(500)));

    MilestoneWatcher watcher(f.io, *f.dispatcher, f.config_manager, f.FastWatch());
    watcher.Start();
    f.io.run();

    CHECK(watcher.IsFeatureActive());
    CHECK(watcher.Ticks() == 1);
    CHECK_FALSE(watcher.LastInterval().has_value());
    CHECK(f.config_manager.GetMilestone().aip11);
}

TEST_CASE("MilestoneWatcher - failed query reschedules", "[network][watcher]") {
    Fixture f;
    size_t requests = 0;
    f.http->Route(P1.host, P1.port, "/api/blockchain", [&](const HttpRequest&) {
        // The first dispatch burns all three attempts
        return ++requests <= 3 ? Refused() : JsonResponse(HeightBody(150));
    });

    MilestoneWatcher watcher(f.io, *f.dispatcher, f.config_manager, f.FastWatch());
    watcher.Start();
    f.io.run();

    CHECK(requests == 4);
    CHECK(watcher.Ticks() == 2);
    CHECK(watcher.IsFeatureActive());
    REQUIRE(watcher.LastInterval().has_value());
    CHECK(*watcher.LastInterval() == 8s);
    CHECK(f.config_manager.GetHeight() == 150);
}

TEST_CASE("MilestoneWatcher - Stop drops in-flight results", "[network][watcher]") {
    Fixture f;
    MilestoneWatcher* watcher_ptr = nullptr;
    size_t requests = 0;
    f.http->Route(P1.host, P1.port, "/api/blockchain", [&](const HttpRequest&) {
        if (++requests == 2) watcher_ptr->Stop();
        return JsonResponse(HeightBody(10 * static_cast<int64_t>(requests)));
    });

    MilestoneWatcher watcher(f.io, *f.dispatcher, f.config_manager, f.FastWatch());
    watcher_ptr = &watcher;
    watcher.Start();
    f.io.run();

    CHECK(requests == 2);
    CHECK_FALSE(watcher.IsRunning());
    CHECK_FALSE(watcher.IsFeatureActive());
    CHECK(watcher.Ticks() == 1);
    // The second response (height 20) arrived after Stop and was ignored
    CHECK(f.config_manager.GetHeight() == 10);
}

TEST_CASE("MilestoneWatcher - Stop before the first tick", "[network][watcher]") {
    Fixture f;
    f.http->Route(P1.host, P1.port, "/api/blockchain", JsonResponse(HeightBody(10)));

    MilestoneWatcher watcher(f.io, *f.dispatcher, f.config_manager, f.FastWatch());
    watcher.Start();
    watcher.Stop();
    watcher.Stop();
    f.io.run();

    CHECK(f.http->recorded().empty());
    CHECK(watcher.Ticks() == 0);

    SECTION("Restart resumes polling") {
        f.io.restart();
        watcher.Start();
        f.io.run_for(200ms);
        watcher.Stop();
        CHECK(watcher.Ticks() >= 1);
        CHECK(f.config_manager.GetHeight() == 10);
    }
}

TEST_CASE("MilestoneWatcher - Start is idempotent while running", "[network][watcher]") {
    Fixture f;
    f.http->Route(P1.host, P1.port, "/api/blockchain", JsonResponse(HeightBody(100)));

    MilestoneWatcher watcher(f.io, *f.dispatcher, f.config_manager, f.FastWatch());
    watcher.Start();
    watcher.Start();
    f.io.run();

    CHECK(f.http->recorded().size() == 1);
    CHECK(watcher.Ticks() == 1);
}
