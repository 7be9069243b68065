// Unit tests for network presets and milestone resolution
#include <catch2/catch_test_macros.hpp>
#include "chain/network_params.hpp"
#include <stdexcept>

using namespace courier::chain;

TEST_CASE("NetworkParams - presets", "[chain][params]") {
    SECTION("All presets resolve by name") {
        for (const char* name : {"mainnet", "devnet", "testnet", "unitnet"}) {
            auto params = NetworkParams::FromName(name);
            REQUIRE(params);
            CHECK(params->Name() == name);
            CHECK(params->GetDefaultApiPort() == 4003);
            CHECK_FALSE(params->FixedSeeds().empty());
            CHECK_FALSE(params->Milestones().empty());
        }
    }

    SECTION("Unknown name throws") {
        REQUIRE_THROWS_AS(NetworkParams::FromName("moonnet"), std::invalid_argument);
    }

    SECTION("Devnet activates aip11 at its milestone") {
        auto devnet = NetworkParams::CreateDevNet();
        CHECK_FALSE(devnet->GetMilestone(1).aip11);
        CHECK_FALSE(devnet->GetMilestone(2921999).aip11);
        CHECK(devnet->GetMilestone(2922000).aip11);
        CHECK(devnet->GetMilestone(5000000).aip11);
    }

    SECTION("Unitnet has aip11 from genesis") {
        CHECK(NetworkParams::CreateUnitNet()->GetMilestone(1).aip11);
    }
}

TEST_CASE("NetworkParams - milestone merging", "[chain][params]") {
    auto params = NetworkParams::Custom(
        "custom", 4103, {"127.0.0.1:4103"},
        {
            {1, 8, 51, false},
            {10, 4, std::nullopt, std::nullopt},
            {20, std::nullopt, 53, true},
        });

    SECTION("Later milestones inherit unset fields") {
        const auto& m10 = params->GetMilestone(10);
        CHECK(m10.height == 10);
        CHECK(m10.blocktime == 4);
        CHECK(m10.active_delegates == 51);
        CHECK_FALSE(m10.aip11);

        const auto& m20 = params->GetMilestone(25);
        CHECK(m20.height == 20);
        CHECK(m20.blocktime == 4);
        CHECK(m20.active_delegates == 53);
        CHECK(m20.aip11);
    }

    SECTION("Height resolves to greatest activation at or below it") {
        CHECK(params->GetMilestone(9).height == 1);
        CHECK(params->GetMilestone(19).height == 10);
        CHECK(params->GetMilestone(20).height == 20);
    }

    SECTION("Heights before the first activation use the first milestone") {
        CHECK(params->GetMilestone(0).height == 1);
        CHECK(params->GetMilestone(-5).blocktime == 8);
    }
}

TEST_CASE("NetworkParams - invalid schedules", "[chain][params]") {
    SECTION("Out of order heights") {
        REQUIRE_THROWS_AS(NetworkParams::Custom("bad", 1, {}, {{10, 8, 51, false}, {5, 8, 51, false}}),
                          std::invalid_argument);
    }

    SECTION("Non-positive blocktime") {
        REQUIRE_THROWS_AS(NetworkParams::Custom("bad", 1, {}, {{1, 0, 51, false}}),
                          std::invalid_argument);
    }

    SECTION("Empty schedule cannot resolve milestones") {
        auto empty = NetworkParams::Custom("empty", 1, {}, {});
        REQUIRE_THROWS_AS(empty->GetMilestone(1), std::logic_error);
    }
}
