// Copyright (c) 2025 The DeviceLink Developers
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "device/device_context.hpp"
#include "device/rate_limit_coordinator.hpp"
#include "infra/mock_connection_adapter.hpp"
#include "infra/mock_inventory_store.hpp"
#include "stats/message_intelligence_agency.hpp"

using namespace devicelink;
using namespace devicelink::device;

TEST_CASE("RateLimitCoordinator::ComputeLimit", "[device][ratelimit]") {
    SECTION("Quota 1000 shared by 1, 5 and 20 sessions") {
        REQUIRE(RateLimitCoordinator::ComputeLimit(1000, 1) == 1000);
        REQUIRE(RateLimitCoordinator::ComputeLimit(1000, 5) == 200);
        // 1000 / 20 = 50, raised to the floor
        REQUIRE(RateLimitCoordinator::ComputeLimit(1000, 20) == 100);
    }

    SECTION("Empty registry yields no limit") {
        REQUIRE(RateLimitCoordinator::ComputeLimit(1000, 0) == 0);
    }

    SECTION("Default quota") {
        REQUIRE(RateLimitCoordinator::ComputeLimit(64000, 3) == 21333);
        REQUIRE(RateLimitCoordinator::ComputeLimit(64000, 1000) == 100);
    }
}

TEST_CASE("RateLimitCoordinator::Broadcast applies limit and watermarks", "[device][ratelimit]") {
    test::MockInventoryStore store;
    stats::MessageIntelligenceAgency spy;

    std::vector<DeviceContextPtr> sessions;
    for (uint64_t dpid = 1; dpid <= 5; ++dpid) {
        auto conn = test::MakeConnection(dpid);
        sessions.push_back(std::make_shared<DeviceContext>(conn.context, store, spy, false));
    }

    REQUIRE(RateLimitCoordinator::Broadcast(sessions, 1000) == 200);
    for (const auto& s : sessions) {
        REQUIRE(s->packet_in_rate_limit() == 200);
        REQUIRE(s->packet_in_limiter().low_watermark() == 100);
        REQUIRE(s->packet_in_limiter().high_watermark() == 160);
    }

    REQUIRE(RateLimitCoordinator::Broadcast({}, 1000) == 0);
}
