// Copyright (c) 2025 The DeviceLink Developers
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "infra/device_manager_fixture.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>

using namespace devicelink;
using namespace devicelink::device;
using namespace devicelink::test;
using namespace std::chrono_literals;

namespace {

class ThrowingInitHandler : public DeviceInitializationPhaseHandler {
public:
    void OnDeviceContextLevelUp(const DeviceContextPtr& context) override {
        seen = context;
        throw std::runtime_error("initialization failure");
    }
    DeviceContextPtr seen;
};

} // namespace

TEST_CASE_METHOD(DeviceManagerFixture, "Admission registers and publishes a device",
                 "[device][admission]") {
    auto& dm = CreateManager();
    auto conn = MakeConnection(1);

    REQUIRE(dm.DeviceConnected(conn.context));
    REQUIRE(dm.device_count() == 1);

    auto ctx = dm.GetDeviceContext("openflow:1");
    REQUIRE(ctx);
    REQUIRE(ctx->state() == DeviceState::Active);
    REQUIRE(ctx->primary_connection() == conn.context);
    REQUIRE(ctx->translator_library() == &translator);
    REQUIRE(ctx->notification_publish_service() == &broker);

    // Inventory record written, node announced
    REQUIRE(store.has_node("openflow:1"));
    REQUIRE(CountNotifications("openflow:1", NotificationKind::NodeUpdated) == 1);

    // Packet-ins filtered from admission until publication
    REQUIRE(conn.adapter->filtering_history() == std::vector<bool>{true, false});

    SECTION("Outbound queue uses the configured barrier settings") {
        REQUIRE(conn.adapter->register_calls() == 1);
        REQUIRE(conn.adapter->max_barrier_count() == 25600);
        REQUIRE(conn.adapter->barrier_interval() == 500ms);
        auto provider = conn.context->outbound_queue_provider();
        REQUIRE(provider);
        REQUIRE(provider->version() == OFP_VERSION_1_3);
        REQUIRE(provider->queue());
    }

    SECTION("Sole device gets the whole quota") {
        REQUIRE(ctx->packet_in_rate_limit() == 64000);
    }
}

TEST_CASE_METHOD(DeviceManagerFixture, "Admission rejects a duplicate identity",
                 "[device][admission]") {
    auto& dm = CreateManager();
    auto first = MakeConnection(7);
    auto second = MakeConnection(7);

    REQUIRE(dm.DeviceConnected(first.context));
    REQUIRE_FALSE(dm.DeviceConnected(second.context));

    // The live session keeps its connection; the newcomer is closed
    REQUIRE(dm.device_count() == 1);
    REQUIRE(dm.GetDeviceContext("openflow:7")->primary_connection() == first.context);
    REQUIRE(second.adapter->close_calls() == 1);
    REQUIRE(first.adapter->close_calls() == 0);
    REQUIRE(second.adapter->register_calls() == 0);
}

TEST_CASE_METHOD(DeviceManagerFixture, "Concurrent admission of one identity has a single winner",
                 "[device][admission]") {
    auto& dm = CreateManager();
    constexpr int kThreads = 8;

    std::vector<MockConnection> connections;
    for (int i = 0; i < kThreads; ++i) {
        connections.push_back(MakeConnection(99));
    }

    std::atomic<int> admitted{0};
    std::atomic<int> rejected{0};
    std::atomic<int> lost_race{0};
    std::atomic<int> winner{-1};
    std::atomic<bool> go{false};
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i]() {
            while (!go.load()) {
                std::this_thread::yield();
            }
            try {
                if (dm.DeviceConnected(connections[i].context)) {
                    admitted.fetch_add(1);
                    winner.store(i);
                } else {
                    rejected.fetch_add(1);
                }
            } catch (const std::logic_error&) {
                lost_race.fetch_add(1);
            }
        });
    }
    go.store(true);
    for (auto& t : threads) {
        t.join();
    }

    REQUIRE(admitted.load() == 1);
    REQUIRE(admitted.load() + rejected.load() + lost_race.load() == kThreads);
    REQUIRE(dm.device_count() == 1);

    const int w = winner.load();
    REQUIRE(w >= 0);
    for (int i = 0; i < kThreads; ++i) {
        if (i == w) {
            continue;
        }
        INFO("connection " << i);
        REQUIRE_FALSE(connections[i].adapter->has_outbound_queue());
    }
    REQUIRE(connections[w].adapter->has_outbound_queue());
    REQUIRE(connections[w].adapter->close_calls() == 0);

    auto context = dm.GetDeviceContext("openflow:99");
    REQUIRE(context);
    REQUIRE(context->primary_connection() == connections[w].context);
    REQUIRE(context->state() == DeviceState::Active);
}

TEST_CASE_METHOD(DeviceManagerFixture, "Admission undoes registration when initialization throws",
                 "[device][admission]") {
    auto& dm = CreateManager();
    ThrowingInitHandler handler;
    dm.SetDeviceInitializationPhaseHandler(&handler);

    auto conn = MakeConnection(3);
    REQUIRE_FALSE(dm.DeviceConnected(conn.context));
    REQUIRE(dm.device_count() == 0);
    REQUIRE(dm.GetDeviceContext("openflow:3") == nullptr);
    REQUIRE(handler.seen);
    REQUIRE(handler.seen->state() == DeviceState::Closed);
    REQUIRE(conn.adapter->close_calls() == 1);

    SECTION("Identity can be admitted again") {
        dm.SetDeviceInitializationPhaseHandler(nullptr);
        auto retry = MakeConnection(3);
        REQUIRE(dm.DeviceConnected(retry.context));
        REQUIRE(dm.device_count() == 1);
    }
}

TEST_CASE_METHOD(DeviceManagerFixture, "Admission fails when the inventory write fails",
                 "[device][admission]") {
    auto& dm = CreateManager();
    store.fail_submit_node = true;

    auto conn = MakeConnection(4);
    REQUIRE_FALSE(dm.DeviceConnected(conn.context));
    REQUIRE(dm.device_count() == 0);
    REQUIRE(CountNotifications("openflow:4", NotificationKind::NodeUpdated) == 0);
}

TEST_CASE_METHOD(DeviceManagerFixture, "Mandatory switch features reject featureless devices",
                 "[device][admission]") {
    DeviceManager::Config config;
    config.switch_features_mandatory = true;
    auto& dm = CreateManager(config);

    auto featureless = MakeConnection(5, 0, 0);
    REQUIRE_FALSE(dm.DeviceConnected(featureless.context));
    REQUIRE(dm.device_count() == 0);

    auto complete = MakeConnection(6);
    REQUIRE(dm.DeviceConnected(complete.context));
}

TEST_CASE_METHOD(DeviceManagerFixture, "Admission rejects null connections", "[device][admission]") {
    auto& dm = CreateManager();
    REQUIRE_THROWS_AS(dm.DeviceConnected(nullptr), std::invalid_argument);
    REQUIRE_THROWS_AS(dm.DeviceAuxiliaryConnected(nullptr), std::invalid_argument);
    REQUIRE_THROWS_AS(dm.OnDeviceDisconnected(nullptr), std::invalid_argument);
}

TEST_CASE_METHOD(DeviceManagerFixture, "Packet-in quota is shared between devices",
                 "[device][admission][ratelimit]") {
    DeviceManager::Config config;
    config.global_notification_quota = 1000;
    auto& dm = CreateManager(config);

    std::vector<MockConnection> connections;
    for (uint64_t dpid = 1; dpid <= 5; ++dpid) {
        connections.push_back(MakeConnection(dpid));
        REQUIRE(dm.DeviceConnected(connections.back().context));
    }
    for (uint64_t dpid = 1; dpid <= 5; ++dpid) {
        REQUIRE(dm.GetDeviceContext(NodeIdFromDatapathId(dpid))->packet_in_rate_limit() == 200);
    }

    // Floor applies once the quota is spread thin
    std::vector<MockConnection> more;
    for (uint64_t dpid = 6; dpid <= 20; ++dpid) {
        more.push_back(MakeConnection(dpid));
        REQUIRE(dm.DeviceConnected(more.back().context));
    }
    REQUIRE(dm.GetDeviceContext("openflow:1")->packet_in_rate_limit() == 100);
}

TEST_CASE_METHOD(DeviceManagerFixture, "Auxiliary connections attach to admitted devices",
                 "[device][admission][auxiliary]") {
    auto& dm = CreateManager();
    auto primary = MakeConnection(10);
    auto aux = MakeConnection(10, 1);
    auto orphan = MakeConnection(11, 1);

    REQUIRE_FALSE(dm.DeviceAuxiliaryConnected(orphan.context));

    REQUIRE(dm.DeviceConnected(primary.context));
    REQUIRE(dm.DeviceAuxiliaryConnected(aux.context));
    REQUIRE_FALSE(dm.DeviceAuxiliaryConnected(aux.context));
    REQUIRE(aux.adapter->has_outbound_queue());

    auto ctx = dm.GetDeviceContext("openflow:10");
    REQUIRE(ctx->auxiliary_connection_count() == 1);
}
