// Copyright (c) 2025 The DeviceLink Developers
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "store/json_inventory_store.hpp"
#include "util/files.hpp"
#include "infra/test_helpers.hpp"
#include <filesystem>
#include <nlohmann/json.hpp>

using namespace devicelink;
using namespace devicelink::store;
using json = nlohmann::json;
using Outcome = util::PendingOperation::Outcome;

namespace {

NodeRecord MakeRecord(uint64_t dpid) {
    NodeRecord r;
    r.node_id = "openflow:" + std::to_string(dpid);
    r.version = 4;
    r.datapath_id = dpid;
    r.address = "10.0.0." + std::to_string(dpid);
    r.port = 6653;
    r.n_tables = 254;
    r.connected_at = 1700000000;
    return r;
}

JsonInventoryStore::Options MakeOptions(const std::filesystem::path& dir) {
    JsonInventoryStore::Options options;
    options.datadir = dir;
    return options;
}

} // namespace

TEST_CASE("JsonInventoryStore persists node records", "[store]") {
    auto dir = std::filesystem::temp_directory_path() / "devicelink_store_test";
    std::filesystem::remove_all(dir);

    {
        JsonInventoryStore store(MakeOptions(dir));
        REQUIRE(store.SubmitInitial(InventoryRoot{}));
        REQUIRE(std::filesystem::exists(store.path()));
        REQUIRE(store.SubmitNode(MakeRecord(1)));
        REQUIRE(store.SubmitNode(MakeRecord(2)));
        REQUIRE(store.node_count() == 2);
    }

    SECTION("File format") {
        auto root = json::parse(util::read_file_string(dir / "inventory.json"));
        REQUIRE(root["version"] == 1);
        REQUIRE(root["nodes"].size() == 2);
        const auto& node = root["nodes"]["openflow:1"];
        REQUIRE(node["datapath_id"] == 1);
        REQUIRE(node["address"] == "10.0.0.1");
        REQUIRE(node["n_tables"] == 254);
        REQUIRE(node["connected_at"] == 1700000000);
    }

    SECTION("Reload merges the initial root into stored records") {
        JsonInventoryStore store(MakeOptions(dir));
        InventoryRoot root;
        root.nodes["openflow:3"] = MakeRecord(3);
        REQUIRE(store.SubmitInitial(root));
        REQUIRE(store.node_count() == 3);
        auto loaded = store.GetNode("openflow:2");
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->port == 6653);
        REQUIRE(loaded->version == 4);
    }

    SECTION("FlushAndClose removes the record asynchronously") {
        JsonInventoryStore store(MakeOptions(dir));
        auto op = store.FlushAndClose("openflow:1");
        REQUIRE(test::WaitFor([&]() { return op->IsDone(); }));
        REQUIRE(op->outcome() == Outcome::Success);
        REQUIRE_FALSE(store.GetNode("openflow:1").has_value());
        REQUIRE(store.GetNode("openflow:2").has_value());

        auto root = json::parse(util::read_file_string(dir / "inventory.json"));
        REQUIRE(root["nodes"].size() == 1);
    }

    SECTION("FlushAndClose after Shutdown fails") {
        JsonInventoryStore store(MakeOptions(dir));
        store.Shutdown();
        auto op = store.FlushAndClose("openflow:1");
        REQUIRE(op->IsDone());
        REQUIRE(op->outcome() == Outcome::Failure);
    }

    std::filesystem::remove_all(dir);
}

TEST_CASE("JsonInventoryStore never overwrites a corrupt file", "[store]") {
    auto dir = std::filesystem::temp_directory_path() / "devicelink_store_corrupt_test";
    std::filesystem::remove_all(dir);
    REQUIRE(util::atomic_write_file(dir / "inventory.json", std::string("{not json")));

    JsonInventoryStore store(MakeOptions(dir));
    REQUIRE_FALSE(store.SubmitInitial(InventoryRoot{}));
    REQUIRE_FALSE(store.SubmitNode(MakeRecord(1)));

    auto op = store.FlushAndClose("openflow:1");
    REQUIRE(test::WaitFor([&]() { return op->IsDone(); }));
    REQUIRE(op->outcome() == Outcome::Failure);

    REQUIRE(util::read_file_string(dir / "inventory.json") == "{not json");
    std::filesystem::remove_all(dir);
}

TEST_CASE("JsonInventoryStore rejects unknown file versions", "[store]") {
    auto dir = std::filesystem::temp_directory_path() / "devicelink_store_version_test";
    std::filesystem::remove_all(dir);
    REQUIRE(util::atomic_write_file(dir / "inventory.json",
                                    std::string("{\"version\":2,\"nodes\":{}}")));

    JsonInventoryStore store(MakeOptions(dir));
    REQUIRE_FALSE(store.SubmitInitial(InventoryRoot{}));
    std::filesystem::remove_all(dir);
}
