// Copyright (c) 2025 The DeviceLink Developers
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "util/threadsafe_containers.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace devicelink::util;

// ============================================================================
// ThreadSafeMap Tests
// ============================================================================

TEST_CASE("ThreadSafeMap: Basic operations", "[util][threadsafe][map]") {
    ThreadSafeMap<int, std::string> map;

    SECTION("TryInsert and Read") {
        REQUIRE(map.TryInsert(1, "one"));
        REQUIRE(map.Contains(1));
        std::string result;
        REQUIRE(map.Read(1, [&](const std::string& value) { result = value; }));
        REQUIRE(result == "one");
    }

    SECTION("TryInsert doesn't overwrite") {
        REQUIRE(map.TryInsert(1, "one"));
        REQUIRE_FALSE(map.TryInsert(1, "ONE"));
        std::string result;
        map.Read(1, [&](const std::string& value) { result = value; });
        REQUIRE(result == "one");
        REQUIRE(map.Size() == 1);
    }

    SECTION("Read non-existent key") {
        bool called = false;
        REQUIRE_FALSE(map.Read(999, [&](const std::string&) { called = true; }));
        REQUIRE_FALSE(called);
        REQUIRE_FALSE(map.Contains(999));
    }
}

TEST_CASE("ThreadSafeMap: EraseIf only removes the matching value", "[util][threadsafe][map]") {
    ThreadSafeMap<std::string, std::shared_ptr<int>> map;
    auto first = std::make_shared<int>(1);
    auto second = std::make_shared<int>(2);

    SECTION("Stale value leaves the entry alone") {
        REQUIRE(map.TryInsert("dev", second));
        REQUIRE_FALSE(map.EraseIf("dev", [&](const std::shared_ptr<int>& v) { return v == first; }));
        REQUIRE(map.Contains("dev"));
    }

    SECTION("Matching value is removed once") {
        REQUIRE(map.TryInsert("dev", first));
        REQUIRE(map.EraseIf("dev", [&](const std::shared_ptr<int>& v) { return v == first; }));
        REQUIRE_FALSE(map.EraseIf("dev", [&](const std::shared_ptr<int>& v) { return v == first; }));
        REQUIRE(map.Size() == 0);
    }

    SECTION("Absent key is a no-op") {
        REQUIRE_FALSE(map.EraseIf("other", [](const std::shared_ptr<int>&) { return true; }));
    }
}

TEST_CASE("ThreadSafeMap: Snapshots", "[util][threadsafe][map]") {
    ThreadSafeMap<int, int> map;
    for (int i = 0; i < 10; ++i) {
        REQUIRE(map.TryInsert(i, i * 10));
    }

    SECTION("GetValues copies without draining") {
        auto values = map.GetValues();
        REQUIRE(values.size() == 10);
        REQUIRE(map.Size() == 10);
    }

    SECTION("TakeAll drains") {
        auto drained = map.TakeAll();
        REQUIRE(drained.size() == 10);
        REQUIRE(map.Size() == 0);
        REQUIRE(map.TakeAll().empty());

        int sum = 0;
        for (const auto& [key, value] : drained) {
            REQUIRE(value == key * 10);
            sum += value;
        }
        REQUIRE(sum == 450);
    }
}

TEST_CASE("ThreadSafeMap: Concurrent TryInsert has a single winner", "[util][threadsafe][map][concurrency]") {
    ThreadSafeMap<std::string, int> map;
    constexpr int kThreads = 16;
    std::atomic<int> winners{0};
    std::atomic<bool> go{false};

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t]() {
            while (!go.load()) {
                std::this_thread::yield();
            }
            if (map.TryInsert("openflow:1", t)) {
                winners.fetch_add(1);
            }
        });
    }
    go.store(true);
    for (auto& th : threads) {
        th.join();
    }

    REQUIRE(winners.load() == 1);
    REQUIRE(map.Size() == 1);
}

TEST_CASE("ThreadSafeMap: Concurrent inserts on distinct keys", "[util][threadsafe][map][concurrency]") {
    ThreadSafeMap<int, int> map;
    constexpr int kThreads = 8;
    constexpr int kPerThread = 500;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < kPerThread; ++i) {
                map.TryInsert(t * kPerThread + i, i);
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    REQUIRE(map.Size() == kThreads * kPerThread);
}
