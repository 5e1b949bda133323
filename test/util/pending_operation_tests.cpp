// Copyright (c) 2025 The DeviceLink Developers
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "util/pending_operation.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace devicelink::util;
using Outcome = PendingOperation::Outcome;

TEST_CASE("PendingOperation resolves exactly once", "[util][pending]") {
    PendingOperation op;
    REQUIRE_FALSE(op.IsDone());
    REQUIRE(op.outcome() == Outcome::Pending);

    SECTION("Complete then Cancel") {
        REQUIRE(op.Complete(Outcome::Success));
        REQUIRE_FALSE(op.Cancel());
        REQUIRE(op.outcome() == Outcome::Success);
    }

    SECTION("Cancel then Complete") {
        REQUIRE(op.Cancel());
        REQUIRE_FALSE(op.Complete(Outcome::Success));
        REQUIRE(op.outcome() == Outcome::Cancelled);
    }

    SECTION("Failure keeps its error text") {
        REQUIRE(op.Complete(Outcome::Failure, "disk full"));
        REQUIRE(op.error() == "disk full");
    }

    SECTION("Completing as Pending is rejected") {
        REQUIRE_THROWS_AS(op.Complete(Outcome::Pending), std::invalid_argument);
        REQUIRE_FALSE(op.IsDone());
    }
}

TEST_CASE("PendingOperation continuations", "[util][pending]") {
    PendingOperation op;
    int calls = 0;
    Outcome seen = Outcome::Pending;

    SECTION("Attached before resolution run on Complete") {
        op.OnComplete([&](Outcome o, const std::string&) { ++calls; seen = o; });
        REQUIRE(calls == 0);
        op.Complete(Outcome::Failure, "x");
        REQUIRE(calls == 1);
        REQUIRE(seen == Outcome::Failure);
        op.Cancel();
        REQUIRE(calls == 1);
    }

    SECTION("Attached after resolution run immediately") {
        op.Cancel();
        op.OnComplete([&](Outcome o, const std::string&) { ++calls; seen = o; });
        REQUIRE(calls == 1);
        REQUIRE(seen == Outcome::Cancelled);
    }

    SECTION("Continuation may query the operation") {
        op.OnComplete([&](Outcome, const std::string&) {
            REQUIRE(op.IsDone());
            ++calls;
        });
        op.Complete(Outcome::Success);
        REQUIRE(calls == 1);
    }
}

TEST_CASE("PendingOperation: racing Complete and Cancel", "[util][pending][concurrency]") {
    for (int round = 0; round < 200; ++round) {
        PendingOperation op;
        std::atomic<int> callbacks{0};
        op.OnComplete([&](Outcome, const std::string&) { callbacks.fetch_add(1); });

        std::atomic<int> wins{0};
        std::thread a([&]() { if (op.Complete(Outcome::Success)) wins.fetch_add(1); });
        std::thread b([&]() { if (op.Cancel()) wins.fetch_add(1); });
        a.join();
        b.join();

        REQUIRE(wins.load() == 1);
        REQUIRE(callbacks.load() == 1);
    }
}
