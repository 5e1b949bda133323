#include <catch2/catch_test_macros.hpp>
#include "util/threadpool.hpp"
#include <atomic>
#include <stdexcept>

using namespace devicelink::util;

TEST_CASE("ThreadPool runs tasks and returns results", "[util][threadpool]") {
    ThreadPool pool(2);
    REQUIRE(pool.size() == 2);

    auto sum = pool.enqueue([](int a, int b) { return a + b; }, 2, 3);
    REQUIRE(sum.get() == 5);

    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 50; ++i) {
        futures.push_back(pool.enqueue([&counter]() { counter.fetch_add(1); }));
    }
    for (auto& f : futures) {
        f.get();
    }
    REQUIRE(counter.load() == 50);
}

TEST_CASE("ThreadPool delivers task exceptions through the future", "[util][threadpool]") {
    ThreadPool pool(1);
    auto failing = pool.enqueue([]() -> int { throw std::runtime_error("disk full"); });
    REQUIRE_THROWS_AS(failing.get(), std::runtime_error);

    // Worker survived
    REQUIRE(pool.enqueue([]() { return 7; }).get() == 7);
}

TEST_CASE("ThreadPool shutdown drains queued tasks and rejects new ones", "[util][threadpool]") {
    ThreadPool pool(1);
    std::atomic<int> ran{0};
    for (int i = 0; i < 10; ++i) {
        (void)pool.enqueue([&ran]() { ran.fetch_add(1); });
    }

    pool.shutdown();
    REQUIRE(pool.is_stopped());
    REQUIRE_THROWS_AS(pool.enqueue([]() {}), std::runtime_error);

    pool.wait_for_completion();
    REQUIRE(ran.load() == 10);
    REQUIRE(pool.pending_tasks() == 0);
}
