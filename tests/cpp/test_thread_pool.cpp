#include <catch2/catch_test_macros.hpp>
#include "seatplan/thread_pool.hpp"
#include <atomic>
#include <stdexcept>
#include <vector>

using namespace seatplan;

// ============================================================================
// ThreadPool
// ============================================================================

TEST_CASE("ThreadPool starts the requested number of workers", "[thread_pool]") {
    SECTION("explicit count") {
        ThreadPool pool(3);
        REQUIRE(pool.thread_count() == 3);
    }

    SECTION("zero means one") {
        ThreadPool pool(0);
        REQUIRE(pool.thread_count() == 1);
    }
}

TEST_CASE("ThreadPool futures deliver every result", "[thread_pool]") {
    ThreadPool pool(4);
    std::vector<std::future<int>> futures;
    for (int i = 0; i < 32; ++i) {
        futures.push_back(pool.enqueue([i] { return i * i; }));
    }

    for (int i = 0; i < 32; ++i) {
        REQUIRE(futures[i].get() == i * i);
    }
}

TEST_CASE("ThreadPool rethrows task exceptions through the future", "[thread_pool][error]") {
    ThreadPool pool(2);
    auto failing = pool.enqueue([]() -> int { throw std::runtime_error("task failed"); });
    auto fine = pool.enqueue([] { return 7; });

    REQUIRE_THROWS_AS(failing.get(), std::runtime_error);
    REQUIRE(fine.get() == 7);
}

TEST_CASE("ThreadPool drains queued tasks before shutdown", "[thread_pool]") {
    std::atomic<int> done{0};
    {
        ThreadPool pool(1);
        for (int i = 0; i < 50; ++i) {
            pool.enqueue([&done] { done++; });
        }
    }
    REQUIRE(done.load() == 50);
}
