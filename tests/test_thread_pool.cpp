#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

#include "../src/utils/thread_pool.hpp"

TEST_CASE("thread pool", "[thread_pool]") {
    SECTION("runs every task") {
        std::atomic<int> counter{0};
        concurrency::ThreadPool pool(4);
        for (int i = 0; i < 50; ++i) {
            pool.enqueue([&counter]() { ++counter; });
        }
        pool.wait_all();
        REQUIRE(counter.load() == 50);
    }

    SECTION("never runs more tasks than the in flight cap") {
        std::atomic<int> running{0};
        std::atomic<int> peak{0};

        concurrency::ThreadPool pool(3, 3);
        for (int i = 0; i < 20; ++i) {
            pool.enqueue([&running, &peak]() {
                const int now = ++running;
                int seen = peak.load();
                while (now > seen && !peak.compare_exchange_weak(seen, now)) {
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(2));
                --running;
            });
        }
        pool.wait_all();

        REQUIRE(peak.load() <= 3);
        REQUIRE(pool.size() == 3);
    }

    SECTION("rethrows the first task failure from wait_all") {
        concurrency::ThreadPool pool(2);
        pool.enqueue([]() { throw std::runtime_error("task failed"); });
        REQUIRE_THROWS_WITH(pool.wait_all(), "task failed");

        // the error is reported once
        pool.enqueue([]() {});
        REQUIRE_NOTHROW(pool.wait_all());
    }
}
