#include <catch2/catch.hpp>

#include <chrono>
#include <stdexcept>

#include "../src/executer/rate_limiter.hpp"

using namespace std::chrono;

TEST_CASE("global rate limiter", "[rate_limiter]") {
    SECTION("zero requests per second is rejected") { REQUIRE_THROWS_AS(executer::GlobalRateLimiter(0), std::invalid_argument); }

    SECTION("spaces requests to the same target") {
        executer::GlobalRateLimiter limiter(20);

        const auto started = steady_clock::now();
        for (int i = 0; i < 5; ++i) {
            limiter.take("http://a.test");
        }
        // first slot is immediate, four more at 50ms intervals
        REQUIRE(steady_clock::now() - started >= milliseconds(190));
    }

    SECTION("targets are limited independently") {
        executer::GlobalRateLimiter limiter(1);

        const auto started = steady_clock::now();
        limiter.take("http://a.test");
        limiter.take("http://b.test");
        limiter.take("http://c.test");
        REQUIRE(steady_clock::now() - started < milliseconds(500));
    }
}
