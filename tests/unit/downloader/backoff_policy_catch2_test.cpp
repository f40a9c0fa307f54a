#include <catch2/catch_test_macros.hpp>

#include <ruget/downloader/downloader.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <set>

using namespace ruget::downloader;
using namespace std::chrono_literals;

TEST_CASE("BackoffPolicy: Deterministic delays", "[downloader][backoff]") {
    BackoffPolicy policy;
    policy.baseDelay = 100ms;
    policy.factor = 2.0;
    policy.maxDelay = 10000ms;
    policy.jitter = false;

    SECTION("Grows exponentially from the base delay") {
        CHECK(policy.nextDelay(0) == 100ms);
        CHECK(policy.nextDelay(1) == 200ms);
        CHECK(policy.nextDelay(2) == 400ms);
        CHECK(policy.nextDelay(3) == 800ms);
        CHECK(policy.nextDelay(6) == 6400ms);
    }

    SECTION("Is capped at the maximum delay") {
        CHECK(policy.nextDelay(7) == 10000ms);
        CHECK(policy.nextDelay(20) == 10000ms);
    }

    SECTION("Huge attempt numbers still yield the cap") {
        CHECK(policy.nextDelay(5000) == 10000ms);
        CHECK(policy.cappedDelayMs(5000) == 10000.0);
    }

    SECTION("Never decreases and never exceeds the cap") {
        auto previous = policy.nextDelay(0);
        for (std::uint32_t attempt = 1; attempt < 40; ++attempt) {
            auto d = policy.nextDelay(attempt);
            CHECK(d >= previous);
            CHECK(d <= policy.maxDelay);
            previous = d;
        }
    }

    SECTION("Factor of one keeps the delay constant") {
        policy.factor = 1.0;
        for (std::uint32_t attempt = 0; attempt < 10; ++attempt) {
            CHECK(policy.nextDelay(attempt) == 100ms);
        }
    }

    SECTION("Fractional factors truncate to whole milliseconds") {
        policy.factor = 1.5;
        CHECK(policy.nextDelay(1) == 150ms);
        CHECK(policy.nextDelay(2) == 225ms);
        CHECK(policy.nextDelay(3) == 337ms);
    }
}

TEST_CASE("BackoffPolicy: Jitter", "[downloader][backoff]") {
    BackoffPolicy policy;
    policy.baseDelay = 1000ms;
    policy.factor = 2.0;
    policy.maxDelay = 60000ms;
    policy.jitter = true;

    SECTION("Stays within 25 percent of the capped delay") {
        std::set<std::int64_t> seen;
        for (int i = 0; i < 100; ++i) {
            auto d = policy.nextDelay(0).count();
            CHECK(d >= 750);
            CHECK(d <= 1250);
            seen.insert(d);
        }
        CHECK(seen.size() > 1);
    }

    SECTION("Applies after the cap") {
        policy.maxDelay = 4000ms;
        for (int i = 0; i < 100; ++i) {
            auto d = policy.nextDelay(10).count();
            CHECK(d >= 3000);
            CHECK(d <= 5000);
        }
    }

    SECTION("Zero base delay stays zero") {
        policy.baseDelay = 0ms;
        CHECK(policy.nextDelay(3) == 0ms);
    }
}

TEST_CASE("BackoffPolicy: Degenerate inputs", "[downloader][backoff]") {
    BackoffPolicy policy;
    policy.factor = 2.0;
    policy.maxDelay = 60000ms;
    policy.jitter = false;

    SECTION("Zero base with an overflowing exponent stays zero") {
        policy.baseDelay = 0ms;
        CHECK(policy.cappedDelayMs(1100) == 0.0);
        CHECK(policy.nextDelay(1100) == 0ms);
        policy.jitter = true;
        CHECK(policy.nextDelay(100000) == 0ms);
    }

    SECTION("Overflowing exponent with a real base yields the cap") {
        policy.baseDelay = 100ms;
        CHECK(std::isfinite(policy.cappedDelayMs(100000)));
        CHECK(policy.nextDelay(100000) == 60000ms);
    }
}
