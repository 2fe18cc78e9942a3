#include <catch2/catch.hpp>
#include <meshgate/core/rate_limiter.hpp>

using namespace meshgate;

TEST_CASE("rate limiter - allows up to the limit within a window", "[rate_limiter]") {
    FixedWindowLimiter limiter(3, 1000);

    for (int i = 0; i < 3; ++i) {
        REQUIRE(limiter.check(100 + i).allowed);
        limiter.record(100 + i);
    }

    RateLimitResult r = limiter.check(500);
    REQUIRE_FALSE(r.allowed);
    REQUIRE(r.retry_after_ms == 600);
    REQUIRE(r.limit == 3);
    REQUIRE(limiter.count() == 3);
}

TEST_CASE("rate limiter - check does not count", "[rate_limiter]") {
    FixedWindowLimiter limiter(1, 1000);
    for (int i = 0; i < 10; ++i) {
        REQUIRE(limiter.check(0).allowed);
    }
    REQUIRE(limiter.count() == 0);
}

TEST_CASE("rate limiter - window resets after window_ms", "[rate_limiter]") {
    FixedWindowLimiter limiter(2, 1000);
    limiter.record(0);
    limiter.record(10);
    REQUIRE_FALSE(limiter.check(999).allowed);

    REQUIRE(limiter.check(1000).allowed);
    limiter.record(1000);
    REQUIRE(limiter.window_start() == 1000);
    REQUIRE(limiter.count() == 1);
}

TEST_CASE("rate limiter - remaining tracks usage", "[rate_limiter]") {
    FixedWindowLimiter limiter(5, 1000);
    REQUIRE(limiter.check(0).remaining == 5);
    limiter.record(0);
    limiter.record(1);
    REQUIRE(limiter.check(2).remaining == 3);

    limiter.reset();
    REQUIRE(limiter.count() == 0);
    REQUIRE(limiter.check(3).remaining == 5);
}
