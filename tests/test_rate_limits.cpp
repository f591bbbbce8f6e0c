#include <catch2/catch_test_macros.hpp>

#include "rate_limits.hpp"

TEST_CASE("RateLimitModel", "[rate_limits]") {
    RateLimitModel limits(35, 300, 10'000, "$42.50");

    SECTION("InitialSnapshot") {
        auto snap = limits.read();
        REQUIRE(snap.used_percent == 35);
        REQUIRE(snap.window_duration_mins == 300);
        REQUIRE(snap.resets_at == 10'000);
        REQUIRE(limits.credit_balance() == "$42.50");
    }

    SECTION("BumpIncreases") {
        REQUIRE(limits.bump(5) == 40);
        REQUIRE(limits.read().used_percent == 40);
    }

    SECTION("BumpClampsAt100") {
        limits.bump(60);
        REQUIRE(limits.bump(7) == 100);
        REQUIRE(limits.bump(1) == 100);
    }

    SECTION("NonPositiveBumpNeverDecreases") {
        REQUIRE(limits.bump(0) == 35);
        REQUIRE(limits.bump(-10) == 35);
    }

    SECTION("InitialValueClamped") {
        RateLimitModel over(150, 300, 0, "");
        REQUIRE(over.read().used_percent == 100);
    }

    SECTION("WindowRollsOverAfterReset") {
        REQUIRE_FALSE(limits.roll_window(9'999));
        REQUIRE(limits.read().used_percent == 35);

        REQUIRE(limits.roll_window(10'000));
        auto snap = limits.read();
        REQUIRE(snap.used_percent == 0);
        REQUIRE(snap.resets_at == 10'000 + 300 * 60);
    }

    SECTION("RollOverSkipsElapsedWindows") {
        REQUIRE(limits.roll_window(10'000 + 3 * 300 * 60 + 1));
        REQUIRE(limits.read().resets_at == 10'000 + 4 * 300 * 60);
    }
}
