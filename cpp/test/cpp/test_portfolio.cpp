#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "mmsim/portfolio.hpp"

using Catch::Approx;

TEST_CASE("Portfolio initializes with zero values", "[portfolio]") {
    mmsim::Portfolio p;

    REQUIRE(p.cash == Approx(0.0));
    REQUIRE(p.lots == Approx(0.0));
    REQUIRE(p.value(100.0) == Approx(0.0));
}

TEST_CASE("Buy moves cash by price and lots by size", "[portfolio]") {
    mmsim::Portfolio p;
    p.cash = 10000.0;

    p.buy(5.0, 50.0);

    REQUIRE(p.cash == Approx(9950.0));
    REQUIRE(p.lots == Approx(5.0));
}

TEST_CASE("Sell moves cash by price and lots by size", "[portfolio]") {
    mmsim::Portfolio p;
    p.cash = 10000.0;
    p.lots = 10.0;

    p.sell(4.0, 25.0);

    REQUIRE(p.cash == Approx(10025.0));
    REQUIRE(p.lots == Approx(6.0));
}

TEST_CASE("Portfolio value marks lots at the given price", "[portfolio]") {
    mmsim::Portfolio p;
    p.cash = 50000.0;
    p.lots = 100.0;

    REQUIRE(p.value(100.0) == Approx(60000.0));
    REQUIRE(p.value(-600.0) == Approx(-10000.0));
}
