#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "mmsim/order.hpp"
#include "mmsim/order_book.hpp"
#include <sstream>
#include <stdexcept>

using Catch::Approx;

namespace {
constexpr mmsim::TraderId kOwner = 7;
}

TEST_CASE("Orders get distinct ids", "[order_book]") {
    mmsim::Order a(100.0, 1.0, mmsim::Side::Bid, kOwner);
    mmsim::Order b(100.0, 1.0, mmsim::Side::Bid, kOwner);

    REQUIRE(a.id != b.id);
}

TEST_CASE("Order rejects non-positive size", "[order_book]") {
    REQUIRE_THROWS_AS(mmsim::Order(100.0, 0.0, mmsim::Side::Bid, kOwner),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(mmsim::Order(100.0, -1.0, mmsim::Side::Ask, kOwner),
                      std::invalid_argument);
}

TEST_CASE("Order prints price and size", "[order_book]") {
    mmsim::Order order(99.5, 5.0, mmsim::Side::Bid, kOwner);
    std::ostringstream out;
    out << order;

    REQUIRE(out.str() == "99.500 (5 lots)");
}

TEST_CASE("Insert routes orders by side", "[order_book]") {
    mmsim::OrderBook book;
    book.insert(mmsim::Order(99.0, 10.0, mmsim::Side::Bid, kOwner));
    book.insert(mmsim::Order(101.0, 10.0, mmsim::Side::Ask, kOwner));
    book.insert(mmsim::Order(102.0, 10.0, mmsim::Side::Ask, kOwner));

    REQUIRE(book.bids().size() == 1);
    REQUIRE(book.asks().size() == 2);
    REQUIRE(book.size() == 3);
    for (const auto& bid : book.bids()) {
        REQUIRE(bid.side == mmsim::Side::Bid);
    }
    for (const auto& ask : book.asks()) {
        REQUIRE(ask.side == mmsim::Side::Ask);
    }
}

TEST_CASE("Insert rejects an out-of-range side", "[order_book]") {
    mmsim::OrderBook book;
    mmsim::Order order(100.0, 1.0, mmsim::Side::Bid, kOwner);
    order.side = static_cast<mmsim::Side>(7);

    REQUIRE_THROWS_AS(book.insert(order), mmsim::InvalidSide);
    REQUIRE_THROWS_AS(book.amend(order), mmsim::InvalidSide);
    REQUIRE_THROWS_AS(book.cancel(order), mmsim::InvalidSide);
    REQUIRE(book.empty());
}

TEST_CASE("Best bid is the highest, best ask the lowest", "[order_book]") {
    mmsim::OrderBook book;
    book.insert(mmsim::Order(98.0, 1.0, mmsim::Side::Bid, kOwner));
    book.insert(mmsim::Order(99.5, 2.0, mmsim::Side::Bid, kOwner));
    book.insert(mmsim::Order(97.0, 3.0, mmsim::Side::Bid, kOwner));
    book.insert(mmsim::Order(103.0, 1.0, mmsim::Side::Ask, kOwner));
    book.insert(mmsim::Order(101.0, 2.0, mmsim::Side::Ask, kOwner));

    auto bid = book.best_bid();
    auto ask = book.best_ask();
    REQUIRE(bid.has_value());
    REQUIRE(ask.has_value());
    REQUIRE(bid->price == Approx(99.5));
    REQUIRE(ask->price == Approx(101.0));
    REQUIRE(book.mid_price().value() == Approx(100.25));
}

TEST_CASE("Equal prices resolve to the first inserted order", "[order_book]") {
    mmsim::OrderBook book;
    mmsim::Order first(100.0, 1.0, mmsim::Side::Bid, kOwner);
    mmsim::Order second(100.0, 2.0, mmsim::Side::Bid, kOwner);
    book.insert(first);
    book.insert(second);

    REQUIRE(book.best_bid()->id == first.id);
}

TEST_CASE("Empty sides yield no quote", "[order_book]") {
    mmsim::OrderBook book;

    REQUIRE_FALSE(book.best_bid().has_value());
    REQUIRE_FALSE(book.best_ask().has_value());
    REQUIRE_FALSE(book.mid_price().has_value());
    REQUIRE(book.to_string() == "Best bid is none and best ask is none");
}

TEST_CASE("Mid price falls back to the only side present", "[order_book]") {
    mmsim::OrderBook book;
    book.insert(mmsim::Order(101.0, 1.0, mmsim::Side::Ask, kOwner));

    REQUIRE(book.mid_price().value() == Approx(101.0));
}

TEST_CASE("Cancel removes by id and is idempotent", "[order_book]") {
    mmsim::OrderBook book;
    mmsim::Order bid(99.0, 1.0, mmsim::Side::Bid, kOwner);
    mmsim::Order ask(101.0, 1.0, mmsim::Side::Ask, kOwner);
    book.insert(bid);
    book.insert(ask);

    book.cancel(bid.id);
    REQUIRE(book.bids().empty());
    REQUIRE(book.asks().size() == 1);

    book.cancel(bid.id);
    book.cancel(bid);
    REQUIRE(book.size() == 1);
    REQUIRE(book.best_ask()->id == ask.id);
}

TEST_CASE("Amend replaces the resting order", "[order_book]") {
    mmsim::OrderBook book;
    mmsim::Order bid(99.0, 10.0, mmsim::Side::Bid, kOwner);
    book.insert(bid);

    bid.size = 4.0;
    book.amend(bid);

    REQUIRE(book.bids().size() == 1);
    REQUIRE(book.best_bid()->id == bid.id);
    REQUIRE(book.best_bid()->size == Approx(4.0));
}

TEST_CASE("Clear empties both sides", "[order_book]") {
    mmsim::OrderBook book;
    book.insert(mmsim::Order(99.0, 1.0, mmsim::Side::Bid, kOwner));
    book.insert(mmsim::Order(101.0, 1.0, mmsim::Side::Ask, kOwner));

    book.clear();

    REQUIRE(book.empty());
    REQUIRE_FALSE(book.best_bid().has_value());
    REQUIRE_FALSE(book.best_ask().has_value());
}

TEST_CASE("Book summary names both quotes", "[order_book]") {
    mmsim::OrderBook book;
    book.insert(mmsim::Order(99.0, 100.0, mmsim::Side::Bid, kOwner));
    book.insert(mmsim::Order(101.0, 100.0, mmsim::Side::Ask, kOwner));

    REQUIRE(book.to_string() ==
            "Best bid is 99.000 (100 lots) and best ask is 101.000 (100 lots)");
}

TEST_CASE("Insert rejects an id already resting", "[order_book]") {
    mmsim::OrderBook book;
    mmsim::Order bid(101.0, 10.0, mmsim::Side::Bid, kOwner);
    book.insert(bid);

    REQUIRE(book.contains(bid.id));
    REQUIRE_THROWS_AS(book.insert(bid), std::invalid_argument);

    mmsim::Order flipped = bid;
    flipped.side = mmsim::Side::Ask;
    REQUIRE_THROWS_AS(book.insert(flipped), std::invalid_argument);

    REQUIRE(book.bids().size() == 1);
    REQUIRE(book.asks().empty());
    REQUIRE(book.best_bid()->size == Approx(10.0));
}

TEST_CASE("Cancelled ids can be inserted again", "[order_book]") {
    mmsim::OrderBook book;
    mmsim::Order bid(101.0, 10.0, mmsim::Side::Bid, kOwner);
    book.insert(bid);
    book.cancel(bid.id);

    REQUIRE_FALSE(book.contains(bid.id));
    book.insert(bid);
    REQUIRE(book.bids().size() == 1);
}
