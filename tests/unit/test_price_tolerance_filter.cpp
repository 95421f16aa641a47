#include <gtest/gtest.h>
#include "orderbook/order_store.hpp"
#include "pricing/market_price_estimator.hpp"
#include "pricing/price_tolerance_filter.hpp"
#include <cmath>
#include <iterator>

using namespace matchcore;

class PriceToleranceFilterTest : public ::testing::Test {
protected:
    OrderStore store{0.05};
    PriceToleranceFilter filter{store};

    static Order make_order(OrderId id, Price price, OrderKind kind = OrderKind::Limit) {
        return Order{.id = id, .kind = kind, .price = price, .amount = 1.0, .product_id = 1};
    }
};

TEST_F(PriceToleranceFilterTest, DropsOutOfToleranceAndReprices) {
    // Heads 10.0 and 9.5 give a reference of 9.75
    store.add_buy(make_order(1, 10.0));
    store.add_buy(make_order(2, 9.0));    // |9.0 - 9.75| = 0.75, dropped
    store.add_buy(make_order(3, 9.73));   // |9.73 - 9.75| = 0.02, kept
    store.add_sell(make_order(4, 9.5));
    store.add_sell(make_order(5, 9.76));  // kept

    auto summary = filter.apply_tolerance_and_reprice(1, 9.8);

    EXPECT_DOUBLE_EQ(summary.reference_price, 9.75);
    EXPECT_EQ(summary.retained_buys, 1u);
    EXPECT_EQ(summary.retained_sells, 1u);
    EXPECT_EQ(summary.dropped_buys, 2u);
    EXPECT_EQ(summary.dropped_sells, 1u);

    auto book = store.snapshot(1);
    ASSERT_EQ(book.buys.size(), 1u);
    ASSERT_EQ(book.sells.size(), 1u);
    EXPECT_EQ(book.buys[0].id, 3u);
    EXPECT_EQ(book.sells[0].id, 5u);
    EXPECT_DOUBLE_EQ(book.buys[0].price, 9.8);
    EXPECT_DOUBLE_EQ(book.sells[0].price, 9.8);
}

TEST_F(PriceToleranceFilterTest, DroppedOrdersAreGone) {
    store.add_buy(make_order(1, 10.0));
    store.add_buy(make_order(2, 50.0));

    filter.apply_tolerance_and_reprice(1, 10.0);

    EXPECT_FALSE(store.find(Side::Buy, 1, 2).has_value());
    EXPECT_FALSE(store.cancel_buy(1, 2));
}

TEST_F(PriceToleranceFilterTest, BoundaryIsInclusive) {
    OrderStore wide{0.5};
    PriceToleranceFilter wide_filter{wide};
    wide.add_buy(make_order(1, 10.0));
    wide.add_buy(make_order(2, 10.5));    // exactly at tolerance
    wide.add_buy(make_order(3, 9.25));    // 0.75 away

    auto summary = wide_filter.apply_tolerance_and_reprice(1, 11.0);

    EXPECT_EQ(summary.retained_buys, 2u);
    EXPECT_EQ(summary.dropped_buys, 1u);
}

TEST_F(PriceToleranceFilterTest, MarketOrdersRepricedToo) {
    // Reference is 0 from the market head, so the market order survives
    store.add_sell(make_order(1, 0.0, OrderKind::Market));
    store.add_sell(make_order(2, 0.01, OrderKind::Limit));

    filter.apply_tolerance_and_reprice(1, 7.0);

    auto book = store.snapshot(1);
    ASSERT_EQ(book.sells.size(), 2u);
    EXPECT_EQ(book.sells[0].kind, OrderKind::Market);
    EXPECT_DOUBLE_EQ(book.sells[0].price, 7.0);
    EXPECT_DOUBLE_EQ(book.sells[1].price, 7.0);
}

TEST_F(PriceToleranceFilterTest, EmptyBookIsNoOp) {
    auto summary = filter.apply_tolerance_and_reprice(1, 5.0);

    EXPECT_DOUBLE_EQ(summary.reference_price, 0.0);
    EXPECT_EQ(summary.retained(), 0u);
    EXPECT_EQ(summary.dropped(), 0u);
    EXPECT_DOUBLE_EQ(summary.new_price, 5.0);
}

TEST_F(PriceToleranceFilterTest, UnknownProductNotCreated) {
    filter.apply_tolerance_and_reprice(43, 1.0);

    EXPECT_TRUE(store.products().empty());
    EXPECT_FALSE(store.has_product(43));
}

TEST_F(PriceToleranceFilterTest, OtherProductsUntouched) {
    store.add_buy(make_order(1, 10.0));
    store.add_buy(Order{.id = 1, .price = 99.0, .amount = 1.0, .product_id = 2});

    filter.apply_tolerance_and_reprice(1, 3.0);

    EXPECT_DOUBLE_EQ(store.find(Side::Buy, 2, 1)->price, 99.0);
}

TEST_F(PriceToleranceFilterTest, SurvivorsWereWithinToleranceOfEstimate) {
    const Price prices[] = {10.0, 10.02, 9.99, 10.3, 9.6, 10.05};
    for (OrderId id = 0; id < std::size(prices); ++id) {
        store.add_buy(make_order(id, prices[id]));
    }
    const Price estimate = MarketPriceEstimator(store).estimate(1);

    filter.apply_tolerance_and_reprice(1, 12.0);

    for (const auto& order : store.snapshot(1).buys) {
        EXPECT_DOUBLE_EQ(order.price, 12.0);
        EXPECT_LE(std::abs(prices[order.id] - estimate), store.tolerance());
    }
}

TEST(PriceToleranceTest, WithinTolerance) {
    EXPECT_TRUE(PriceToleranceFilter::within_tolerance(9.73, 9.75, 0.05));
    EXPECT_FALSE(PriceToleranceFilter::within_tolerance(9.0, 9.75, 0.05));
    EXPECT_TRUE(PriceToleranceFilter::within_tolerance(5.0, 5.0, 0.0));
}
