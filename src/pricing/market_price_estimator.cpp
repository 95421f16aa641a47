#include "pricing/market_price_estimator.hpp"

namespace matchcore {

MarketPriceEstimator::MarketPriceEstimator(const OrderStore& store)
    : store_(store)
{}

Price MarketPriceEstimator::estimate(ProductId product_id) const {
    return store_.with_product(product_id, [](const ProductOrders& orders) {
        return estimate(orders);
    });
}

bool MarketPriceEstimator::has_market_data(ProductId product_id) const {
    return store_.with_product(product_id, [](const ProductOrders& orders) {
        return !orders.empty();
    });
}

Price MarketPriceEstimator::estimate(const ProductOrders& orders) noexcept {
    if (!orders.buys.empty() && !orders.sells.empty()) {
        return (orders.buys.front().price + orders.sells.front().price) / 2.0;
    }
    if (!orders.buys.empty()) {
        return orders.buys.front().price;
    }
    if (!orders.sells.empty()) {
        return orders.sells.front().price;
    }
    // No market data
    return 0.0;
}

}  // namespace matchcore
