#pragma once

#include "core/types.hpp"
#include "orderbook/order_store.hpp"
#include "orderbook/product_orders.hpp"

namespace matchcore {

/// Coarse reference price from the head order of each side
///
/// Both sides non-empty: mean of the two head prices.
/// One side non-empty: that side's head price.
/// Both empty: 0, which callers must treat as "no data" (see has_market_data).
/// This is a single-sample estimate, not a volume-weighted mid.
class MarketPriceEstimator {
public:
    explicit MarketPriceEstimator(const OrderStore& store);

    /// Estimate under the product's guard
    [[nodiscard]] Price estimate(ProductId product_id) const;

    /// True if at least one side of the product has a resting order
    [[nodiscard]] bool has_market_data(ProductId product_id) const;

    /// Estimate from sequences the caller already holds exclusively
    [[nodiscard]] static Price estimate(const ProductOrders& orders) noexcept;

private:
    const OrderStore& store_;
};

}  // namespace matchcore
