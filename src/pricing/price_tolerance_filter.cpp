#include "pricing/price_tolerance_filter.hpp"
#include "pricing/market_price_estimator.hpp"
#include <spdlog/spdlog.h>
#include <cmath>
#include <vector>

namespace matchcore {

namespace {

/// Keep in-tolerance orders in their original order
/// @return Number of orders dropped
std::size_t retain_within(std::vector<Order>& orders, Price reference, Price tolerance) {
    const auto before = orders.size();
    std::erase_if(orders, [&](const Order& o) {
        return !PriceToleranceFilter::within_tolerance(o.price, reference, tolerance);
    });
    return before - orders.size();
}

void reprice(std::vector<Order>& orders, Price new_price) {
    for (auto& order : orders) {
        order.price = new_price;
    }
}

}  // namespace

PriceToleranceFilter::PriceToleranceFilter(OrderStore& store)
    : store_(store)
{}

bool PriceToleranceFilter::within_tolerance(Price price, Price reference, Price tolerance) noexcept {
    return std::abs(price - reference) <= tolerance;
}

RepriceSummary PriceToleranceFilter::apply_tolerance_and_reprice(ProductId product_id, Price new_price) {
    const Price tolerance = store_.tolerance();

    if (!store_.has_product(product_id)) {
        RepriceSummary empty;
        empty.product_id = product_id;
        empty.new_price = new_price;
        return empty;
    }

    auto summary = store_.with_product(product_id, [&](ProductOrders& orders) {
        RepriceSummary s;
        s.product_id = product_id;
        s.new_price = new_price;

        // Estimate once, from the heads as they stood before filtering
        s.reference_price = MarketPriceEstimator::estimate(orders);

        s.dropped_buys = retain_within(orders.buys, s.reference_price, tolerance);
        s.dropped_sells = retain_within(orders.sells, s.reference_price, tolerance);

        reprice(orders.buys, new_price);
        reprice(orders.sells, new_price);

        s.retained_buys = orders.buys.size();
        s.retained_sells = orders.sells.size();
        return s;
    });

    if (summary.dropped() > 0) {
        spdlog::info("Product {}: dropped {} order(s) outside {} of reference {:.4f}",
                     product_id, summary.dropped(), tolerance, summary.reference_price);
    }

    return summary;
}

}  // namespace matchcore
