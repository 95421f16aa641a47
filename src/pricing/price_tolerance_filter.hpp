#pragma once

#include "core/types.hpp"
#include "orderbook/order_store.hpp"
#include <cstddef>

namespace matchcore {

/// Outcome of one filter-then-reprice pass
struct RepriceSummary {
    ProductId product_id{0};
    Price reference_price{0.0};
    Price new_price{0.0};
    std::size_t retained_buys{0};
    std::size_t retained_sells{0};
    std::size_t dropped_buys{0};
    std::size_t dropped_sells{0};

    [[nodiscard]] std::size_t dropped() const noexcept {
        return dropped_buys + dropped_sells;
    }

    [[nodiscard]] std::size_t retained() const noexcept {
        return retained_buys + retained_sells;
    }
};

/// Applies an external price update to one product
///
/// Orders further than the store's tolerance from the market estimate are
/// discarded permanently; every surviving order (limit or market) is then
/// repriced to the new price. Both steps happen in one critical section.
class PriceToleranceFilter {
public:
    explicit PriceToleranceFilter(OrderStore& store);

    RepriceSummary apply_tolerance_and_reprice(ProductId product_id, Price new_price);

    /// Whether an order at this price survives a pass with the given reference
    [[nodiscard]] static bool within_tolerance(Price price, Price reference, Price tolerance) noexcept;

private:
    OrderStore& store_;
};

}  // namespace matchcore
