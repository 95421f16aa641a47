#pragma once

#include "core/order.hpp"
#include "matching/trade.hpp"
#include "orderbook/order_store.hpp"
#include <cstddef>
#include <optional>
#include <vector>

namespace matchcore {

/// Outcome of one match pass over a product
struct MatchSummary {
    ProductId product_id{0};
    std::size_t intents{0};   // crossing pairs discovered
    std::size_t applied{0};   // trades applied
    std::size_t skipped{0};   // stale intents dropped
    Amount volume{0.0};       // total amount traded
};

/// Discovers crossing buy/sell pairs for a product and applies them
///
/// A pass runs in two phases under the product's guard:
///  1. every (buy, sell) pair of the pre-match sequences, in stored order,
///     is tested with crosses() and becomes a TradeIntent;
///  2. intents are applied one at a time, in discovery order, against the
///     live sequences. An intent whose orders have since been filled is
///     skipped.
/// Discovery order, not price or time, decides who trades when one order
/// crosses several counterparties.
class MatchCoordinator {
public:
    /// @param store Order store to read and mutate
    /// @param handler Receives one report per applied trade (may be empty)
    MatchCoordinator(OrderStore& store, TradeHandler handler);

    /// Run a full pass; returns once every intent was applied or skipped
    MatchSummary match(ProductId product_id);

    /// Crossing predicate: buy.price >= sell.price
    /// The market-kind check never widens this, since market orders carry price 0.
    [[nodiscard]] static bool crosses(const Order& buy, const Order& sell) noexcept;

    /// Phase 1 over sequences the caller holds exclusively
    [[nodiscard]] static std::vector<TradeIntent> discover(const ProductOrders& orders);

    /// Apply one intent against live sequences the caller holds exclusively
    /// @return The trade, or nullopt if either order is no longer resting
    static std::optional<TradeReport> apply(ProductOrders& orders, ProductId product_id,
                                            const TradeIntent& intent);

private:
    OrderStore& store_;
    TradeHandler handler_;
};

}  // namespace matchcore
