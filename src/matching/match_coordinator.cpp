#include "matching/match_coordinator.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <utility>

namespace matchcore {

MatchCoordinator::MatchCoordinator(OrderStore& store, TradeHandler handler)
    : store_(store)
    , handler_(std::move(handler))
{}

bool MatchCoordinator::crosses(const Order& buy, const Order& sell) noexcept {
    if (buy.price >= sell.price) {
        if (buy.is_market() || sell.is_market()) {
            return true;
        }
        return buy.price >= sell.price;
    }
    return false;
}

std::vector<TradeIntent> MatchCoordinator::discover(const ProductOrders& orders) {
    std::vector<TradeIntent> intents;
    for (const auto& buy : orders.buys) {
        for (const auto& sell : orders.sells) {
            if (crosses(buy, sell)) {
                intents.push_back(TradeIntent{buy.id, sell.id});
            }
        }
    }
    return intents;
}

std::optional<TradeReport> MatchCoordinator::apply(ProductOrders& orders, ProductId product_id,
                                                   const TradeIntent& intent) {
    Order* buy = orders.find(Side::Buy, intent.buy_order_id);
    Order* sell = orders.find(Side::Sell, intent.sell_order_id);
    if (buy == nullptr || sell == nullptr) {
        return std::nullopt;
    }

    // Market orders adopt the counterparty price; buy side is checked first
    if (buy->is_market()) {
        buy->price = sell->price;
    } else if (sell->is_market()) {
        sell->price = buy->price;
    }

    const Amount traded = std::min(buy->amount, sell->amount);
    buy->amount -= traded;
    sell->amount -= traded;

    TradeReport report{
        .buy_order_id = buy->id,
        .sell_order_id = sell->id,
        .product_id = product_id,
        .price = sell->price,
        .amount = traded,
        .executed_at = std::chrono::system_clock::now()
    };

    // Erasing invalidates the pointers, so read fill state first
    const bool buy_filled = buy->amount == 0.0;
    const bool sell_filled = sell->amount == 0.0;
    if (buy_filled) {
        orders.erase(Side::Buy, report.buy_order_id);
    }
    if (sell_filled) {
        orders.erase(Side::Sell, report.sell_order_id);
    }

    return report;
}

MatchSummary MatchCoordinator::match(ProductId product_id) {
    MatchSummary summary;
    summary.product_id = product_id;
    std::vector<TradeReport> reports;

    // Matching never creates a product
    if (!store_.has_product(product_id)) {
        spdlog::debug("Product {}: no orders, nothing to match", product_id);
        return summary;
    }

    store_.with_product(product_id, [&](ProductOrders& orders) {
        const auto intents = discover(orders);
        summary.intents = intents.size();

        for (const auto& intent : intents) {
            auto report = apply(orders, product_id, intent);
            if (!report) {
                ++summary.skipped;
                spdlog::debug("Product {}: stale intent buy {} / sell {} skipped",
                              product_id, intent.buy_order_id, intent.sell_order_id);
                continue;
            }
            ++summary.applied;
            summary.volume += report->amount;
            reports.push_back(*report);
        }
    });

    // Deliver outside the guard so a handler may call back into the store
    if (handler_) {
        for (const auto& report : reports) {
            handler_(report);
        }
    }

    spdlog::debug("Product {}: match pass {} intents, {} trades, {} skipped",
                  product_id, summary.intents, summary.applied, summary.skipped);
    return summary;
}

}  // namespace matchcore
