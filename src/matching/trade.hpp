#pragma once

#include "core/types.hpp"
#include <functional>

namespace matchcore {

/// A crossing pair discovered during a match pass, awaiting application
struct TradeIntent {
    OrderId buy_order_id{0};
    OrderId sell_order_id{0};
};

/// One applied trade
struct TradeReport {
    OrderId buy_order_id{0};
    OrderId sell_order_id{0};
    ProductId product_id{0};
    Price price{0.0};
    Amount amount{0.0};
    WallTime executed_at{};
};

/// Observability sink, called once per applied trade
using TradeHandler = std::function<void(const TradeReport&)>;

}  // namespace matchcore
