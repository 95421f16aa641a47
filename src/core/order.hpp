#pragma once

#include "core/types.hpp"
#include <string_view>

namespace matchcore {

enum class Side {
    Buy,
    Sell
};

enum class OrderKind {
    Limit,
    Market
};

[[nodiscard]] constexpr std::string_view to_string(Side side) noexcept {
    return side == Side::Buy ? "BUY" : "SELL";
}

[[nodiscard]] constexpr std::string_view to_string(OrderKind kind) noexcept {
    return kind == OrderKind::Limit ? "LIMIT" : "MARKET";
}

/// A resting order
/// Market orders conventionally carry price 0 until matched
struct Order {
    OrderId id{0};
    OrderKind kind{OrderKind::Limit};
    Price price{0.0};
    Amount amount{0.0};
    Priority priority{0};
    WallTime created_at{};
    ProductId product_id{0};

    [[nodiscard]] bool is_market() const noexcept {
        return kind == OrderKind::Market;
    }

    bool operator==(const Order&) const = default;
};

}  // namespace matchcore
