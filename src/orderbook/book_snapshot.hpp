#pragma once

#include "core/order.hpp"
#include <vector>

namespace matchcore {

/// Immutable copy of one product's resting orders
struct BookSnapshot {
    ProductId product_id{0};
    std::vector<Order> buys;
    std::vector<Order> sells;

    [[nodiscard]] bool empty() const noexcept {
        return buys.empty() && sells.empty();
    }

    bool operator==(const BookSnapshot&) const = default;
};

}  // namespace matchcore
