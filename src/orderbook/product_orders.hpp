#pragma once

#include "core/order.hpp"
#include <cstddef>
#include <vector>

namespace matchcore {

/// Buy and sell sequences for one product, in insertion order
/// Not synchronized; reached only through OrderStore::with_product
struct ProductOrders {
    std::vector<Order> buys;
    std::vector<Order> sells;

    [[nodiscard]] std::vector<Order>& side(Side s) noexcept {
        return s == Side::Buy ? buys : sells;
    }

    [[nodiscard]] const std::vector<Order>& side(Side s) const noexcept {
        return s == Side::Buy ? buys : sells;
    }

    /// Linear scan for the first order with this ID
    /// @return Pointer into the live sequence, or nullptr if absent
    [[nodiscard]] Order* find(Side s, OrderId id) noexcept;
    [[nodiscard]] const Order* find(Side s, OrderId id) const noexcept;

    /// Remove the first order with this ID, keeping the rest in order
    /// @return false if no such order
    bool erase(Side s, OrderId id);

    [[nodiscard]] bool empty() const noexcept {
        return buys.empty() && sells.empty();
    }

    [[nodiscard]] std::size_t size() const noexcept {
        return buys.size() + sells.size();
    }
};

}  // namespace matchcore
