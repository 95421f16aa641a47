#include "orderbook/product_orders.hpp"
#include <algorithm>

namespace matchcore {

namespace {

template <typename Seq>
auto find_in(Seq& orders, OrderId id) {
    return std::find_if(orders.begin(), orders.end(),
                        [id](const Order& o) { return o.id == id; });
}

}  // namespace

Order* ProductOrders::find(Side s, OrderId id) noexcept {
    auto& orders = side(s);
    auto it = find_in(orders, id);
    return it == orders.end() ? nullptr : &*it;
}

const Order* ProductOrders::find(Side s, OrderId id) const noexcept {
    const auto& orders = side(s);
    auto it = find_in(orders, id);
    return it == orders.end() ? nullptr : &*it;
}

bool ProductOrders::erase(Side s, OrderId id) {
    auto& orders = side(s);
    auto it = find_in(orders, id);
    if (it == orders.end()) {
        return false;
    }
    orders.erase(it);
    return true;
}

}  // namespace matchcore
