#include "orderbook/order_store.hpp"
#include <spdlog/spdlog.h>
#include <cmath>
#include <stdexcept>

namespace matchcore {

OrderStore::OrderStore(Price tolerance)
    : tolerance_(tolerance)
{
    if (!std::isfinite(tolerance) || tolerance < 0.0) {
        throw std::invalid_argument("price tolerance must be a finite value >= 0");
    }
}

bool OrderStore::add_buy(const Order& order) {
    return insert(Side::Buy, order);
}

bool OrderStore::add_sell(const Order& order) {
    return insert(Side::Sell, order);
}

bool OrderStore::insert(Side side, const Order& order) {
    // Resting orders must always have a positive amount
    if (!(order.amount > 0.0)) {
        spdlog::warn("Rejecting {} order {} for product {}: amount {} is not positive",
                     to_string(side), order.id, order.product_id, order.amount);
        return false;
    }

    with_product(order.product_id, [&](ProductOrders& orders) {
        orders.side(side).push_back(order);
    });
    return true;
}

bool OrderStore::cancel_buy(ProductId product_id, OrderId order_id) {
    return cancel(Side::Buy, product_id, order_id);
}

bool OrderStore::cancel_sell(ProductId product_id, OrderId order_id) {
    return cancel(Side::Sell, product_id, order_id);
}

bool OrderStore::cancel(Side side, ProductId product_id, OrderId order_id) {
    if (!has_product(product_id)) {
        spdlog::debug("Cancel {} {}: unknown product {}", to_string(side), order_id, product_id);
        return false;
    }

    bool removed = with_product(product_id, [&](ProductOrders& orders) {
        return orders.erase(side, order_id);
    });
    if (!removed) {
        spdlog::debug("Cancel {} {}: not resting in product {}", to_string(side), order_id, product_id);
    }
    return removed;
}

std::optional<Order> OrderStore::find(Side side, ProductId product_id, OrderId order_id) const {
    return with_product(product_id, [&](const ProductOrders& orders) -> std::optional<Order> {
        if (const Order* order = orders.find(side, order_id)) {
            return *order;
        }
        return std::nullopt;
    });
}

BookSnapshot OrderStore::snapshot(ProductId product_id) const {
    return with_product(product_id, [&](const ProductOrders& orders) {
        return BookSnapshot{
            .product_id = product_id,
            .buys = orders.buys,
            .sells = orders.sells
        };
    });
}

std::vector<ProductId> OrderStore::products() const {
    std::shared_lock<std::shared_mutex> lock(books_mutex_);
    std::vector<ProductId> ids;
    ids.reserve(books_.size());
    for (const auto& [id, book] : books_) {
        ids.push_back(id);
    }
    return ids;
}

std::size_t OrderStore::order_count(Side side, ProductId product_id) const {
    return with_product(product_id, [side](const ProductOrders& orders) {
        return orders.side(side).size();
    });
}

bool OrderStore::has_product(ProductId product_id) const {
    return find_book(product_id) != nullptr;
}

OrderStore::Book& OrderStore::get_or_create(ProductId product_id) {
    {
        std::shared_lock<std::shared_mutex> lock(books_mutex_);
        auto it = books_.find(product_id);
        if (it != books_.end()) {
            return *it->second;
        }
    }

    std::unique_lock<std::shared_mutex> lock(books_mutex_);
    auto& slot = books_[product_id];
    if (!slot) {
        slot = std::make_unique<Book>();
    }
    return *slot;
}

const OrderStore::Book* OrderStore::find_book(ProductId product_id) const {
    std::shared_lock<std::shared_mutex> lock(books_mutex_);
    auto it = books_.find(product_id);
    return it == books_.end() ? nullptr : it->second.get();
}

}  // namespace matchcore
