#pragma once

#include "core/order.hpp"
#include "orderbook/book_snapshot.hpp"
#include "orderbook/product_orders.hpp"
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <type_traits>
#include <vector>

namespace matchcore {

/// Per-product store of resting buy and sell orders
///
/// Each product has its own exclusivity guard, so every operation on a
/// product (add, cancel, reprice, a full match pass) is one critical
/// section with respect to every other operation on that product.
/// Orders are owned by value; callers only ever see copies.
class OrderStore {
public:
    /// @param tolerance Maximum deviation from the market estimate kept on reprice
    explicit OrderStore(Price tolerance);

    OrderStore(const OrderStore&) = delete;
    OrderStore& operator=(const OrderStore&) = delete;

    /// Append to the tail of the product's buy sequence
    /// @return false if the amount is not strictly positive (order not stored)
    bool add_buy(const Order& order);

    /// Append to the tail of the product's sell sequence
    /// @return false if the amount is not strictly positive (order not stored)
    bool add_sell(const Order& order);

    /// Remove the first buy with this ID; no-op if absent
    /// @return true if an order was removed
    bool cancel_buy(ProductId product_id, OrderId order_id);

    /// Remove the first sell with this ID; no-op if absent
    /// @return true if an order was removed
    bool cancel_sell(ProductId product_id, OrderId order_id);

    /// Look up a resting order by ID
    [[nodiscard]] std::optional<Order> find(Side side, ProductId product_id, OrderId order_id) const;

    /// Copy of the product's sequences (empty if the product is unknown)
    [[nodiscard]] BookSnapshot snapshot(ProductId product_id) const;

    /// Products that have ever received an order, ascending
    [[nodiscard]] std::vector<ProductId> products() const;

    [[nodiscard]] std::size_t order_count(Side side, ProductId product_id) const;

    /// True once the product has received an order
    [[nodiscard]] bool has_product(ProductId product_id) const;

    [[nodiscard]] Price tolerance() const noexcept {
        return tolerance_;
    }

    /// Run fn(ProductOrders&) while holding the product's guard
    /// The product entry is created if it does not exist yet.
    template <typename F>
    decltype(auto) with_product(ProductId product_id, F&& fn) {
        Book& book = get_or_create(product_id);
        std::lock_guard<std::mutex> lock(book.mutex);
        return std::forward<F>(fn)(book.orders);
    }

    /// Read-only variant; an unknown product is presented as empty
    template <typename F>
    decltype(auto) with_product(ProductId product_id, F&& fn) const {
        const Book* book = find_book(product_id);
        if (book == nullptr) {
            static const ProductOrders kEmpty{};
            return std::forward<F>(fn)(kEmpty);
        }
        std::lock_guard<std::mutex> lock(book->mutex);
        return std::forward<F>(fn)(static_cast<const ProductOrders&>(book->orders));
    }

private:
    struct Book {
        mutable std::mutex mutex;
        ProductOrders orders;
    };

    bool insert(Side side, const Order& order);
    bool cancel(Side side, ProductId product_id, OrderId order_id);

    Book& get_or_create(ProductId product_id);
    [[nodiscard]] const Book* find_book(ProductId product_id) const;

    const Price tolerance_;

    // Guards the map structure only; each Book has its own mutex
    mutable std::shared_mutex books_mutex_;
    std::map<ProductId, std::unique_ptr<Book>> books_;
};

}  // namespace matchcore
