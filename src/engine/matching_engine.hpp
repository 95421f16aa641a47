#pragma once

#include "codec/order_codec.hpp"
#include "core/config.hpp"
#include "core/order.hpp"
#include "core/status.hpp"
#include "matching/match_coordinator.hpp"
#include "matching/trade.hpp"
#include "orderbook/order_store.hpp"
#include "pricing/market_price_estimator.hpp"
#include "pricing/price_tolerance_filter.hpp"
#include <memory>

namespace matchcore {

/// Caller surface of the matching core
/// Owns the order store and wires the pricing and matching components to it.
/// All operations are thread-safe; operations on one product are serialized.
class MatchingEngine {
public:
    /// Create an engine
    /// @param tolerance Price tolerance shared by all products (finite, >= 0)
    /// @param codec Encoding collaborator (must not be null)
    /// @param handler Optional observer for trade reports; every trade is also logged
    MatchingEngine(Price tolerance, std::shared_ptr<const OrderCodec> codec,
                   TradeHandler handler = {});

    /// Create an engine from configuration
    MatchingEngine(const Config& config, std::shared_ptr<const OrderCodec> codec,
                   TradeHandler handler = {});

    // Non-copyable, non-movable
    MatchingEngine(const MatchingEngine&) = delete;
    MatchingEngine& operator=(const MatchingEngine&) = delete;

    /// @return false if the order was rejected (non-positive amount)
    bool add_buy(const Order& order);
    bool add_sell(const Order& order);

    /// Silent no-op if the order is not resting
    /// @return true if an order was removed
    bool cancel_buy(ProductId product_id, OrderId order_id);
    bool cancel_sell(ProductId product_id, OrderId order_id);

    /// Run a blocking match pass on one product
    MatchSummary match(ProductId product_id);

    /// Drop orders outside tolerance of the market estimate, then reprice the rest
    RepriceSummary update_price(ProductId product_id, Price new_price);

    /// Current market estimate (0 when the product has no resting orders)
    [[nodiscard]] Price market_price(ProductId product_id) const;

    [[nodiscard]] BookSnapshot snapshot(ProductId product_id) const;

    [[nodiscard]] const OrderStore& store() const noexcept {
        return store_;
    }

    [[nodiscard]] const OrderCodec& codec() const noexcept {
        return *codec_;
    }

    /// Encode the product's current book with the codec
    [[nodiscard]] Result<Bytes> encode_book(ProductId product_id) const;

    /// Decode an order and add it; nothing is stored on failure
    [[nodiscard]] Result<Order> add_encoded_buy(const Bytes& bytes);
    [[nodiscard]] Result<Order> add_encoded_sell(const Bytes& bytes);

private:
    Result<Order> add_encoded(Side side, const Bytes& bytes);
    void on_trade(const TradeReport& report) const;

    std::shared_ptr<const OrderCodec> codec_;
    TradeHandler handler_;

    OrderStore store_;
    MarketPriceEstimator estimator_;
    PriceToleranceFilter filter_;
    MatchCoordinator coordinator_;
};

}  // namespace matchcore
