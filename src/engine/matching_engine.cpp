#include "engine/matching_engine.hpp"
#include "output/trade_logger.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <utility>

namespace matchcore {

MatchingEngine::MatchingEngine(Price tolerance, std::shared_ptr<const OrderCodec> codec,
                               TradeHandler handler)
    : codec_(std::move(codec))
    , handler_(std::move(handler))
    , store_(tolerance)
    , estimator_(store_)
    , filter_(store_)
    , coordinator_(store_, [this](const TradeReport& report) { on_trade(report); })
{
    if (!codec_) {
        throw std::invalid_argument("MatchingEngine requires an encoding collaborator");
    }
    spdlog::debug("Matching engine created, tolerance {}", tolerance);
}

MatchingEngine::MatchingEngine(const Config& config, std::shared_ptr<const OrderCodec> codec,
                               TradeHandler handler)
    : MatchingEngine(config.engine.price_tolerance, std::move(codec), std::move(handler))
{}

bool MatchingEngine::add_buy(const Order& order) {
    return store_.add_buy(order);
}

bool MatchingEngine::add_sell(const Order& order) {
    return store_.add_sell(order);
}

bool MatchingEngine::cancel_buy(ProductId product_id, OrderId order_id) {
    return store_.cancel_buy(product_id, order_id);
}

bool MatchingEngine::cancel_sell(ProductId product_id, OrderId order_id) {
    return store_.cancel_sell(product_id, order_id);
}

MatchSummary MatchingEngine::match(ProductId product_id) {
    return coordinator_.match(product_id);
}

RepriceSummary MatchingEngine::update_price(ProductId product_id, Price new_price) {
    auto summary = filter_.apply_tolerance_and_reprice(product_id, new_price);
    output::TradeLogger::log_reprice(summary);
    return summary;
}

Price MatchingEngine::market_price(ProductId product_id) const {
    return estimator_.estimate(product_id);
}

BookSnapshot MatchingEngine::snapshot(ProductId product_id) const {
    return store_.snapshot(product_id);
}

Result<Bytes> MatchingEngine::encode_book(ProductId product_id) const {
    return codec_->encode(store_.snapshot(product_id));
}

Result<Order> MatchingEngine::add_encoded_buy(const Bytes& bytes) {
    return add_encoded(Side::Buy, bytes);
}

Result<Order> MatchingEngine::add_encoded_sell(const Bytes& bytes) {
    return add_encoded(Side::Sell, bytes);
}

Result<Order> MatchingEngine::add_encoded(Side side, const Bytes& bytes) {
    auto decoded = codec_->decode_order(bytes);
    if (decoded.is_err()) {
        spdlog::warn("Rejecting encoded {} order: {}", to_string(side), decoded.error().describe());
        return decoded;
    }

    const Order& order = decoded.value();
    const bool stored = side == Side::Buy ? store_.add_buy(order) : store_.add_sell(order);
    if (!stored) {
        return Result<Order>::Err(Error{
            ErrorKind::Decoding,
            "order " + std::to_string(order.id) + " has a non-positive amount"
        });
    }
    return decoded;
}

void MatchingEngine::on_trade(const TradeReport& report) const {
    output::TradeLogger::log_trade(report);
    if (handler_) {
        handler_(report);
    }
}

}  // namespace matchcore
