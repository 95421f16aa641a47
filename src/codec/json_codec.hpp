#pragma once

#include "codec/order_codec.hpp"
#include <nlohmann/json.hpp>
#include <string_view>

namespace matchcore {

/// JSON implementation of OrderCodec
///
/// Order:  {"id", "kind": "limit"|"market", "price", "amount",
///          "priority", "created_at" (ms since epoch), "product_id"}
/// Book:   {"product_id", "buys": [Order...], "sells": [Order...]}
/// Trade:  {"buy_order_id", "sell_order_id", "product_id", "price",
///          "amount", "executed_at"}
class JsonCodec final : public OrderCodec {
public:
    [[nodiscard]] Result<Bytes> encode(const Order& order) const override;
    [[nodiscard]] Result<Bytes> encode(const BookSnapshot& book) const override;
    [[nodiscard]] Result<Bytes> encode(const TradeReport& trade) const override;

    [[nodiscard]] Result<Order> decode_order(const Bytes& bytes) const override;
    [[nodiscard]] Result<BookSnapshot> decode_book(const Bytes& bytes) const override;

    /// Convenience conversions between text and Bytes
    [[nodiscard]] static Bytes to_bytes(std::string_view text);
    [[nodiscard]] static std::string to_string(const Bytes& bytes);

    /// JSON views used by the demo's pretty printer
    [[nodiscard]] static Result<nlohmann::json> to_json(const Order& order);
    [[nodiscard]] static Result<nlohmann::json> to_json(const BookSnapshot& book);
};

}  // namespace matchcore
