#include "codec/json_codec.hpp"
#include <chrono>
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace matchcore {

using json = nlohmann::json;

namespace {

std::int64_t to_epoch_ms(WallTime t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

// Largest |ms| that converts to WallTime::duration without overflow
constexpr std::int64_t kMaxEpochMs =
    std::chrono::duration_cast<std::chrono::milliseconds>(WallTime::duration::max()).count();

WallTime from_epoch_ms(std::int64_t ms) {
    return WallTime(std::chrono::duration_cast<WallTime::duration>(std::chrono::milliseconds(ms)));
}

/// Signed integer field within [lo, hi]; throws std::invalid_argument otherwise
std::int64_t integer_field(const json& j, const char* field, std::int64_t lo, std::int64_t hi) {
    const json& v = j.at(field);
    if (!v.is_number_integer()) {
        throw std::invalid_argument(std::string("'") + field + "' must be an integer");
    }
    if (v.is_number_unsigned()) {
        const auto u = v.get<std::uint64_t>();
        if (hi < 0 || u > static_cast<std::uint64_t>(hi)) {
            throw std::invalid_argument(std::string("'") + field + "' is out of range");
        }
        return static_cast<std::int64_t>(u);
    }
    const auto i = v.get<std::int64_t>();
    if (i < lo || i > hi) {
        throw std::invalid_argument(std::string("'") + field + "' is out of range");
    }
    return i;
}

Error encoding_error(std::string message) {
    return Error{ErrorKind::Encoding, std::move(message)};
}

Error decoding_error(std::string message) {
    return Error{ErrorKind::Decoding, std::move(message)};
}

Result<json> order_to_json(const Order& order) {
    if (!std::isfinite(order.price)) {
        return Result<json>::Err(encoding_error(
            "order " + std::to_string(order.id) + " has a non-finite price"));
    }
    if (!std::isfinite(order.amount)) {
        return Result<json>::Err(encoding_error(
            "order " + std::to_string(order.id) + " has a non-finite amount"));
    }

    return Result<json>::Ok(json{
        {"id", order.id},
        {"kind", order.is_market() ? "market" : "limit"},
        {"price", order.price},
        {"amount", order.amount},
        {"priority", order.priority},
        {"created_at", to_epoch_ms(order.created_at)},
        {"product_id", order.product_id}
    });
}

/// Throws json::exception or std::invalid_argument on bad input;
/// callers translate to a Decoding error
Order order_from_json(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("order must be a JSON object");
    }
    for (const char* field : {"id", "kind", "price", "amount", "product_id"}) {
        if (!j.contains(field)) {
            throw std::invalid_argument(std::string("missing field '") + field + "'");
        }
    }
    if (!j["id"].is_number_unsigned()) {
        throw std::invalid_argument("'id' must be a non-negative integer");
    }
    if (!j["price"].is_number() || !j["amount"].is_number()) {
        throw std::invalid_argument("'price' and 'amount' must be numbers");
    }

    Order order;
    order.id = j["id"].get<OrderId>();

    const auto kind = j["kind"].get<std::string>();
    if (kind == "limit") {
        order.kind = OrderKind::Limit;
    } else if (kind == "market") {
        order.kind = OrderKind::Market;
    } else {
        throw std::invalid_argument("unknown order kind '" + kind + "'");
    }

    order.price = j["price"].get<Price>();
    order.amount = j["amount"].get<Amount>();
    if (j.contains("priority")) {
        order.priority = static_cast<Priority>(integer_field(
            j, "priority", std::numeric_limits<Priority>::min(), std::numeric_limits<Priority>::max()));
    }
    if (j.contains("created_at")) {
        order.created_at = from_epoch_ms(integer_field(j, "created_at", -kMaxEpochMs, kMaxEpochMs));
    }
    order.product_id = integer_field(
        j, "product_id", std::numeric_limits<ProductId>::min(), std::numeric_limits<ProductId>::max());
    return order;
}

Result<json> orders_to_json(const std::vector<Order>& orders) {
    json arr = json::array();
    for (const auto& order : orders) {
        auto j = order_to_json(order);
        if (j.is_err()) {
            return j;
        }
        arr.push_back(j.value());
    }
    return Result<json>::Ok(std::move(arr));
}

Result<Bytes> dump(const Result<json>& j) {
    return j.map([](const json& v) { return JsonCodec::to_bytes(v.dump()); });
}

}  // namespace

Bytes JsonCodec::to_bytes(std::string_view text) {
    return Bytes(text.begin(), text.end());
}

std::string JsonCodec::to_string(const Bytes& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

Result<json> JsonCodec::to_json(const Order& order) {
    return order_to_json(order);
}

Result<json> JsonCodec::to_json(const BookSnapshot& book) {
    auto buys = orders_to_json(book.buys);
    if (buys.is_err()) {
        return buys;
    }
    auto sells = orders_to_json(book.sells);
    if (sells.is_err()) {
        return sells;
    }
    return Result<json>::Ok(json{
        {"product_id", book.product_id},
        {"buys", buys.value()},
        {"sells", sells.value()}
    });
}

Result<Bytes> JsonCodec::encode(const Order& order) const {
    return dump(to_json(order));
}

Result<Bytes> JsonCodec::encode(const BookSnapshot& book) const {
    return dump(to_json(book));
}

Result<Bytes> JsonCodec::encode(const TradeReport& trade) const {
    if (!std::isfinite(trade.price) || !std::isfinite(trade.amount)) {
        return Result<Bytes>::Err(encoding_error("trade has a non-finite price or amount"));
    }
    json j{
        {"buy_order_id", trade.buy_order_id},
        {"sell_order_id", trade.sell_order_id},
        {"product_id", trade.product_id},
        {"price", trade.price},
        {"amount", trade.amount},
        {"executed_at", to_epoch_ms(trade.executed_at)}
    };
    return Result<Bytes>::Ok(to_bytes(j.dump()));
}

Result<Order> JsonCodec::decode_order(const Bytes& bytes) const {
    try {
        auto j = json::parse(bytes.begin(), bytes.end());
        return Result<Order>::Ok(order_from_json(j));
    } catch (const json::exception& e) {
        return Result<Order>::Err(decoding_error(std::string("JSON parse error: ") + e.what()));
    } catch (const std::exception& e) {
        return Result<Order>::Err(decoding_error(e.what()));
    }
}

Result<BookSnapshot> JsonCodec::decode_book(const Bytes& bytes) const {
    try {
        auto j = json::parse(bytes.begin(), bytes.end());
        if (!j.is_object()) {
            return Result<BookSnapshot>::Err(decoding_error("book must be a JSON object"));
        }

        BookSnapshot book;
        book.product_id = j.value("product_id", ProductId{0});

        for (const char* side : {"buys", "sells"}) {
            if (!j.contains(side)) {
                continue;
            }
            if (!j[side].is_array()) {
                return Result<BookSnapshot>::Err(
                    decoding_error(std::string("'") + side + "' must be an array"));
            }
            auto& target = std::string_view(side) == "buys" ? book.buys : book.sells;
            for (const auto& entry : j[side]) {
                target.push_back(order_from_json(entry));
            }
        }

        return Result<BookSnapshot>::Ok(std::move(book));

    } catch (const json::exception& e) {
        return Result<BookSnapshot>::Err(decoding_error(std::string("JSON parse error: ") + e.what()));
    } catch (const std::exception& e) {
        return Result<BookSnapshot>::Err(decoding_error(e.what()));
    }
}

}  // namespace matchcore
