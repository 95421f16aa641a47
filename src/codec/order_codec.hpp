#pragma once

#include "core/order.hpp"
#include "core/status.hpp"
#include "core/types.hpp"
#include "matching/trade.hpp"
#include "orderbook/book_snapshot.hpp"

namespace matchcore {

/// Pluggable encode/decode capability for orders and books
///
/// Encoding fails with ErrorKind::Encoding on a value the format cannot
/// represent; decoding fails with ErrorKind::Decoding on malformed input.
/// Implementations must not hold references into engine state.
class OrderCodec {
public:
    virtual ~OrderCodec() = default;

    [[nodiscard]] virtual Result<Bytes> encode(const Order& order) const = 0;
    [[nodiscard]] virtual Result<Bytes> encode(const BookSnapshot& book) const = 0;
    [[nodiscard]] virtual Result<Bytes> encode(const TradeReport& trade) const = 0;

    [[nodiscard]] virtual Result<Order> decode_order(const Bytes& bytes) const = 0;
    [[nodiscard]] virtual Result<BookSnapshot> decode_book(const Bytes& bytes) const = 0;
};

}  // namespace matchcore
