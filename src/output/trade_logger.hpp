#pragma once

#include "matching/match_coordinator.hpp"
#include "matching/trade.hpp"
#include "orderbook/book_snapshot.hpp"
#include "pricing/price_tolerance_filter.hpp"
#include <string_view>

namespace matchcore::output {

/// spdlog output for trades and book state
class TradeLogger {
public:
    /// One line per applied trade
    static void log_trade(const TradeReport& trade);

    /// Summary line for a finished match pass
    static void log_match(const MatchSummary& summary);

    /// Summary line for a price update
    static void log_reprice(const RepriceSummary& summary);

    /// Multi-line dump of both sides under a heading
    static void log_book(std::string_view heading, const BookSnapshot& book);
};

}  // namespace matchcore::output
