#include "output/trade_logger.hpp"
#include <spdlog/spdlog.h>

namespace matchcore::output {

namespace {

void log_side(std::string_view label, const std::vector<Order>& orders) {
    spdlog::info("  {} ({}):", label, orders.size());
    for (const auto& o : orders) {
        spdlog::info("    ID: {}, Type: {}, Price: {:.2f}, Amount: {:.2f}, Priority: {}",
                     o.id, to_string(o.kind), o.price, o.amount, o.priority);
    }
}

}  // namespace

void TradeLogger::log_trade(const TradeReport& trade) {
    // Format: TRADE: buy <id> / sell <id> | product <id> | price | amount
    spdlog::info(
        "TRADE: buy {} / sell {} | product {} | price {:.2f} | amount {:.2f}",
        trade.buy_order_id, trade.sell_order_id,
        trade.product_id,
        trade.price,
        trade.amount
    );
}

void TradeLogger::log_match(const MatchSummary& summary) {
    spdlog::info(
        "MATCH: product {} | {} crossing | {} traded | {} stale | volume {:.2f}",
        summary.product_id,
        summary.intents,
        summary.applied,
        summary.skipped,
        summary.volume
    );
}

void TradeLogger::log_reprice(const RepriceSummary& summary) {
    const auto level = summary.dropped() > 0 ? spdlog::level::warn : spdlog::level::info;
    spdlog::log(level,
        "REPRICE: product {} -> {:.2f} | reference {:.4f} | kept {}/{} | dropped {}/{}",
        summary.product_id, summary.new_price,
        summary.reference_price,
        summary.retained_buys, summary.retained_sells,
        summary.dropped_buys, summary.dropped_sells
    );
}

void TradeLogger::log_book(std::string_view heading, const BookSnapshot& book) {
    spdlog::info("{} (product {})", heading, book.product_id);
    log_side("Buy Orders", book.buys);
    log_side("Sell Orders", book.sells);
}

}  // namespace matchcore::output
