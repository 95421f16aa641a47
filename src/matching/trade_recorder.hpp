#pragma once

#include "matching/trade.hpp"
#include <cstddef>
#include <mutex>
#include <vector>

namespace matchcore {

/// Thread-safe in-memory log of trade reports
class TradeRecorder {
public:
    void record(const TradeReport& report);

    /// All reports in the order they were recorded
    [[nodiscard]] std::vector<TradeReport> trades() const;

    [[nodiscard]] std::vector<TradeReport> trades_for(ProductId product_id) const;

    [[nodiscard]] std::size_t count() const;

    void clear();

    /// Handler that forwards into this recorder (recorder must outlive it)
    [[nodiscard]] TradeHandler handler();

private:
    mutable std::mutex mutex_;
    std::vector<TradeReport> trades_;
};

}  // namespace matchcore
