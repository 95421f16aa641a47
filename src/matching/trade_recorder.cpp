#include "matching/trade_recorder.hpp"

namespace matchcore {

void TradeRecorder::record(const TradeReport& report) {
    std::lock_guard<std::mutex> lock(mutex_);
    trades_.push_back(report);
}

std::vector<TradeReport> TradeRecorder::trades() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return trades_;
}

std::vector<TradeReport> TradeRecorder::trades_for(ProductId product_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TradeReport> result;
    for (const auto& t : trades_) {
        if (t.product_id == product_id) {
            result.push_back(t);
        }
    }
    return result;
}

std::size_t TradeRecorder::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return trades_.size();
}

void TradeRecorder::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    trades_.clear();
}

TradeHandler TradeRecorder::handler() {
    return [this](const TradeReport& report) { record(report); };
}

}  // namespace matchcore
