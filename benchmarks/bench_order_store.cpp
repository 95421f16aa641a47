#include <benchmark/benchmark.h>
#include "orderbook/order_store.hpp"
#include "pricing/market_price_estimator.hpp"
#include "pricing/price_tolerance_filter.hpp"
#include <spdlog/spdlog.h>

using namespace matchcore;

namespace {

Order make_order(OrderId id, Price price, ProductId product = 1) {
    return Order{
        .id = id,
        .kind = OrderKind::Limit,
        .price = price,
        .amount = 1.0,
        .priority = 0,
        .created_at = {},
        .product_id = product
    };
}

void fill(OrderStore& store, std::size_t per_side) {
    for (std::size_t i = 0; i < per_side; ++i) {
        store.add_buy(make_order(i, 100.0 - static_cast<double>(i) * 0.01));
        store.add_sell(make_order(i, 100.5 + static_cast<double>(i) * 0.01));
    }
}

}  // namespace

// Benchmark appending orders to one product
static void BM_OrderStoreAdd(benchmark::State& state) {
    spdlog::set_level(spdlog::level::off);
    OrderStore store(0.05);
    OrderId id = 0;

    for (auto _ : state) {
        benchmark::DoNotOptimize(store.add_buy(make_order(id++, 100.0)));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_OrderStoreAdd);

// Benchmark cancel + re-add at the tail of a book of varying depth (linear scan)
static void BM_OrderStoreCancel(benchmark::State& state) {
    spdlog::set_level(spdlog::level::off);
    auto depth = static_cast<std::size_t>(state.range(0));
    OrderStore store(0.05);
    fill(store, depth);

    OrderId target = 0;
    for (auto _ : state) {
        benchmark::DoNotOptimize(store.cancel_buy(1, target));
        store.add_buy(make_order(target, 100.0));
        target = (target + 1) % depth;
    }
}
BENCHMARK(BM_OrderStoreCancel)->Range(8, 4096);

// Benchmark lookup by ID
static void BM_OrderStoreFind(benchmark::State& state) {
    auto depth = static_cast<std::size_t>(state.range(0));
    OrderStore store(0.05);
    fill(store, depth);

    for (auto _ : state) {
        benchmark::DoNotOptimize(store.find(Side::Sell, 1, depth - 1));
    }
}
BENCHMARK(BM_OrderStoreFind)->Range(8, 4096);

// Benchmark the market estimate
static void BM_MarketPriceEstimate(benchmark::State& state) {
    OrderStore store(0.05);
    fill(store, 100);
    MarketPriceEstimator estimator(store);

    for (auto _ : state) {
        benchmark::DoNotOptimize(estimator.estimate(1));
    }
}
BENCHMARK(BM_MarketPriceEstimate);

// Benchmark a price update pass over a full book
static void BM_PriceUpdate(benchmark::State& state) {
    spdlog::set_level(spdlog::level::off);
    auto depth = static_cast<std::size_t>(state.range(0));

    for (auto _ : state) {
        state.PauseTiming();
        OrderStore store(1000.0);
        fill(store, depth);
        PriceToleranceFilter filter(store);
        state.ResumeTiming();

        benchmark::DoNotOptimize(filter.apply_tolerance_and_reprice(1, 100.25));
    }
    state.SetItemsProcessed(state.iterations() * depth * 2);
}
BENCHMARK(BM_PriceUpdate)->Range(64, 8192);

BENCHMARK_MAIN();
