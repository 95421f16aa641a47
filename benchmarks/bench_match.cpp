#include <benchmark/benchmark.h>
#include "matching/match_coordinator.hpp"
#include "orderbook/order_store.hpp"
#include <spdlog/spdlog.h>
#include <random>

using namespace matchcore;

namespace {

// Random book: prices uniform in [0, 100), amounts in [0, 10), alternating sides
void fill_random(OrderStore& store, std::size_t orders, std::uint32_t seed) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> price(0.0, 100.0);
    std::uniform_real_distribution<double> amount(0.01, 10.0);
    std::uniform_int_distribution<int> priority(0, 9);

    for (std::size_t i = 0; i < orders; ++i) {
        Order order{
            .id = i,
            .kind = OrderKind::Limit,
            .price = price(rng),
            .amount = amount(rng),
            .priority = priority(rng),
            .created_at = std::chrono::system_clock::now(),
            .product_id = 1
        };
        if (i % 2 == 0) {
            store.add_buy(order);
        } else {
            store.add_sell(order);
        }
    }
}

}  // namespace

// Benchmark a full pass over a freshly built random book
static void BM_MatchRandomBook(benchmark::State& state) {
    spdlog::set_level(spdlog::level::off);
    auto orders = static_cast<std::size_t>(state.range(0));
    std::size_t trades = 0;

    for (auto _ : state) {
        state.PauseTiming();
        OrderStore store(0.05);
        fill_random(store, orders, 42);
        MatchCoordinator coordinator(store, [&trades](const TradeReport&) { ++trades; });
        state.ResumeTiming();

        benchmark::DoNotOptimize(coordinator.match(1));
    }
    state.counters["trades/pass"] = benchmark::Counter(
        static_cast<double>(trades), benchmark::Counter::kAvgIterations);
}
BENCHMARK(BM_MatchRandomBook)->RangeMultiplier(4)->Range(16, 1024)->Unit(benchmark::kMicrosecond);

// Benchmark re-matching an already drained book (discovery cost only)
static void BM_RematchDrainedBook(benchmark::State& state) {
    spdlog::set_level(spdlog::level::off);
    auto orders = static_cast<std::size_t>(state.range(0));
    OrderStore store(0.05);
    fill_random(store, orders, 7);
    MatchCoordinator coordinator(store, TradeHandler{});
    coordinator.match(1);

    for (auto _ : state) {
        benchmark::DoNotOptimize(coordinator.match(1));
    }
}
BENCHMARK(BM_RematchDrainedBook)->RangeMultiplier(4)->Range(16, 4096);

// Benchmark discovery alone over a fully crossing book
static void BM_DiscoverCrossingPairs(benchmark::State& state) {
    auto per_side = static_cast<std::size_t>(state.range(0));
    ProductOrders orders;
    for (std::size_t i = 0; i < per_side; ++i) {
        orders.buys.push_back(Order{.id = i, .price = 10.0, .amount = 1.0, .product_id = 1});
        orders.sells.push_back(Order{.id = i, .price = 9.0, .amount = 1.0, .product_id = 1});
    }

    for (auto _ : state) {
        benchmark::DoNotOptimize(MatchCoordinator::discover(orders));
    }
    state.SetItemsProcessed(state.iterations() * per_side * per_side);
}
BENCHMARK(BM_DiscoverCrossingPairs)->Range(8, 512);

BENCHMARK_MAIN();
