// SPDX-License-Identifier: MIT
/**
 * @file vanilla_batch_benchmark.cc
 * @brief Throughput of the batch Black-Scholes kernels
 *
 * Measures, over batch sizes from 64 to 1M options:
 * - Normalization of spots and rates into canonical parameters
 * - Prices and a single Greek from canonical parameters
 * - The full Greek sheet (shared terms evaluated once)
 * - Sequential vs OpenMP-threaded evaluation
 */

#include <benchmark/benchmark.h>
#include "vanilla/option/market_params.hpp"
#include "vanilla/option/vanilla_pricer.hpp"
#include <stdexcept>
#include <utility>
#include <vector>

using namespace vanilla;

namespace {

MarketInputs make_chain(size_t n) {
    MarketInputs inputs;
    std::vector<double> spots(n, 100.0);
    std::vector<double> rates(n, 0.04);
    std::vector<double> dividends(n, 0.015);
    inputs.strikes.resize(n);
    inputs.volatilities.resize(n);
    inputs.expiries.resize(n);
    for (size_t i = 0; i < n; ++i) {
        const double u = static_cast<double>(i % 997) / 996.0;
        inputs.strikes[i] = 60.0 + 80.0 * u;
        inputs.volatilities[i] = 0.12 + 0.3 * u;
        inputs.expiries[i] = 0.05 + 2.0 * static_cast<double>(i % 89) / 88.0;
    }
    inputs.underlying = SpotPrices{std::move(spots)};
    inputs.discounting = DiscountRates{std::move(rates)};
    inputs.carry = ContinuousDividends{std::move(dividends)};
    return inputs;
}

MarketParams make_params(size_t n) {
    auto params = normalize(make_chain(n));
    if (!params) throw std::runtime_error("normalize failed");
    return std::move(*params);
}

VanillaPricer make_pricer(bool threaded) {
    VanillaPricer pricer;
    // Zero disables threading; 1 threads every batch
    pricer.set_parallel_threshold(threaded ? 1 : 0);
    return pricer;
}

// ===========================================================================
// Normalizer
// ===========================================================================

static void BM_Normalize(benchmark::State& state) {
    const auto inputs = make_chain(static_cast<size_t>(state.range(0)));
    for (auto _ : state) {
        auto params = normalize(inputs);
        benchmark::DoNotOptimize(params);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Normalize)->RangeMultiplier(16)->Range(64, 1 << 20);

// ===========================================================================
// Pricing kernel
// ===========================================================================

static void BM_Price(benchmark::State& state) {
    const auto params = make_params(static_cast<size_t>(state.range(0)));
    const auto pricer = make_pricer(state.range(1) != 0);
    for (auto _ : state) {
        auto prices = pricer.price(params, OptionType::PUT);
        benchmark::DoNotOptimize(prices);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Price)
    ->ArgsProduct({benchmark::CreateRange(64, 1 << 20, 16), {0, 1}})
    ->ArgNames({"n", "threaded"});

// ===========================================================================
// Greeks kernel
// ===========================================================================

static void BM_Vega(benchmark::State& state) {
    const auto params = make_params(static_cast<size_t>(state.range(0)));
    const auto pricer = make_pricer(state.range(1) != 0);
    for (auto _ : state) {
        auto vega = pricer.greek(params, Greek::Vega, OptionType::CALL);
        benchmark::DoNotOptimize(vega);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Vega)
    ->ArgsProduct({benchmark::CreateRange(64, 1 << 20, 16), {0, 1}})
    ->ArgNames({"n", "threaded"});

static void BM_AllGreeksSeparately(benchmark::State& state) {
    const auto params = make_params(static_cast<size_t>(state.range(0)));
    const auto pricer = make_pricer(false);
    for (auto _ : state) {
        auto price = pricer.price(params, OptionType::CALL);
        benchmark::DoNotOptimize(price);
        for (Greek greek : kAllGreeks) {
            auto values = pricer.greek(params, greek, OptionType::CALL);
            benchmark::DoNotOptimize(values);
        }
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_AllGreeksSeparately)->RangeMultiplier(16)->Range(64, 1 << 20);

static void BM_GreekSheet(benchmark::State& state) {
    const auto params = make_params(static_cast<size_t>(state.range(0)));
    const auto pricer = make_pricer(false);
    for (auto _ : state) {
        auto sheet = pricer.greeks(params, OptionType::CALL);
        benchmark::DoNotOptimize(sheet);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_GreekSheet)->RangeMultiplier(16)->Range(64, 1 << 20);

}  // namespace

BENCHMARK_MAIN();
