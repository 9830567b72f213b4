#include <benchmark/benchmark.h>
#include "analytics/rolling_window.hpp"
#include <random>

using namespace flowguard;

// Benchmark single push
static void BM_RollingWindowPush(benchmark::State& state) {
    RollingWindow window(20);
    double value = 10.0;

    for (auto _ : state) {
        window.push(value);
        value += 0.01;
        benchmark::DoNotOptimize(window.complete());
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_RollingWindowPush);

// Benchmark mean + population std at various window sizes
static void BM_RollingWindowMeanStd(benchmark::State& state) {
    auto size = static_cast<std::size_t>(state.range(0));
    RollingWindow window(size);

    std::mt19937 rng(42);
    std::normal_distribution<double> flow(20.0, 2.0);
    for (std::size_t i = 0; i < size; ++i) {
        window.push(flow(rng));
    }

    for (auto _ : state) {
        benchmark::DoNotOptimize(window.mean());
        benchmark::DoNotOptimize(window.population_std_dev());
    }
}
BENCHMARK(BM_RollingWindowMeanStd)->Range(8, 1024);

// Benchmark quartiles (sort per call) at various window sizes
static void BM_RollingWindowQuartiles(benchmark::State& state) {
    auto size = static_cast<std::size_t>(state.range(0));
    RollingWindow window(size);

    std::mt19937 rng(42);
    std::normal_distribution<double> flow(20.0, 2.0);
    for (std::size_t i = 0; i < size; ++i) {
        window.push(flow(rng));
    }

    for (auto _ : state) {
        benchmark::DoNotOptimize(window.quartiles());
    }
}
BENCHMARK(BM_RollingWindowQuartiles)->Range(8, 1024);

// Benchmark sliding with occasional missing readings
static void BM_RollingWindowSlidingWithGaps(benchmark::State& state) {
    RollingWindow window(20);

    std::mt19937 rng(42);
    std::normal_distribution<double> flow(20.0, 2.0);
    std::bernoulli_distribution gap(0.01);

    for (auto _ : state) {
        if (gap(rng)) {
            window.push(std::nullopt);
        } else {
            window.push(flow(rng));
        }
        if (window.complete()) {
            benchmark::DoNotOptimize(window.mean());
        }
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_RollingWindowSlidingWithGaps);

BENCHMARK_MAIN();
