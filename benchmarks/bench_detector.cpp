#include <benchmark/benchmark.h>
#include "analytics/anomaly_detector.hpp"
#include "sim/reading_generator.hpp"
#include <boost/asio/thread_pool.hpp>
#include <string>

using namespace flowguard;

namespace {

ReadingTable make_feed(std::size_t rows, std::size_t meters) {
    sim::GeneratorConfig config;
    config.meters.clear();
    for (std::size_t i = 0; i < meters; ++i) {
        config.meters.push_back("METER-" + std::to_string(i));
    }
    sim::ReadingGenerator generator(config);
    return generator.generate(rows);
}

}  // namespace

// Benchmark z-score detection over a simulated feed
static void BM_DetectZScore(benchmark::State& state) {
    auto rows = static_cast<std::size_t>(state.range(0));
    auto feed = make_feed(rows, 8);
    auto detector = AnomalyDetector::create(DetectorParams{.window = 20});

    for (auto _ : state) {
        auto result = detector.value().detect(feed);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_DetectZScore)->Range(1 << 10, 1 << 16);

// Benchmark IQR detection (quartiles per position)
static void BM_DetectIqr(benchmark::State& state) {
    auto rows = static_cast<std::size_t>(state.range(0));
    auto feed = make_feed(rows, 8);
    auto detector = AnomalyDetector::create(DetectorParams{.window = 20, .method = "iqr"});

    for (auto _ : state) {
        auto result = detector.value().detect(feed);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_DetectIqr)->Range(1 << 10, 1 << 16);

// Benchmark per-sensor evaluation on a thread pool
static void BM_DetectThreadPool(benchmark::State& state) {
    auto threads = static_cast<std::size_t>(state.range(0));
    auto feed = make_feed(1 << 16, 32);
    auto detector = AnomalyDetector::create(DetectorParams{.window = 20, .method = "iqr"});
    boost::asio::thread_pool pool(threads);

    for (auto _ : state) {
        auto result = detector.value().detect(feed, pool);
        benchmark::DoNotOptimize(result);
    }
    pool.join();
    state.SetItemsProcessed(state.iterations() * (1 << 16));
}
BENCHMARK(BM_DetectThreadPool)->Arg(1)->Arg(2)->Arg(4)->Arg(8)->UseRealTime();

BENCHMARK_MAIN();
