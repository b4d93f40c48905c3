#include <benchmark/benchmark.h>
#include "pulse/Ticker.hpp"
#include <chrono>

using namespace std::chrono_literals;

// Create + close: thread start, timer arm, full retirement sequence.
static void BM_TickerCreateClose(benchmark::State& state) {
    for (auto _ : state) {
        pulse::Ticker t(1h);
        benchmark::DoNotOptimize(t.close());
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_TickerCreateClose)->Unit(benchmark::kMicrosecond);

// Round trip of a reset request through the control loop.
static void BM_TickerResetRoundTrip(benchmark::State& state) {
    pulse::Ticker t(1h);
    for (auto _ : state) {
        benchmark::DoNotOptimize(t.reset(1h));
    }
    (void)t.close();
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_TickerResetRoundTrip)->Unit(benchmark::kMicrosecond);

// Pause/resume pair.
static void BM_TickerStopResume(benchmark::State& state) {
    pulse::Ticker t(1h);
    for (auto _ : state) {
        benchmark::DoNotOptimize(t.stop());
        benchmark::DoNotOptimize(t.reset(1h));
    }
    (void)t.close();
    state.SetItemsProcessed(state.iterations() * 2);
}

BENCHMARK(BM_TickerStopResume)->Unit(benchmark::kMicrosecond);

// Tick delivery at the smallest interval; dominated by hand-off + rearm cost.
static void BM_TickerDelivery(benchmark::State& state) {
    pulse::Ticker t(std::chrono::microseconds(state.range(0)));
    for (auto _ : state) {
        auto tick = t.output().receive();
        benchmark::DoNotOptimize(tick);
    }
    (void)t.close();
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_TickerDelivery)->Arg(1)->Arg(100)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
