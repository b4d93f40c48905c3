#include <benchmark/benchmark.h>
#include "pulse/rt/CancelScope.hpp"
#include "pulse/rt/Channel.hpp"
#include <thread>

// One producer, one consumer, values handed over one at a time.
static void BM_ChannelHandoff(benchmark::State& state) {
    pulse::rt::Channel<int> ch;
    auto scope = pulse::rt::CancelScope::background();

    std::thread producer([&]{
        int i = 0;
        while (ch.send(i++, scope)) {}
    });

    for (auto _ : state) {
        auto v = ch.receive();
        benchmark::DoNotOptimize(v);
    }

    ch.close();
    producer.join();
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_ChannelHandoff)->Unit(benchmark::kNanosecond);

static void BM_CancelScopeChildCreate(benchmark::State& state) {
    auto root = pulse::rt::CancelScope::background();
    for (auto _ : state) {
        auto child = pulse::rt::CancelScope::withParent(root);
        benchmark::DoNotOptimize(child);
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_CancelScopeChildCreate)->Unit(benchmark::kNanosecond);
