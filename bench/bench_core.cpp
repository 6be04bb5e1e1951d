#include <benchmark/benchmark.h>
#include <cstdint>
#include <memory>

#include "rateguard/factory.h"

namespace {

rg::LimiterConfig bench_config(int alg) {
    switch (static_cast<rg::Algorithm>(alg)) {
        case rg::Algorithm::kFixedWindow:
            return rg::FixedWindowCounter::Config{1000, 100};
        case rg::Algorithm::kLeakyBucket:
            return rg::LeakyBucket::Config{1000, 1, 10};
        case rg::Algorithm::kTokenBucket:
            return rg::TokenBucket::Config{1000, 1, 10};
        case rg::Algorithm::kSlidingWindow:
            return rg::SlidingWindowCounter::Config{1000, 10, 10};
        case rg::Algorithm::kApproximateSlidingWindow:
            return rg::ApproximateSlidingWindow::Config{1000, 100};
    }
    return rg::FixedWindowCounter::Config{1000, 100};
}

} // namespace

// One acquire per tick, so the limiter keeps refilling/sliding.
static void BM_AcquireAdvancingTick(benchmark::State& state) {
    auto limiter = rg::make_rate_limiter(bench_config(static_cast<int>(state.range(0))));
    state.SetLabel(rg::to_string(static_cast<rg::Algorithm>(state.range(0))));
    rg::Uint tick = 0;
    for (auto _ : state) {
        benchmark::DoNotOptimize(limiter->try_acquire(tick++, 1));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_AcquireAdvancingTick)->DenseRange(0, 4);

static void BM_VerboseRejected(benchmark::State& state) {
    auto limiter = rg::make_rate_limiter(bench_config(static_cast<int>(state.range(0))));
    state.SetLabel(rg::to_string(static_cast<rg::Algorithm>(state.range(0))));
    if (limiter->try_acquire(0, limiter->capacity()) != rg::Outcome::kAllowed) {
        state.SkipWithError("setup acquire failed");
        return;
    }
    for (auto _ : state) {
        benchmark::DoNotOptimize(limiter->try_acquire_verbose(0, 1));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_VerboseRejected)->DenseRange(0, 4);

static void BM_SlidingWindowBucketCount(benchmark::State& state) {
    rg::SlidingWindowCounter limiter(1u << 30, 1, static_cast<rg::Uint>(state.range(0)));
    rg::Uint tick = 0;
    for (auto _ : state) {
        benchmark::DoNotOptimize(limiter.try_acquire(tick++, 1));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_SlidingWindowBucketCount)->RangeMultiplier(4)->Range(4, 1024);

// Hot limiter shared by every benchmark thread.
static std::unique_ptr<rg::RateLimiter> g_hot;

static void BM_HotLimiterContended(benchmark::State& state) {
    if (state.thread_index() == 0) {
        g_hot = std::make_unique<rg::TokenBucket>(rg::kUintMax, 1, rg::kUintMax);
    }
    std::int64_t contended = 0;
    for (auto _ : state) {
        if (g_hot->try_acquire(0, 1) == rg::Outcome::kContentionFailure) ++contended;
    }
    state.counters["contended"] = benchmark::Counter(static_cast<double>(contended), benchmark::Counter::kAvgThreads);
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_HotLimiterContended)->ThreadRange(1, 8);

BENCHMARK_MAIN();
