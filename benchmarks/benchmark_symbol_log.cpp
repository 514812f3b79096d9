#include "core/record_codec.h"
#include "core/symbol_log.h"
#include "core/window_aggregator.h"
#include <benchmark/benchmark.h>
#include <filesystem>
#include <memory>
#include <random>
#include <vector>

using namespace tickagg;
namespace fs = std::filesystem;

namespace {

// 2022-07-21T22:07:00Z
const Timestamp kBase(1658441220000);

std::vector<TickRecord> makeTicks(int count, std::mt19937& rng) {
    std::uniform_real_distribution<double> price_dist{99.0, 101.0};
    std::vector<TickRecord> ticks;
    ticks.reserve(count);

    // One tick every 100ms, so count/600 minutes of history
    for (int i = 0; i < count; ++i) {
        Timestamp recorded_at = kBase + Timestamp(i * 100);
        ticks.push_back(TickRecord{"BINANCE:BTCUSDT", price_dist(rng), recorded_at, recorded_at});
    }
    return ticks;
}

} // namespace

class SymbolLogBenchmark : public benchmark::Fixture {
protected:
    fs::path path;
    std::unique_ptr<SymbolLog> log;
    std::mt19937 rng{42};
    Timestamp last_minute{0};

    void SetUp(const ::benchmark::State& state) override {
        path = fs::temp_directory_path() / "tickagg_benchmark_log.csv";
        fs::remove(path);
        log = std::make_unique<SymbolLog>(path.string());

        auto ticks = makeTicks(static_cast<int>(state.range(0)), rng);
        for (const auto& tick : ticks) {
            log->append(tick);
        }
        last_minute = floorToMinute(ticks.back().recorded_at);
    }

    void TearDown(const ::benchmark::State&) override {
        log.reset();
        fs::remove(path);
    }
};

BENCHMARK_DEFINE_F(SymbolLogBenchmark, ScanOneMinute)(benchmark::State& state) {
    for (auto _ : state) {
        auto records = log->scanWindow(last_minute, 1);
        benchmark::DoNotOptimize(records);
    }

    // Whole log is read on every scan
    state.SetItemsProcessed(state.iterations() * state.range(0));
}

BENCHMARK_DEFINE_F(SymbolLogBenchmark, ScanFifteenMinutes)(benchmark::State& state) {
    for (auto _ : state) {
        auto records = log->scanWindow(last_minute - std::chrono::minutes(14), 15);
        benchmark::DoNotOptimize(records);
    }

    state.SetItemsProcessed(state.iterations() * state.range(0));
}

BENCHMARK_DEFINE_F(SymbolLogBenchmark, Append)(benchmark::State& state) {
    Timestamp recorded_at = last_minute;
    for (auto _ : state) {
        recorded_at += Timestamp(1);
        log->append(TickRecord{"BINANCE:BTCUSDT", 100.0, recorded_at, recorded_at});
    }

    state.SetItemsProcessed(state.iterations());
}

BENCHMARK_REGISTER_F(SymbolLogBenchmark, ScanOneMinute)
    ->RangeMultiplier(10)
    ->Range(1000, 100000)
    ->Unit(benchmark::kMicrosecond);

BENCHMARK_REGISTER_F(SymbolLogBenchmark, ScanFifteenMinutes)
    ->RangeMultiplier(10)
    ->Range(1000, 100000)
    ->Unit(benchmark::kMicrosecond);

BENCHMARK_REGISTER_F(SymbolLogBenchmark, Append)
    ->Arg(1000)
    ->Unit(benchmark::kMicrosecond);

static void BM_AggregateCandlestick(benchmark::State& state) {
    std::mt19937 rng{42};
    auto ticks = makeTicks(static_cast<int>(state.range(0)), rng);

    for (auto _ : state) {
        auto summary = WindowAggregator::aggregateCandlestick(ticks, kBase);
        benchmark::DoNotOptimize(summary);
    }

    state.SetItemsProcessed(state.iterations() * ticks.size());
}

BENCHMARK(BM_AggregateCandlestick)->Range(64, 16384);

static void BM_AggregateMean(benchmark::State& state) {
    std::mt19937 rng{42};
    auto ticks = makeTicks(static_cast<int>(state.range(0)), rng);

    for (auto _ : state) {
        auto summary = WindowAggregator::aggregateMean(ticks);
        benchmark::DoNotOptimize(summary);
    }

    state.SetItemsProcessed(state.iterations() * ticks.size());
}

BENCHMARK(BM_AggregateMean)->Range(64, 16384);

static void BM_DecodeTick(benchmark::State& state) {
    const std::string row = "BINANCE:BTCUSDT,23012.07,1658441258376,1658441258400";

    for (auto _ : state) {
        auto record = RecordCodec::decodeTick(row);
        benchmark::DoNotOptimize(record);
    }
}

BENCHMARK(BM_DecodeTick);

BENCHMARK_MAIN();
