#include <benchmark/benchmark.h>
#include "usagedb/common/logger.h"
#include "usagedb/core/time_util.h"
#include "usagedb/query/query_engine.h"
#include "usagedb/storage/file_storage.h"
#include <chrono>
#include <filesystem>
#include <memory>
#include <vector>

using namespace usagedb;

namespace {

// 2024-01-01T00:00:00Z
constexpr core::Timestamp kStart = 1704067200000;

std::vector<core::UsageDataPoint> MakePoints(int count) {
    std::vector<core::UsageDataPoint> points;
    points.reserve(count);
    for (int i = 0; i < count; ++i) {
        core::UsageDataPoint point;
        // Spread over roughly two weeks so several buckets are touched
        point.timestamp = kStart + static_cast<core::Timestamp>(i) * 20 * core::kMillisPerMinute;
        point.date = core::FormatDate(point.timestamp);
        point.request_count = i % 50;
        point.total_cost = 0.01 * (i % 300);
        point.daily_limit = 100;
        point.usage_percentage = point.request_count;
        point.reset_time = core::FormatIsoTimestamp(core::StartOfDay(point.timestamp) + core::kMillisPerDay);
        point.session_id = "session_" + std::to_string(i % 16);
        points.push_back(point);
    }
    return points;
}

} // namespace

// Fixture for storage write and read benchmarks
class StorageBenchmark : public benchmark::Fixture {
protected:
    std::string test_dir_;
    std::shared_ptr<storage::FileBasedStorage> storage_;
    std::vector<core::UsageDataPoint> test_data_;

    void SetUp(const ::benchmark::State& state) override {
        test_dir_ = (std::filesystem::temp_directory_path() /
                     ("usagedb_bench_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count())))
                        .string();

        core::StorageConfig config;
        config.base_dir = test_dir_;
        config.clock = []() { return kStart + 30 * core::kMillisPerDay; };
        storage_ = storage::CreateFileBasedStorage(config, common::MakeNullLogger());
        auto status = storage_->init();
        if (!status.ok()) {
            storage_.reset();
        }

        // Pre-generate data to avoid measuring generation time
        test_data_ = MakePoints(static_cast<int>(state.range(0)));
    }

    void TearDown(const ::benchmark::State&) override {
        storage_.reset();
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }
};

// Every point rewrites its bucket
BENCHMARK_DEFINE_F(StorageBenchmark, SingleStore)(benchmark::State& state) {
    if (!storage_) {
        state.SkipWithError("storage init failed");
        return;
    }
    size_t idx = 0;
    for (auto _ : state) {
        auto result = storage_->store(test_data_[idx % test_data_.size()]);
        if (!result.success) {
            state.SkipWithError(result.error.value_or("store failed").c_str());
            break;
        }
        idx++;
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK_REGISTER_F(StorageBenchmark, SingleStore)
    ->Arg(100)
    ->Unit(benchmark::kMicrosecond);

// One rewrite per bucket for the whole batch
BENCHMARK_DEFINE_F(StorageBenchmark, BatchStore)(benchmark::State& state) {
    if (!storage_) {
        state.SkipWithError("storage init failed");
        return;
    }
    for (auto _ : state) {
        auto result = storage_->store_batch(test_data_);
        if (!result.success) {
            state.SkipWithError(result.error.value_or("store_batch failed").c_str());
            break;
        }
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(test_data_.size()));
}

BENCHMARK_REGISTER_F(StorageBenchmark, BatchStore)
    ->Arg(100)
    ->Arg(1000)
    ->Unit(benchmark::kMillisecond);

BENCHMARK_DEFINE_F(StorageBenchmark, RangeQuery)(benchmark::State& state) {
    if (!storage_ || !storage_->store_batch(test_data_).success) {
        state.SkipWithError("seeding failed");
        return;
    }
    for (auto _ : state) {
        auto result = storage_->query(storage::QueryRange(kStart, kStart + 14 * core::kMillisPerDay));
        if (!result.ok()) {
            state.SkipWithError(result.error().c_str());
            break;
        }
        benchmark::DoNotOptimize(result.value().size());
    }
}

BENCHMARK_REGISTER_F(StorageBenchmark, RangeQuery)
    ->Arg(1000)
    ->Unit(benchmark::kMillisecond);

// Filtered and sorted query with the result cache on or off
BENCHMARK_DEFINE_F(StorageBenchmark, EngineQuery)(benchmark::State& state) {
    if (!storage_ || !storage_->store_batch(test_data_).success) {
        state.SkipWithError("seeding failed");
        return;
    }
    core::QueryEngineConfig config;
    config.base_dir = test_dir_ + "/query-engine";
    config.cache.enabled = state.range(1) != 0;
    query::QueryEngine engine(storage_, nullptr, config, common::MakeNullLogger());

    query::QueryOptions options;
    options.time_range = core::TimeRange(kStart, kStart + 14 * core::kMillisPerDay);
    options.sort = {query::SortSpec{"totalCost", query::SortDirection::DESC}};
    options.limit = 10;
    std::vector<query::QueryFilter> filters = {query::Where("sessionId", query::FilterOperator::EQ, "session_3")};

    for (auto _ : state) {
        auto result = engine.query(filters, options);
        if (!result.ok()) {
            state.SkipWithError(result.error().c_str());
            break;
        }
        benchmark::DoNotOptimize(result.value().rows.size());
    }
}

BENCHMARK_REGISTER_F(StorageBenchmark, EngineQuery)
    ->Args({1000, 0})
    ->Args({1000, 1})
    ->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
