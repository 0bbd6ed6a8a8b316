/**
 * @file bench_session_engine.cpp
 * @brief Benchmarks for session persistence and progress computation
 */

#include <benchmark/benchmark.h>

#include <kcenon/resumable_upload/engine/progress_reporter.h>
#include <kcenon/resumable_upload/storage/session_store.h>

#include "utils/benchmark_helpers.h"

namespace kcenon::resumable_upload::benchmark {

namespace {

constexpr int64_t bench_chunk = 8 * static_cast<int64_t>(sizes::MB);

auto file_size_for(int64_t parts) -> int64_t {
    return parts * bench_chunk;
}

}  // namespace

static void BM_SessionJson_Serialize(::benchmark::State& state) {
    const auto parts = static_cast<int32_t>(state.range(0));
    auto session = make_session(file_size_for(parts), bench_chunk, parts);

    for (auto _ : state) {
        auto text = session_to_json(session);
        ::benchmark::DoNotOptimize(text.data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

static void BM_SessionJson_Parse(::benchmark::State& state) {
    const auto parts = static_cast<int32_t>(state.range(0));
    auto text = session_to_json(make_session(file_size_for(parts), bench_chunk, parts));

    for (auto _ : state) {
        auto parsed = session_from_json(text);
        if (!parsed) {
            state.SkipWithError("session_from_json failed");
            return;
        }
        ::benchmark::DoNotOptimize(parsed.value().parts.data());
    }
    state.SetBytesProcessed(static_cast<int64_t>(text.size()) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief One confirmed part per iteration, each a full atomic record rewrite
 */
static void BM_SessionStore_AddPart(::benchmark::State& state) {
    const auto parts = static_cast<int32_t>(state.range(0));

    temp_file_manager temp_files;
    session_store store(session_store_config(temp_files.create_directory("store")));

    auto session = make_session(file_size_for(parts), bench_chunk, 0);
    if (!store.create(session)) {
        state.SkipWithError("create failed");
        return;
    }

    int32_t next = 1;
    for (auto _ : state) {
        session_patch patch;
        patch.add_parts.push_back(
            {next, "etag-" + std::to_string(next), bench_chunk,
             std::chrono::system_clock::now()});
        auto updated = store.update(session.id, patch);
        if (!updated) {
            state.SkipWithError("update failed");
            return;
        }
        next = next % parts + 1;
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

static void BM_ProgressReporter_Snapshot(::benchmark::State& state) {
    const auto parts = static_cast<int32_t>(state.range(0));
    auto session = make_session(file_size_for(parts), bench_chunk, parts / 2);
    progress_reporter reporter;

    for (auto _ : state) {
        auto snapshot = reporter.snapshot(session);
        ::benchmark::DoNotOptimize(snapshot.metrics.throughput);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_SessionJson_Serialize)->Arg(16)->Arg(1250)->Arg(10000);
BENCHMARK(BM_SessionJson_Parse)->Arg(16)->Arg(1250)->Arg(10000);
BENCHMARK(BM_SessionStore_AddPart)->Arg(16)->Arg(1250)->Unit(::benchmark::kMicrosecond);
BENCHMARK(BM_ProgressReporter_Snapshot)->Arg(16)->Arg(1250)->Arg(10000);

}  // namespace kcenon::resumable_upload::benchmark
