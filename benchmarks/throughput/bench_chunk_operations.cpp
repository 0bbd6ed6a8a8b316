/**
 * @file bench_chunk_operations.cpp
 * @brief Benchmarks for part planning, source reads and part digests
 */

#include <benchmark/benchmark.h>

#include <kcenon/resumable_upload/core/checksum.h>
#include <kcenon/resumable_upload/core/chunk_planner.h>
#include <kcenon/resumable_upload/core/upload_source.h>

#include "utils/benchmark_helpers.h"

namespace kcenon::resumable_upload::benchmark {

/**
 * @brief Planning cost grows with the number of parts
 */
static void BM_PlanChunks(::benchmark::State& state) {
    const auto file_size = state.range(0);
    const auto chunk_size = state.range(1);

    for (auto _ : state) {
        auto plan = plan_chunks(file_size, chunk_size);
        if (!plan) {
            state.SkipWithError("plan_chunks failed");
            return;
        }
        ::benchmark::DoNotOptimize(plan.value().data());
    }

    state.SetItemsProcessed(static_cast<int64_t>(calculate_total_chunks(file_size, chunk_size)) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Reading every part of a file through file_upload_source
 */
static void BM_FileSource_ReadParts(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const auto chunk_size = state.range(1);

    temp_file_manager temp_files;
    auto path = temp_files.create_random_file("read_parts.bin", file_size, 42);
    auto source = file_upload_source::open(path);
    if (!source) {
        state.SkipWithError("cannot open source file");
        return;
    }
    auto plan = plan_chunks(source.value()->size(), chunk_size);
    if (!plan) {
        state.SkipWithError("plan_chunks failed");
        return;
    }

    for (auto _ : state) {
        for (const auto& range : plan.value()) {
            auto bytes = source.value()->read(range.start_byte, range.size());
            if (!bytes) {
                state.SkipWithError("read failed");
                return;
            }
            ::benchmark::DoNotOptimize(bytes.value().data());
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
    state.SetLabel(format_bytes(file_size));
}

/**
 * @brief Content-MD5 header value for one part
 */
static void BM_Checksum_ContentMD5(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    auto data = generate_random_data(size, 7);

    for (auto _ : state) {
        auto digest = checksum::md5_base64(data);
        if (!digest) {
            state.SkipWithError("md5 failed");
            return;
        }
        ::benchmark::DoNotOptimize(digest.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_PlanChunks)
    ->Args({100 * static_cast<int64_t>(sizes::MB), 8 * static_cast<int64_t>(sizes::MB)})
    ->Args({10 * static_cast<int64_t>(sizes::GB), 8 * static_cast<int64_t>(sizes::MB)})
    ->Args({10 * static_cast<int64_t>(sizes::GB), 64 * static_cast<int64_t>(sizes::KB)});

BENCHMARK(BM_FileSource_ReadParts)
    ->Args({static_cast<int64_t>(sizes::MB), 256 * static_cast<int64_t>(sizes::KB)})
    ->Args({32 * static_cast<int64_t>(sizes::MB), 8 * static_cast<int64_t>(sizes::MB)})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_Checksum_ContentMD5)
    ->Arg(64 * static_cast<int64_t>(sizes::KB))
    ->Arg(8 * static_cast<int64_t>(sizes::MB));

}  // namespace kcenon::resumable_upload::benchmark
