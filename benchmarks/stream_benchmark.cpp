/**
 * @file stream_benchmark.cpp
 * @brief Benchmarks for streaming documents
 */

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>

#include <bulkstream/bulkstream.hpp>

#include "bench_utils.hpp"
#include "stream/uid_rewriter.hpp"

namespace {

void SkipWithStatus(benchmark::State &state, const bulkstream::Status &status) {
    const std::string message = status.to_string();
    state.SkipWithError(message.c_str());
}

bulkstream::StreamRequest make_request(uint64_t limit, uint64_t multiplier,
                                       bool extended) {
    bulkstream::StreamRequest request;
    request.types = {"Patient"};
    request.limit = limit;
    request.multiplier = multiplier;
    request.extended = extended;
    return request;
}

/// Stream one request to completion, adding its output size to *bytes
bool drain(bulkstream::bench::SeededStore &store,
           const bulkstream::StreamRequest &request,
           const bulkstream::StreamConfig &config, size_t *bytes,
           bulkstream::Status *error) {
    bulkstream::ResourceStream stream(store.io(), store.storage(), request,
                                      config);
    bool ok = true;
    stream.on_data([bytes](std::string_view text) { *bytes += text.size(); });
    stream.on_error([&](const bulkstream::Status &status) {
        *error = status;
        ok = false;
    });
    stream.resume();

    store.io().restart();
    store.io().run();
    return ok;
}

// rows stored; the stream asks for rows * multiplier records
static void BM_Stream_Multiplier(benchmark::State &state) {
    const auto rows = static_cast<uint64_t>(state.range(0));
    const auto multiplier = static_cast<uint64_t>(state.range(1));

    bulkstream::bench::SeededStore store("stream_multiplier", rows);
    if (!store.status().ok()) {
        SkipWithStatus(state, store.status());
        return;
    }

    bulkstream::StreamConfig config;
    const auto request = make_request(rows * multiplier, multiplier, false);

    size_t bytes = 0;
    for (auto _ : state) {
        bulkstream::Status error;
        if (!drain(store, request, config, &bytes, &error)) {
            SkipWithStatus(state, error);
            return;
        }
    }

    state.SetItemsProcessed(state.iterations() *
                            static_cast<int64_t>(rows * multiplier));
    state.SetBytesProcessed(static_cast<int64_t>(bytes));
}

BENCHMARK(BM_Stream_Multiplier)
    ->Args({1000, 1})
    ->Args({1000, 4})
    ->Args({10000, 1});

static void BM_Stream_ChunkSize(benchmark::State &state) {
    constexpr uint64_t kRows = 5000;

    bulkstream::bench::SeededStore store("stream_chunk", kRows);
    if (!store.status().ok()) {
        SkipWithStatus(state, store.status());
        return;
    }

    bulkstream::StreamConfig config;
    config.rows_per_chunk = static_cast<uint64_t>(state.range(0));
    const auto request = make_request(kRows, 1, false);

    size_t bytes = 0;
    for (auto _ : state) {
        bulkstream::Status error;
        if (!drain(store, request, config, &bytes, &error)) {
            SkipWithStatus(state, error);
            return;
        }
    }

    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(kRows));
}

BENCHMARK(BM_Stream_ChunkSize)->Arg(50)->Arg(500)->Arg(5000);

static void BM_Stream_Extended(benchmark::State &state) {
    constexpr uint64_t kRows = 2000;

    bulkstream::bench::SeededStore store("stream_extended", kRows);
    if (!store.status().ok()) {
        SkipWithStatus(state, store.status());
        return;
    }

    bulkstream::StreamConfig config;
    const auto request = make_request(kRows, 1, true);

    size_t bytes = 0;
    for (auto _ : state) {
        bulkstream::Status error;
        if (!drain(store, request, config, &bytes, &error)) {
            SkipWithStatus(state, error);
            return;
        }
    }

    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(kRows));
}

BENCHMARK(BM_Stream_Extended);

static void BM_RewriteUids(benchmark::State &state) {
    const std::string document =
        R"({"resourceType":"Patient","id":"0b3a1f4e-6c2d-4e8f-9a1b-2c3d4e5f6a7b",)"
        R"("link":{"reference":"Patient/7f6e5d4c-3b2a-4190-8f7e-6d5c4b3a2910"},)"
        R"("name":[{"family":"Doe","given":["Jane"]}]})";

    for (auto _ : state) {
        auto rewritten = bulkstream::rewrite_uids(document, "p2-o1");
        benchmark::DoNotOptimize(rewritten);
    }

    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(document.size()));
}

BENCHMARK(BM_RewriteUids);

}  // namespace
