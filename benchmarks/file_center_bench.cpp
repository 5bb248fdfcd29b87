#include <benchmark/benchmark.h>
#include "filecenter/center/file_center.hpp"
#include "filecenter/core/log.hpp"
#include <cstring>
#include <vector>

using namespace filecenter::core;
using namespace filecenter::center;

namespace {

FileCenterConfig bench_config() {
    FileCenterConfig cfg{};
    cfg.codec_key = "bench codec key";
    return cfg;
}

// Distinct payloads so perennial puts do not deduplicate.
std::vector<u8> make_payload(size_t n, u64 counter) {
    std::vector<u8> data(n, 0x33);
    std::memcpy(data.data(), &counter, n < sizeof(counter) ? n : sizeof(counter));
    return data;
}

} // namespace

//=============================================================================
// Put
//=============================================================================

static void BM_PutPerennial(benchmark::State& state) {
    filecenter::core::log_init("off");
    FileCenter center;
    if (!is_ok(center.open(bench_config()))) {
        state.SkipWithError("open failed");
        return;
    }
    const size_t n = static_cast<size_t>(state.range(0));
    u64 counter = 0;
    for (auto _ : state) {
        state.PauseTiming();
        const std::vector<u8> data = make_payload(n, counter++);
        state.ResumeTiming();

        PutResult r{};
        Status s = center.put(filecenter::storage::source_buffer({data.data(), data.size()}), PutOptions{}, &r);
        benchmark::DoNotOptimize(s);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
    (void)center.close();
}
BENCHMARK(BM_PutPerennial)->Arg(1024)->Arg(262144)->Arg(1 << 20);

static void BM_PutDeduplicated(benchmark::State& state) {
    filecenter::core::log_init("off");
    FileCenter center;
    if (!is_ok(center.open(bench_config()))) {
        state.SkipWithError("open failed");
        return;
    }
    const std::vector<u8> data = make_payload(static_cast<size_t>(state.range(0)), 7);
    PutResult first{};
    if (!is_ok(center.put(filecenter::storage::source_buffer({data.data(), data.size()}), PutOptions{}, &first))) {
        state.SkipWithError("seed put failed");
        return;
    }
    for (auto _ : state) {
        PutResult r{};
        Status s = center.put(filecenter::storage::source_buffer({data.data(), data.size()}), PutOptions{}, &r);
        benchmark::DoNotOptimize(s);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
    (void)center.close();
}
BENCHMARK(BM_PutDeduplicated)->Arg(1024)->Arg(1 << 20);

//=============================================================================
// Get
//=============================================================================

static void BM_GetPerennial(benchmark::State& state) {
    filecenter::core::log_init("off");
    FileCenter center;
    if (!is_ok(center.open(bench_config()))) {
        state.SkipWithError("open failed");
        return;
    }
    const std::vector<u8> data = make_payload(static_cast<size_t>(state.range(0)), 11);
    PutResult stored{};
    if (!is_ok(center.put(filecenter::storage::source_buffer({data.data(), data.size()}), PutOptions{}, &stored))) {
        state.SkipWithError("seed put failed");
        return;
    }
    std::vector<u8> out;
    for (auto _ : state) {
        FileItem item{};
        Status s = center.get(stored.id, &item);
        if (is_ok(s)) {
            s = item.data.into_vec(&out);
        }
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(out.data());
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
    (void)center.close();
}
BENCHMARK(BM_GetPerennial)->Arg(1024)->Arg(262144)->Arg(1 << 20);

static void BM_TemporaryPutGet(benchmark::State& state) {
    filecenter::core::log_init("off");
    FileCenter center;
    if (!is_ok(center.open(bench_config()))) {
        state.SkipWithError("open failed");
        return;
    }
    const std::vector<u8> data = make_payload(4096, 3);
    PutOptions opts{};
    opts.temporary = true;
    std::vector<u8> out;
    for (auto _ : state) {
        PutResult r{};
        Status s = center.put(filecenter::storage::source_buffer({data.data(), data.size()}), opts, &r);
        FileItem item{};
        if (is_ok(s)) {
            s = center.get(r.id, &item);
        }
        if (is_ok(s)) {
            s = item.data.into_vec(&out);
        }
        benchmark::DoNotOptimize(s);
    }
    state.SetItemsProcessed(state.iterations());
    (void)center.close();
}
BENCHMARK(BM_TemporaryPutGet);
