#include <string>

#include <benchmark/benchmark.h>

#include "filecenter/security/id_token.hpp"

namespace {
filecenter::security::IdTokenKeys bench_keys() {
    filecenter::security::IdTokenKeys keys{};
    const filecenter::core::Status s = filecenter::security::id_token_keys_init("bench codec key", &keys);
    if (!filecenter::core::is_ok(s)) {
        keys.ready = false;
    }
    return keys;
}
} // namespace

static void BM_IdTokenKeysInit(benchmark::State& state) {
    for (auto _ : state) {
        filecenter::security::IdTokenKeys keys{};
        const filecenter::core::Status s = filecenter::security::id_token_keys_init("bench codec key", &keys);
        benchmark::DoNotOptimize(static_cast<filecenter::core::u16>(s.code));
        benchmark::DoNotOptimize(keys);
    }
}
BENCHMARK(BM_IdTokenKeysInit);

static void BM_IdTokenEncrypt(benchmark::State& state) {
    const filecenter::security::IdTokenKeys keys = bench_keys();
    if (!keys.ready) {
        state.SkipWithError("key init failed");
        return;
    }
    filecenter::core::u64 id = 1;
    std::string token;
    for (auto _ : state) {
        const filecenter::core::Status s = filecenter::security::id_token_encrypt(keys, filecenter::core::FileId{id++}, &token);
        benchmark::DoNotOptimize(static_cast<filecenter::core::u16>(s.code));
        benchmark::DoNotOptimize(token.data());
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_IdTokenEncrypt);

static void BM_IdTokenDecrypt(benchmark::State& state) {
    const filecenter::security::IdTokenKeys keys = bench_keys();
    std::string token;
    if (!keys.ready || !filecenter::core::is_ok(filecenter::security::id_token_encrypt(keys, filecenter::core::FileId{123456}, &token))) {
        state.SkipWithError("token setup failed");
        return;
    }
    for (auto _ : state) {
        filecenter::core::FileId id{};
        const filecenter::core::Status s = filecenter::security::id_token_decrypt(keys, token, &id);
        benchmark::DoNotOptimize(static_cast<filecenter::core::u16>(s.code));
        benchmark::DoNotOptimize(id);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_IdTokenDecrypt);

static void BM_IdTokenRejectForgery(benchmark::State& state) {
    const filecenter::security::IdTokenKeys keys = bench_keys();
    const std::string forged(filecenter::security::kIdTokenChars, 'Q');
    for (auto _ : state) {
        filecenter::core::FileId id{};
        const filecenter::core::Status s = filecenter::security::id_token_decrypt(keys, forged, &id);
        benchmark::DoNotOptimize(static_cast<filecenter::core::u16>(s.code));
    }
}
BENCHMARK(BM_IdTokenRejectForgery);
