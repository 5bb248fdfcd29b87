#include <benchmark/benchmark.h>

#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

#include <unistd.h>

#include "filecenter/cli/app.hpp"
#include "filecenter/core/log.hpp"

namespace {

int run_tool(std::vector<const char*> argv, std::FILE* out, std::FILE* err) {
    return filecenter::cli::run({argv.data(), static_cast<filecenter::cli::u32>(argv.size())}, out, err);
}

std::string temp_path(const char* name) {
    const char* dir = std::getenv("TMPDIR");
    return std::string(dir != nullptr && dir[0] != '\0' ? dir : "/tmp") + "/filecenter_bench_" +
           std::to_string(::getpid()) + "_" + name;
}

// Reads the first line the tool printed.
std::string first_line(std::FILE* f) {
    std::rewind(f);
    char buf[128] = {};
    if (std::fgets(buf, sizeof(buf), f) == nullptr) {
        return {};
    }
    std::string line(buf);
    while (!line.empty() && line.back() == '\n') {
        line.pop_back();
    }
    return line;
}

} // namespace

//=============================================================================
// Whole invocations: parse, open, command, close
//=============================================================================

static void BM_CliTokenInMemory(benchmark::State& state) {
    std::FILE* sink = std::fopen("/dev/null", "w");
    if (sink == nullptr) {
        state.SkipWithError("cannot open /dev/null");
        return;
    }
    for (auto _ : state) {
        const int rc = run_tool({"--key", "bench key", "--log-level", "off", "token", "42"}, sink, sink);
        if (rc != filecenter::cli::kExitOk) {
            state.SkipWithError("token failed");
            break;
        }
        benchmark::DoNotOptimize(rc);
    }
    std::fclose(sink);
}
BENCHMARK(BM_CliTokenInMemory);

static void BM_CliPutGetTemporary(benchmark::State& state) {
    const std::string db = temp_path("cli.db");
    const std::string input = temp_path("cli.input");
    {
        std::FILE* f = std::fopen(input.c_str(), "wb");
        if (f == nullptr) {
            state.SkipWithError("cannot create input");
            return;
        }
        const std::vector<char> payload(static_cast<size_t>(state.range(0)), 'p');
        std::fwrite(payload.data(), 1, payload.size(), f);
        std::fclose(f);
    }

    std::FILE* token_out = std::tmpfile();
    std::FILE* sink = std::fopen("/dev/null", "w");
    if (token_out == nullptr || sink == nullptr) {
        state.SkipWithError("cannot open output");
    } else {
        const std::vector<const char*> globals = {"--db", db.c_str(), "--key", "bench key", "--log-level", "off"};
        for (auto _ : state) {
            std::vector<const char*> put = globals;
            put.insert(put.end(), {"put", "--temporary", input.c_str()});
            std::rewind(token_out);
            if (run_tool(put, token_out, sink) != filecenter::cli::kExitOk) {
                state.SkipWithError("put failed");
                break;
            }
            std::fflush(token_out);
            const std::string token = first_line(token_out);

            std::vector<const char*> get = globals;
            get.insert(get.end(), {"get", token.c_str()});
            if (run_tool(get, sink, sink) != filecenter::cli::kExitOk) {
                state.SkipWithError("get failed");
                break;
            }
        }
        state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
    }

    if (token_out != nullptr) std::fclose(token_out);
    if (sink != nullptr) std::fclose(sink);
    for (const char* suffix : {"", "-wal", "-shm"}) {
        std::remove((db + suffix).c_str());
    }
    std::remove(input.c_str());
}
BENCHMARK(BM_CliPutGetTemporary)->Arg(1024)->Arg(1 << 20);
