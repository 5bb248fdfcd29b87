#pragma once

#include <cstdio>

#include "filecenter/cli/options.hpp"

namespace filecenter::cli {

    constexpr int kExitOk = 0;
    constexpr int kExitFailure = 1;   // the requested operation failed
    constexpr int kExitUsage = 2;     // bad arguments or configuration

    // Runs the filecenter tool on argv without the program name.
    // Results go to `out`, diagnostics to `err`. Returns the exit status.
    int run(const CliArgs& args, std::FILE* out, std::FILE* err) noexcept;

} // namespace filecenter::cli
