#include <cstdio>

#include "filecenter/cli/app.hpp"
#include "filecenter/core/log.hpp"

int main(int argc, char** argv) {
    const filecenter::cli::CliArgs args{
        argc > 1 ? argv + 1 : nullptr,
        argc > 1 ? static_cast<filecenter::cli::u32>(argc - 1) : 0u,
    };
    const int rc = filecenter::cli::run(args, stdout, stderr);
    filecenter::core::log_shutdown();
    return rc;
}
