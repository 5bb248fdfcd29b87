#include "filecenter/cli/commands.hpp"

#include <cstring>

namespace filecenter::cli {
    using filecenter::core::Status;
    using filecenter::core::StatusCode;
    using filecenter::core::StatusDomain;

    Status take_command(CliArgs* args, const CommandDef* defs, u32 def_count, const CommandDef** out) noexcept {
        if (args == nullptr || out == nullptr || (def_count > 0 && defs == nullptr)) {
            return filecenter::core::make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
        *out = nullptr;
        if (args->argc == 0 || args->argv == nullptr || args->argv[0] == nullptr || args->argv[0][0] == '-') {
            return filecenter::core::make_status(StatusDomain::Cli, StatusCode::Invalid);
        }

        for (u32 i = 0; i < def_count; ++i) {
            if (defs[i].name != nullptr && std::strcmp(defs[i].name, args->argv[0]) == 0) {
                *out = &defs[i];
                ++args->argv;
                --args->argc;
                return filecenter::core::ok_status();
            }
        }
        return filecenter::core::make_status(StatusDomain::Cli, StatusCode::NotFound);
    }

    void print_commands(std::FILE* f, const CommandDef* defs, u32 def_count) noexcept {
        for (u32 i = 0; i < def_count; ++i) {
            std::fprintf(f, "  %s%s%s\n", defs[i].name,
                defs[i].synopsis[0] != '\0' ? " " : "", defs[i].synopsis);
        }
    }
} // namespace filecenter::cli
