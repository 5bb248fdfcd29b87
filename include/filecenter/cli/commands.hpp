#pragma once

#include <cstdio>
#include <type_traits>

#include "filecenter/cli/options.hpp"
#include "filecenter/core/errors.hpp"

namespace filecenter::cli {

    enum class CommandId : u32 {
        None = 0,
        Help,
        Put,
        Get,
        Stat,
        Rm,
        Token,
        Id,
        Gc,
        Threshold,
    };

    struct CommandDef {
        const char* name;
        CommandId id;
        const char* synopsis;   // arguments, as shown by help
    };

    // Takes the command name off the front of *args and points *out at its
    // table entry. NotFound for an unknown name; Invalid when *args is empty
    // or starts with an option.
    [[nodiscard]] filecenter::core::Status take_command(CliArgs* args,
        const CommandDef* defs,
        u32 def_count,
        const CommandDef** out) noexcept;

    void print_commands(std::FILE* f, const CommandDef* defs, u32 def_count) noexcept;

    static_assert(std::is_trivially_copyable_v<CommandDef>);

} // namespace filecenter::cli
