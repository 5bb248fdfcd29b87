#pragma once

#include <cstdio>
#include <type_traits>

#include "filecenter/core/errors.hpp"
#include "filecenter/core/types.hpp"

namespace filecenter::cli {
    using u8 = filecenter::core::u8;
    using u32 = filecenter::core::u32;
    using u64 = filecenter::core::u64;

    // Unconsumed command line tokens. Parsers advance it in place.
    struct CliArgs {
        const char* const* argv{nullptr};
        u32 argc{0};
    };

    enum class ValueKind : u8 {
        Switch = 0,     // no value
        Text = 1,       // next token or --name=value
        Count = 2,      // unsigned decimal
    };

    enum class OptionId : u32 {
        None = 0,
        Db,
        Threshold,
        ChunkSize,
        LifetimeMs,
        Key,
        LogLevel,
        SpoolDir,
        Temporary,
        Name,
        Mime,
        Output,
        Help,
    };

    struct OptionDef {
        const char* name;       // long form without "--"
        char letter;            // short form, '\0' for none
        ValueKind kind;
        OptionId id;
        const char* help;       // one usage line; nullptr hides the option
    };

    struct OptionHit {
        OptionId id{OptionId::None};
        const char* text{nullptr};  // Text values, borrowed from argv
        u64 count{0};               // Count values
    };

    // Hits in command line order over caller-owned storage.
    struct OptionSet {
        OptionHit* hits{nullptr};
        u32 len{0};
        u32 cap{0};

        // The last occurrence wins.
        [[nodiscard]] const OptionHit* last(OptionId id) const noexcept;
        [[nodiscard]] bool has(OptionId id) const noexcept { return last(id) != nullptr; }
    };

    // Takes options off the front of *args until the first positional token
    // or "--". A lone "-" is positional. Unknown names, missing or malformed
    // values and a full OptionSet fail with Invalid in the Cli domain, and
    // leave *args where the bad token starts.
    [[nodiscard]] filecenter::core::Status take_options(CliArgs* args,
        const OptionDef* defs,
        u32 def_count,
        OptionSet* out) noexcept;

    void print_options(std::FILE* f, const OptionDef* defs, u32 def_count) noexcept;

    static_assert(std::is_trivially_copyable_v<CliArgs>);
    static_assert(std::is_trivially_copyable_v<OptionDef>);
    static_assert(std::is_trivially_copyable_v<OptionHit>);

} // namespace filecenter::cli
