#pragma once

#include <type_traits>

#include "filecenter/core/errors.hpp"
#include "filecenter/core/types.hpp"

namespace filecenter::core {

    constexpr u32 kDefaultFileSizeThreshold = 262144;
    constexpr u32 kMaxFileSizeThreshold = 17162240;
    constexpr u32 kDefaultChunkSize = 261120;
    constexpr i64 kDefaultTemporaryLifetimeMs = 60000;
    // Largest payload the chunk table is allowed to represent.
    constexpr u64 kStoreMaxFileBytes = u64{1} << 40;

    struct FileCenterConfig {
        const char* db_path{":memory:"};
        u32 file_size_threshold{kDefaultFileSizeThreshold};
        u32 chunk_size{kDefaultChunkSize};
        i64 temporary_lifetime_ms{kDefaultTemporaryLifetimeMs};
        u64 max_file_size{0};                   // 0 = kStoreMaxFileBytes
        const char* codec_key{nullptr};         // required
        const char* spool_dir{nullptr};         // nullptr = $TMPDIR, then /tmp
        ClockFn clock{nullptr};                 // nullptr = system clock
    };

    // Base-10 digits only, the whole string, no sign or whitespace.
    [[nodiscard]] bool parse_u64(const char* s, u64* out) noexcept;

    [[nodiscard]] Status config_validate(const FileCenterConfig& cfg) noexcept;

    // Overlays FILECENTER_* environment variables onto *cfg. Malformed
    // numbers are rejected rather than ignored.
    [[nodiscard]] Status config_from_env(FileCenterConfig* cfg) noexcept;

    [[nodiscard]] constexpr u32 effective_chunk_bytes(u32 chunk_size, u32 threshold) noexcept {
        return chunk_size < threshold ? chunk_size : threshold;
    }

    [[nodiscard]] constexpr u32 effective_chunk_bytes(const FileCenterConfig& cfg) noexcept {
        return effective_chunk_bytes(cfg.chunk_size, cfg.file_size_threshold);
    }

    [[nodiscard]] constexpr u64 effective_max_file_bytes(const FileCenterConfig& cfg) noexcept {
        if (cfg.max_file_size == 0 || cfg.max_file_size > kStoreMaxFileBytes) {
            return kStoreMaxFileBytes;
        }
        return cfg.max_file_size;
    }

    static_assert(std::is_trivially_copyable_v<FileCenterConfig>);
    static_assert(std::is_standard_layout_v<FileCenterConfig>);

} // namespace filecenter::core
