#pragma once

#include <type_traits>
#include <vector>

#include "filecenter/core/models.hpp"
#include "filecenter/core/types.hpp"

namespace filecenter::db {
    using u8 = filecenter::core::u8;
    using u32 = filecenter::core::u32;
    using u64 = filecenter::core::u64;

    // Bumped whenever file_items, file_chunks or settings change shape.
    constexpr u32 kSchemaVersion = 1;

    // file_items row. inline_data is empty for chunked files.
    struct FileRecord {
        filecenter::core::FileMeta meta{};
        std::vector<u8> inline_data;
    };

    struct SettingsRecord {
        u32 schema_version{0};
        filecenter::core::Timestamp created_at{0};
        u32 file_size_threshold{0};     // 0 until a store first opens the database
    };

    static_assert(std::is_trivially_copyable_v<SettingsRecord>);
    static_assert(std::is_standard_layout_v<SettingsRecord>);

} // namespace filecenter::db
