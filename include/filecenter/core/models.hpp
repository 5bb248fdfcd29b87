#pragma once
#include <optional>
#include <string>
#include "filecenter/core/types.hpp"

namespace filecenter::core {
    // Metadata of one stored file, as persisted in file_items.
    struct FileMeta {
        FileId id{FileId::invalid()};
        bool has_content_hash{false};     // perennial files only
        Hash256 content{};
        u64 size_bytes{0};
        std::optional<std::string> mime_type;
        std::optional<std::string> file_name;
        bool temporary{false};
        Timestamp created_at{0};
        Timestamp expires_at{0};          // 0 unless temporary
        Timestamp consumed_at{0};         // 0 until a temporary file is read
        StorageShape shape{StorageShape::Inline};
        u32 chunk_bytes{0};               // Chunked only
        u64 chunk_count{0};               // Chunked only
    };

    // Expected length of chunk `seq` for a chunked file.
    [[nodiscard]] constexpr u64 chunk_len_at(const FileMeta& meta, u64 seq) noexcept {
        if (meta.chunk_count == 0 || seq >= meta.chunk_count) {
            return 0;
        }
        if (seq + 1 < meta.chunk_count) {
            return meta.chunk_bytes;
        }
        return meta.size_bytes - static_cast<u64>(meta.chunk_bytes) * (meta.chunk_count - 1);
    }
} // namespace filecenter::core
