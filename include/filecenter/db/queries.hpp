#pragma once

#include <vector>

#include "filecenter/core/errors.hpp"
#include "filecenter/core/models.hpp"
#include "filecenter/db/db.hpp"
#include "filecenter/db/schema.hpp"
#include "filecenter/storage/buffer.hpp"

namespace filecenter::db {

    // Inserts a file_items row and returns the store-assigned id. meta.id is
    // ignored. For chunked files the row is a placeholder until
    // db_file_finalize_chunked records size, chunk count and hash.
    // A duplicate content hash fails with Conflict.
    filecenter::core::Status db_file_insert(DbHandle db,
        const filecenter::core::FileMeta& meta,
        filecenter::storage::BufferView inline_data,
        filecenter::core::FileId* out) noexcept;

    // `content` may be nullptr (temporary files).
    filecenter::core::Status db_file_finalize_chunked(DbHandle db,
        filecenter::core::FileId id,
        u64 size_bytes,
        u64 chunk_count,
        const filecenter::core::Hash256* content) noexcept;

    // NotFound when no perennial file carries `content`.
    filecenter::core::Status db_file_find_by_hash(DbHandle db,
        const filecenter::core::Hash256& content,
        filecenter::core::FileId* out) noexcept;

    // Raw row lookup; no expiry or consumption rules applied.
    filecenter::core::Status db_file_get(DbHandle db,
        filecenter::core::FileId id,
        FileRecord* out) noexcept;

    // Conditional consume of a temporary file. *consumed is true for exactly
    // one caller while the file is unexpired and unread.
    filecenter::core::Status db_file_consume(DbHandle db,
        filecenter::core::FileId id,
        filecenter::core::Timestamp now,
        bool* consumed) noexcept;

    // Chunks go with the row (ON DELETE CASCADE).
    filecenter::core::Status db_file_delete(DbHandle db,
        filecenter::core::FileId id,
        bool* deleted) noexcept;

    // Deletes a temporary file that expired without ever being read.
    filecenter::core::Status db_file_delete_if_expired(DbHandle db,
        filecenter::core::FileId id,
        filecenter::core::Timestamp now,
        bool* deleted) noexcept;

    // Deletes every temporary file with expires_at <= horizon.
    filecenter::core::Status db_file_reclaim_temporary(DbHandle db,
        filecenter::core::Timestamp horizon,
        u64* removed) noexcept;

    filecenter::core::Status db_file_count(DbHandle db, u64* out) noexcept;

    filecenter::core::Status db_chunk_put(DbHandle db,
        filecenter::core::FileId parent,
        u64 seq,
        filecenter::storage::BufferView data) noexcept;

    // NotFound when the chunk row is missing.
    filecenter::core::Status db_chunk_get(DbHandle db,
        filecenter::core::FileId parent,
        u64 seq,
        std::vector<u8>* out) noexcept;

    filecenter::core::Status db_chunk_count(DbHandle db,
        filecenter::core::FileId parent,
        u64* out) noexcept;

    filecenter::core::Status db_chunk_delete_all(DbHandle db,
        filecenter::core::FileId parent,
        u64* removed) noexcept;

    // Maintenance: chunk rows without a parent, and chunked files whose
    // stored chunk rows disagree with the recorded chunk_count.
    filecenter::core::Status db_gc_orphan_chunks(DbHandle db, u64* removed) noexcept;
    filecenter::core::Status db_gc_incomplete_files(DbHandle db, u64* removed) noexcept;

} // namespace filecenter::db
