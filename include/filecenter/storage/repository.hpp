#pragma once

#include <type_traits>

#include "filecenter/core/errors.hpp"
#include "filecenter/core/models.hpp"
#include "filecenter/core/types.hpp"
#include "filecenter/db/db.hpp"
#include "filecenter/db/schema.hpp"
#include "filecenter/storage/chunked_store.hpp"
#include "filecenter/storage/hashing.hpp"

namespace filecenter::storage {

struct InsertResult {
    filecenter::core::FileId id{filecenter::core::FileId::invalid()};
    bool deduplicated{false};       // true if an existing perennial file was returned
    filecenter::core::StorageShape shape{filecenter::core::StorageShape::Inline};
    u64 size_bytes{0};
};

struct GarbageReport {
    u64 orphan_chunks{0};           // chunk rows without a parent
    u64 incomplete_files{0};        // chunked files missing chunk rows
    u64 expired_temporaries{0};     // temporary files past the reclamation horizon
};

// ========================================================================
// Lookup
// ========================================================================

// Perennial dedup lookup. NotFound when no file carries `content`.
[[nodiscard]] filecenter::core::Status repo_find_by_hash(filecenter::db::DbHandle db,
                                                         const filecenter::core::Hash256& content,
                                                         filecenter::core::FileId* out) noexcept;

// Loads a file for reading.
// - Perennial files load unconditionally
// - A temporary file loads once: the conditional consume decides the single winner
// - Expired, consumed and unknown ids all fail with NotFound
// - An expired file that was never read is deleted on the spot
[[nodiscard]] filecenter::core::Status repo_load(filecenter::db::DbHandle db,
                                                 filecenter::core::FileId id,
                                                 filecenter::core::Timestamp now,
                                                 filecenter::db::FileRecord* out) noexcept;

// Metadata of a file repo_load would currently return, under the same
// NotFound rules. Never consumes.
[[nodiscard]] filecenter::core::Status repo_stat(filecenter::db::DbHandle db,
                                                 filecenter::core::FileId id,
                                                 filecenter::core::Timestamp now,
                                                 filecenter::core::FileMeta* out) noexcept;

// Whether repo_load would currently succeed. Never consumes.
[[nodiscard]] filecenter::core::Status repo_exists(filecenter::db::DbHandle db,
                                                   filecenter::core::FileId id,
                                                   filecenter::core::Timestamp now,
                                                   bool* out) noexcept;

// ========================================================================
// Mutation
// ========================================================================

// Persists the payload a writer has begun, in one transaction.
// - `meta` carries name, mime type, temporary flag and timestamps
// - A perennial hash travels in meta.content, `hasher` in the writer sees
//   every byte written, or both; when both are given they must agree or
//   the insert fails with Inconsistent
// - A hash already present rolls the transaction back and returns the
//   existing file with deduplicated = true
[[nodiscard]] filecenter::core::Status repo_insert(filecenter::db::DbHandle db,
                                                   ChunkWriter* writer,
                                                   filecenter::core::FileMeta meta,
                                                   HashState* hasher,
                                                   InsertResult* out) noexcept;

// Removes a file and its chunks. NotFound when nothing was removed.
[[nodiscard]] filecenter::core::Status repo_delete(filecenter::db::DbHandle db,
                                                   filecenter::core::FileId id) noexcept;

// Deletes temporary files whose expires_at + lifetime_ms <= now, read or
// not. The extra lifetime is the window a reader has to finish streaming.
[[nodiscard]] filecenter::core::Status repo_reclaim(filecenter::db::DbHandle db,
                                                    filecenter::core::Timestamp now,
                                                    filecenter::core::i64 lifetime_ms,
                                                    u64* removed) noexcept;

// On-demand maintenance pass.
[[nodiscard]] filecenter::core::Status repo_clear_garbage(filecenter::db::DbHandle db,
                                                          filecenter::core::Timestamp now,
                                                          filecenter::core::i64 lifetime_ms,
                                                          GarbageReport* out) noexcept;

static_assert(std::is_trivially_copyable_v<InsertResult>);
static_assert(std::is_trivially_copyable_v<GarbageReport>);

} // namespace filecenter::storage
