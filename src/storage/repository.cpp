#include "filecenter/storage/repository.hpp"

#include <utility>

#include "filecenter/core/log.hpp"
#include "filecenter/db/queries.hpp"

namespace filecenter::storage {

using namespace filecenter::core;

namespace {
    Status not_found() noexcept {
        return make_status(StatusDomain::Storage, StatusCode::NotFound);
    }

    void rollback(db::DbTxn txn) noexcept {
        Status s = db::db_txn_rollback(txn);
        if (!is_ok(s)) {
            FILECENTER_LOG_ERROR("rollback failed", {field_int("rc", s.aux)});
        }
    }

    // Finalizes the hash of the bytes actually written. A hash computed in
    // an earlier pass must agree with it.
    Status settle_hash(HashState* hasher, FileMeta* meta) noexcept {
        if (hasher == nullptr) {
            return ok_status();
        }
        Hash256 written{};
        Status s = hash_finalize(hasher, &written);
        if (!is_ok(s)) {
            return s;
        }
        if (meta->has_content_hash && written != meta->content) {
            FILECENTER_LOG_WARN("source changed while it was stored", {field_int("bytes", static_cast<i64>(meta->size_bytes))});
            return make_status(StatusDomain::Storage, StatusCode::Inconsistent);
        }
        meta->content = written;
        meta->has_content_hash = true;
        return ok_status();
    }

    // Fills *out from the row that won the content hash.
    Status resolve_existing(db::DbHandle db, const Hash256& content, InsertResult* out) noexcept {
        FileId existing{};
        Status s = db::db_file_find_by_hash(db, content, &existing);
        if (s.code == StatusCode::NotFound) {
            // The winner was deleted between our conflict and this lookup.
            return make_status(StatusDomain::Storage, StatusCode::Conflict);
        }
        if (!is_ok(s)) {
            return s;
        }

        db::FileRecord record{};
        s = db::db_file_get(db, existing, &record);
        if (!is_ok(s)) {
            return s;
        }

        out->id = existing;
        out->deduplicated = true;
        out->shape = record.meta.shape;
        out->size_bytes = record.meta.size_bytes;
        FILECENTER_LOG_DEBUG("dedup hit", {field_int("file_id", static_cast<i64>(existing.v))});
        return ok_status();
    }
}

// ========================================================================
// Lookup
// ========================================================================

Status repo_find_by_hash(db::DbHandle db, const Hash256& content, FileId* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    Status s = db::db_file_find_by_hash(db, content, out);
    if (s.code == StatusCode::NotFound) {
        return not_found();
    }
    return s;
}

Status repo_load(db::DbHandle db, FileId id, Timestamp now, db::FileRecord* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    if (!id.is_valid()) {
        return not_found();
    }

    Status s = db::db_file_get(db, id, out);
    if (s.code == StatusCode::NotFound) {
        return not_found();
    }
    if (!is_ok(s)) {
        return s;
    }

    if (!out->meta.temporary) {
        return ok_status();
    }

    if (out->meta.consumed_at != 0) {
        return not_found();
    }

    if (out->meta.expires_at <= now) {
        bool deleted = false;
        s = db::db_file_delete_if_expired(db, id, now, &deleted);
        if (!is_ok(s)) {
            return s;
        }
        if (deleted) {
            FILECENTER_LOG_DEBUG("expired temporary file removed", {field_int("file_id", static_cast<i64>(id.v))});
        }
        return not_found();
    }

    // The row read above only proves the file was readable a moment ago;
    // the conditional update picks the one reader that gets it.
    bool consumed = false;
    s = db::db_file_consume(db, id, now, &consumed);
    if (!is_ok(s)) {
        return s;
    }
    if (!consumed) {
        return not_found();
    }

    out->meta.consumed_at = now > 0 ? now : 1;  // 0 means unread
    return ok_status();
}

Status repo_stat(db::DbHandle db, FileId id, Timestamp now, FileMeta* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    if (!id.is_valid()) {
        return not_found();
    }

    db::FileRecord record{};
    Status s = db::db_file_get(db, id, &record);
    if (s.code == StatusCode::NotFound) {
        return not_found();
    }
    if (!is_ok(s)) {
        return s;
    }

    if (record.meta.temporary) {
        if (record.meta.consumed_at != 0) {
            return not_found();
        }
        if (record.meta.expires_at <= now) {
            bool deleted = false;
            s = db::db_file_delete_if_expired(db, id, now, &deleted);
            if (!is_ok(s)) {
                return s;
            }
            return not_found();
        }
    }

    *out = std::move(record.meta);
    return ok_status();
}

Status repo_exists(db::DbHandle db, FileId id, Timestamp now, bool* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    FileMeta meta{};
    Status s = repo_stat(db, id, now, &meta);
    if (s.code == StatusCode::NotFound) {
        *out = false;
        return ok_status();
    }
    if (!is_ok(s)) {
        return s;
    }
    *out = true;
    return ok_status();
}

// ========================================================================
// Mutation
// ========================================================================

Status repo_insert(db::DbHandle db, ChunkWriter* writer, FileMeta meta, HashState* hasher, InsertResult* out) noexcept {
    if (writer == nullptr || out == nullptr) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    if (meta.temporary && (hasher != nullptr || meta.has_content_hash)) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    meta.shape = writer->shape();
    meta.chunk_bytes = meta.shape == StorageShape::Chunked ? writer->chunk_bytes() : 0;
    meta.consumed_at = 0;
    if (!meta.temporary) {
        meta.expires_at = 0;
    }

    db::DbTxn txn{};
    Status s = db::db_txn_begin(db, &txn);
    if (!is_ok(s)) {
        return s;
    }

    FileId id{};
    if (meta.shape == StorageShape::Inline) {
        const BufferView payload = writer->inline_payload();
        meta.size_bytes = payload.len;
        meta.chunk_count = 0;
        s = settle_hash(hasher, &meta);
        if (!is_ok(s)) {
            rollback(txn);
            return s;
        }
        s = db::db_file_insert(db, meta, payload, &id);
    } else {
        // Placeholder row: the hash lands with the final size so a
        // half-written file can never satisfy a dedup lookup.
        FileMeta placeholder = meta;
        placeholder.has_content_hash = false;
        placeholder.size_bytes = 0;
        placeholder.chunk_count = 0;
        s = db::db_file_insert(db, placeholder, BufferView{}, &id);

        ChunkWriteResult written{};
        if (is_ok(s)) {
            s = writer->write_chunks(db, id, &written);
        }
        if (is_ok(s)) {
            meta.size_bytes = written.size_bytes;
            meta.chunk_count = written.chunk_count;
            s = settle_hash(hasher, &meta);
        }
        if (is_ok(s)) {
            s = db::db_file_finalize_chunked(db, id, written.size_bytes, written.chunk_count,
                meta.has_content_hash ? &meta.content : nullptr);
        }
    }

    if (s.code == StatusCode::Conflict && meta.has_content_hash) {
        // Another put stored the same content first.
        rollback(txn);
        return resolve_existing(db, meta.content, out);
    }
    if (!is_ok(s)) {
        rollback(txn);
        return s;
    }

    s = db::db_txn_commit(txn);
    if (!is_ok(s)) {
        return s;
    }

    out->id = id;
    out->deduplicated = false;
    out->shape = meta.shape;
    out->size_bytes = meta.size_bytes;
    FILECENTER_LOG_DEBUG("file stored",
        {field_int("file_id", static_cast<i64>(id.v)), field_int("bytes", static_cast<i64>(meta.size_bytes)),
         field_str("shape", meta.shape == StorageShape::Inline ? "inline" : "chunked"),
         field_int("temporary", meta.temporary ? 1 : 0)});
    return ok_status();
}

Status repo_delete(db::DbHandle db, FileId id) noexcept {
    if (!id.is_valid()) {
        return not_found();
    }

    db::DbTxn txn{};
    Status s = db::db_txn_begin(db, &txn);
    if (!is_ok(s)) {
        return s;
    }

    u64 chunks = 0;
    s = chunk_delete(db, id, &chunks);
    bool deleted = false;
    if (is_ok(s)) {
        s = db::db_file_delete(db, id, &deleted);
    }
    if (!is_ok(s)) {
        rollback(txn);
        return s;
    }

    s = db::db_txn_commit(txn);
    if (!is_ok(s)) {
        return s;
    }
    if (!deleted) {
        return not_found();
    }
    FILECENTER_LOG_DEBUG("file deleted", {field_int("file_id", static_cast<i64>(id.v)), field_int("chunks", static_cast<i64>(chunks))});
    return ok_status();
}

Status repo_reclaim(db::DbHandle db, Timestamp now, i64 lifetime_ms, u64* removed) noexcept {
    u64 count = 0;
    Status s = db::db_file_reclaim_temporary(db, now - lifetime_ms, &count);
    if (!is_ok(s)) {
        return s;
    }
    if (count > 0) {
        FILECENTER_LOG_DEBUG("temporary files reclaimed", {field_int("count", static_cast<i64>(count))});
    }
    if (removed) {
        *removed = count;
    }
    return ok_status();
}

Status repo_clear_garbage(db::DbHandle db, Timestamp now, i64 lifetime_ms, GarbageReport* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    *out = GarbageReport{};

    Status s = db::db_gc_orphan_chunks(db, &out->orphan_chunks);
    if (!is_ok(s)) {
        return s;
    }
    s = db::db_gc_incomplete_files(db, &out->incomplete_files);
    if (!is_ok(s)) {
        return s;
    }
    return repo_reclaim(db, now, lifetime_ms, &out->expired_temporaries);
}

} // namespace filecenter::storage
