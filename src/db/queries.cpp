#include "filecenter/db/queries.hpp"

#include <cstring>
#include <initializer_list>
#include <mutex>
#include <string>

#include <sqlite3.h>

#include "filecenter/core/log.hpp"
#include "db_internal.hpp"

namespace filecenter::db {

using namespace filecenter::core;
using filecenter::storage::BufferView;

namespace {
    constexpr const char* kSelectFileById =
        "SELECT id, content_hash, size_bytes, mime_type, file_name, is_temporary, created_at, "
        "expires_at, consumed_at, storage_shape, chunk_bytes, chunk_count, inline_data "
        "FROM file_items WHERE id = ?";

    void bind_hash(sqlite3_stmt* stmt, int idx, const Hash256* h) noexcept {
        if (h == nullptr) {
            sqlite3_bind_null(stmt, idx);
            return;
        }
        sqlite3_bind_blob(stmt, idx, h->b.data(), static_cast<int>(h->b.size()), SQLITE_STATIC);
    }

    void bind_opt_text(sqlite3_stmt* stmt, int idx, const std::optional<std::string>& v) noexcept {
        if (!v) {
            sqlite3_bind_null(stmt, idx);
            return;
        }
        sqlite3_bind_text64(stmt, idx, v->data(), v->size(), SQLITE_STATIC, SQLITE_UTF8);
    }

    void bind_bytes(sqlite3_stmt* stmt, int idx, BufferView data) noexcept {
        // A zero-length blob with a null pointer would bind NULL.
        if (data.len == 0) {
            sqlite3_bind_zeroblob(stmt, idx, 0);
            return;
        }
        sqlite3_bind_blob64(stmt, idx, data.data, data.len, SQLITE_STATIC);
    }

    std::optional<std::string> column_opt_text(sqlite3_stmt* stmt, int col) {
        if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
            return std::nullopt;
        }
        const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
        const int len = sqlite3_column_bytes(stmt, col);
        return std::string(text ? text : "", static_cast<size_t>(len));
    }

    void read_file_row(sqlite3_stmt* stmt, FileRecord* out) {
        FileMeta& m = out->meta;
        m.id = FileId{static_cast<u64>(sqlite3_column_int64(stmt, 0))};

        const void* hash_blob = sqlite3_column_blob(stmt, 1);
        m.has_content_hash = hash_blob != nullptr && sqlite3_column_bytes(stmt, 1) == 32;
        m.content = Hash256{};
        if (m.has_content_hash) {
            std::memcpy(m.content.b.data(), hash_blob, 32);
        }

        m.size_bytes = static_cast<u64>(sqlite3_column_int64(stmt, 2));
        m.mime_type = column_opt_text(stmt, 3);
        m.file_name = column_opt_text(stmt, 4);
        m.temporary = sqlite3_column_int(stmt, 5) != 0;
        m.created_at = sqlite3_column_int64(stmt, 6);
        m.expires_at = sqlite3_column_int64(stmt, 7);
        m.consumed_at = sqlite3_column_int64(stmt, 8);
        m.shape = sqlite3_column_int(stmt, 9) == 1 ? StorageShape::Chunked : StorageShape::Inline;
        m.chunk_bytes = static_cast<u32>(sqlite3_column_int64(stmt, 10));
        m.chunk_count = static_cast<u64>(sqlite3_column_int64(stmt, 11));

        out->inline_data.clear();
        const int data_len = sqlite3_column_bytes(stmt, 12);
        const auto* data = static_cast<const u8*>(sqlite3_column_blob(stmt, 12));
        if (data != nullptr && data_len > 0) {
            out->inline_data.assign(data, data + data_len);
        }
    }

    // Runs a write statement whose parameters are all integers and reports
    // how many rows it touched.
    Status run_write(DbHandle db, const char* sql, std::initializer_list<sqlite3_int64> params, u64* changes) noexcept {
        detail::DbSlot* slot = nullptr;
        Status s = detail::slot_acquire(db, &slot);
        if (!is_ok(s)) {
            return s;
        }
        std::lock_guard<std::recursive_mutex> lock(slot->mutex, std::adopt_lock);

        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(slot->conn, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            return detail::sqlite_status(slot->conn, rc);
        }

        int idx = 1;
        for (sqlite3_int64 p : params) {
            sqlite3_bind_int64(stmt, idx++, p);
        }

        rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            return detail::sqlite_status(slot->conn, rc);
        }

        if (changes) {
            *changes = static_cast<u64>(sqlite3_changes64(slot->conn));
        }
        return ok_status();
    }

    Status run_count(DbHandle db, const char* sql, std::initializer_list<sqlite3_int64> params, u64* out) noexcept {
        if (!out) {
            return make_status(StatusDomain::Db, StatusCode::Invalid);
        }
        detail::DbSlot* slot = nullptr;
        Status s = detail::slot_acquire(db, &slot);
        if (!is_ok(s)) {
            return s;
        }
        std::lock_guard<std::recursive_mutex> lock(slot->mutex, std::adopt_lock);

        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(slot->conn, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            return detail::sqlite_status(slot->conn, rc);
        }

        int idx = 1;
        for (sqlite3_int64 p : params) {
            sqlite3_bind_int64(stmt, idx++, p);
        }

        rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) {
            *out = static_cast<u64>(sqlite3_column_int64(stmt, 0));
            sqlite3_finalize(stmt);
            return ok_status();
        }

        sqlite3_finalize(stmt);
        return detail::sqlite_status(slot->conn, rc);
    }
}

// ============================================================================
// File Operations
// ============================================================================

Status db_file_insert(DbHandle db, const FileMeta& meta, BufferView inline_data, FileId* out) noexcept {
    if (!out || !filecenter::storage::buffer_ok(inline_data)) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    if (meta.shape == StorageShape::Chunked && inline_data.len != 0) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    detail::DbSlot* slot = nullptr;
    Status s = detail::slot_acquire(db, &slot);
    if (!is_ok(s)) {
        return s;
    }
    std::lock_guard<std::recursive_mutex> lock(slot->mutex, std::adopt_lock);

    // Don't include id in INSERT - let AUTOINCREMENT handle it
    const char* sql = "INSERT INTO file_items (content_hash, size_bytes, mime_type, file_name, is_temporary, "
                      "created_at, expires_at, consumed_at, storage_shape, chunk_bytes, chunk_count, inline_data) "
                      "VALUES (?, ?, ?, ?, ?, ?, ?, 0, ?, ?, ?, ?)";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(slot->conn, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return detail::sqlite_status(slot->conn, rc);
    }

    bind_hash(stmt, 1, meta.has_content_hash ? &meta.content : nullptr);
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(meta.size_bytes));
    bind_opt_text(stmt, 3, meta.mime_type);
    bind_opt_text(stmt, 4, meta.file_name);
    sqlite3_bind_int(stmt, 5, meta.temporary ? 1 : 0);
    sqlite3_bind_int64(stmt, 6, meta.created_at);
    sqlite3_bind_int64(stmt, 7, meta.temporary ? meta.expires_at : 0);
    sqlite3_bind_int(stmt, 8, static_cast<int>(meta.shape));
    sqlite3_bind_int64(stmt, 9, meta.chunk_bytes);
    sqlite3_bind_int64(stmt, 10, static_cast<sqlite3_int64>(meta.chunk_count));
    if (meta.shape == StorageShape::Inline) {
        bind_bytes(stmt, 11, inline_data);
    } else {
        sqlite3_bind_null(stmt, 11);
    }

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return detail::sqlite_status(slot->conn, rc);
    }

    out->v = static_cast<u64>(sqlite3_last_insert_rowid(slot->conn));
    return ok_status();
}

Status db_file_finalize_chunked(DbHandle db, FileId id, u64 size_bytes, u64 chunk_count, const Hash256* content) noexcept {
    detail::DbSlot* slot = nullptr;
    Status s = detail::slot_acquire(db, &slot);
    if (!is_ok(s)) {
        return s;
    }
    std::lock_guard<std::recursive_mutex> lock(slot->mutex, std::adopt_lock);

    const char* sql = "UPDATE file_items SET size_bytes = ?, chunk_count = ?, content_hash = ? "
                      "WHERE id = ? AND storage_shape = 1";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(slot->conn, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return detail::sqlite_status(slot->conn, rc);
    }

    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(size_bytes));
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(chunk_count));
    bind_hash(stmt, 3, content);
    sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(id.v));

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return detail::sqlite_status(slot->conn, rc);
    }
    if (sqlite3_changes(slot->conn) == 0) {
        return make_status(StatusDomain::Db, StatusCode::NotFound);
    }
    return ok_status();
}

Status db_file_find_by_hash(DbHandle db, const Hash256& content, FileId* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    detail::DbSlot* slot = nullptr;
    Status s = detail::slot_acquire(db, &slot);
    if (!is_ok(s)) {
        return s;
    }
    std::lock_guard<std::recursive_mutex> lock(slot->mutex, std::adopt_lock);

    const char* sql = "SELECT id FROM file_items WHERE content_hash = ? LIMIT 1";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(slot->conn, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return detail::sqlite_status(slot->conn, rc);
    }

    bind_hash(stmt, 1, &content);

    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        out->v = static_cast<u64>(sqlite3_column_int64(stmt, 0));
        sqlite3_finalize(stmt);
        return ok_status();
    }

    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return detail::sqlite_status(slot->conn, rc);
    }
    return make_status(StatusDomain::Db, StatusCode::NotFound);
}

Status db_file_get(DbHandle db, FileId id, FileRecord* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    detail::DbSlot* slot = nullptr;
    Status s = detail::slot_acquire(db, &slot);
    if (!is_ok(s)) {
        return s;
    }
    std::lock_guard<std::recursive_mutex> lock(slot->mutex, std::adopt_lock);

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(slot->conn, kSelectFileById, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return detail::sqlite_status(slot->conn, rc);
    }

    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(id.v));

    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        read_file_row(stmt, out);
        sqlite3_finalize(stmt);
        return ok_status();
    }

    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return detail::sqlite_status(slot->conn, rc);
    }
    return make_status(StatusDomain::Db, StatusCode::NotFound);
}

Status db_file_consume(DbHandle db, FileId id, Timestamp now, bool* consumed) noexcept {
    if (!consumed) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    u64 changes = 0;
    Status s = run_write(db,
        "UPDATE file_items SET consumed_at = MAX(?1, 1) "
        "WHERE id = ?2 AND is_temporary = 1 AND consumed_at = 0 AND expires_at > ?1",
        {now, static_cast<sqlite3_int64>(id.v)}, &changes);
    if (!is_ok(s)) {
        return s;
    }
    *consumed = changes == 1;
    return ok_status();
}

Status db_file_delete(DbHandle db, FileId id, bool* deleted) noexcept {
    u64 changes = 0;
    Status s = run_write(db, "DELETE FROM file_items WHERE id = ?", {static_cast<sqlite3_int64>(id.v)}, &changes);
    if (!is_ok(s)) {
        return s;
    }
    if (deleted) {
        *deleted = changes > 0;
    }
    return ok_status();
}

Status db_file_delete_if_expired(DbHandle db, FileId id, Timestamp now, bool* deleted) noexcept {
    u64 changes = 0;
    Status s = run_write(db,
        "DELETE FROM file_items "
        "WHERE id = ? AND is_temporary = 1 AND consumed_at = 0 AND expires_at <= ?",
        {static_cast<sqlite3_int64>(id.v), now}, &changes);
    if (!is_ok(s)) {
        return s;
    }
    if (deleted) {
        *deleted = changes > 0;
    }
    return ok_status();
}

Status db_file_reclaim_temporary(DbHandle db, Timestamp horizon, u64* removed) noexcept {
    return run_write(db,
        "DELETE FROM file_items WHERE is_temporary = 1 AND expires_at <= ?",
        {horizon}, removed);
}

Status db_file_count(DbHandle db, u64* out) noexcept {
    return run_count(db, "SELECT COUNT(*) FROM file_items", {}, out);
}

// ============================================================================
// Chunk Operations
// ============================================================================

Status db_chunk_put(DbHandle db, FileId parent, u64 seq, BufferView data) noexcept {
    if (!filecenter::storage::buffer_ok(data) || data.len == 0) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    detail::DbSlot* slot = nullptr;
    Status s = detail::slot_acquire(db, &slot);
    if (!is_ok(s)) {
        return s;
    }
    std::lock_guard<std::recursive_mutex> lock(slot->mutex, std::adopt_lock);

    const char* sql = "INSERT INTO file_chunks (parent_id, seq, data) VALUES (?, ?, ?)";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(slot->conn, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return detail::sqlite_status(slot->conn, rc);
    }

    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(parent.v));
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(seq));
    bind_bytes(stmt, 3, data);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return detail::sqlite_status(slot->conn, rc);
    }
    return ok_status();
}

Status db_chunk_get(DbHandle db, FileId parent, u64 seq, std::vector<u8>* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    detail::DbSlot* slot = nullptr;
    Status s = detail::slot_acquire(db, &slot);
    if (!is_ok(s)) {
        return s;
    }
    std::lock_guard<std::recursive_mutex> lock(slot->mutex, std::adopt_lock);

    const char* sql = "SELECT data FROM file_chunks WHERE parent_id = ? AND seq = ?";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(slot->conn, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return detail::sqlite_status(slot->conn, rc);
    }

    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(parent.v));
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(seq));

    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        const auto* data = static_cast<const u8*>(sqlite3_column_blob(stmt, 0));
        const int len = sqlite3_column_bytes(stmt, 0);
        if (data != nullptr && len > 0) {
            out->assign(data, data + len);
        } else {
            out->clear();
        }
        sqlite3_finalize(stmt);
        return ok_status();
    }

    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return detail::sqlite_status(slot->conn, rc);
    }
    return make_status(StatusDomain::Db, StatusCode::NotFound);
}

Status db_chunk_count(DbHandle db, FileId parent, u64* out) noexcept {
    return run_count(db, "SELECT COUNT(*) FROM file_chunks WHERE parent_id = ?",
        {static_cast<sqlite3_int64>(parent.v)}, out);
}

Status db_chunk_delete_all(DbHandle db, FileId parent, u64* removed) noexcept {
    return run_write(db, "DELETE FROM file_chunks WHERE parent_id = ?",
        {static_cast<sqlite3_int64>(parent.v)}, removed);
}

// ============================================================================
// Maintenance
// ============================================================================

Status db_gc_orphan_chunks(DbHandle db, u64* removed) noexcept {
    return run_write(db,
        "DELETE FROM file_chunks WHERE parent_id NOT IN (SELECT id FROM file_items)",
        {}, removed);
}

Status db_gc_incomplete_files(DbHandle db, u64* removed) noexcept {
    Status s = run_write(db,
        "DELETE FROM file_items WHERE storage_shape = 1 AND (chunk_count = 0 OR chunk_count <> "
        "(SELECT COUNT(*) FROM file_chunks c WHERE c.parent_id = file_items.id))",
        {}, removed);
    if (is_ok(s) && removed && *removed > 0) {
        FILECENTER_LOG_WARN("removed chunked files with missing chunks", {field_int("count", static_cast<i64>(*removed))});
    }
    return s;
}

} // namespace filecenter::db
