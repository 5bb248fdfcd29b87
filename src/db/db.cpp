#include "filecenter/db/db.hpp"

#include <array>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <string>

#include <sqlite3.h>

#include "filecenter/core/clock.hpp"
#include "filecenter/core/log.hpp"
#include "db_internal.hpp"

namespace filecenter::db {

using namespace filecenter::core;

namespace {
    struct SlotTable {
        std::array<detail::DbSlot, kMaxDbHandles> slots;
        std::array<bool, kMaxDbHandles> in_use{};
        std::array<bool, kMaxDbHandles> in_txn{};
        std::mutex mutex;  // guards in_use and generation assignment
    };

    SlotTable g_slots;

    constexpr const char* kSchemaSQL = R"SQL(
        CREATE TABLE IF NOT EXISTS file_items (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            content_hash BLOB,
            size_bytes INTEGER NOT NULL,
            mime_type TEXT,
            file_name TEXT,
            is_temporary INTEGER NOT NULL,
            created_at INTEGER NOT NULL,
            expires_at INTEGER NOT NULL DEFAULT 0,
            consumed_at INTEGER NOT NULL DEFAULT 0,
            storage_shape INTEGER NOT NULL,
            chunk_bytes INTEGER NOT NULL DEFAULT 0,
            chunk_count INTEGER NOT NULL DEFAULT 0,
            inline_data BLOB
        );
        CREATE UNIQUE INDEX IF NOT EXISTS idx_file_items_hash ON file_items(content_hash);
        CREATE INDEX IF NOT EXISTS idx_file_items_expiry ON file_items(is_temporary, expires_at);

        CREATE TABLE IF NOT EXISTS file_chunks (
            parent_id INTEGER NOT NULL REFERENCES file_items(id) ON DELETE CASCADE,
            seq INTEGER NOT NULL,
            data BLOB NOT NULL,
            PRIMARY KEY (parent_id, seq)
        ) WITHOUT ROWID;

        CREATE TABLE IF NOT EXISTS settings (
            key TEXT PRIMARY KEY,
            value INTEGER NOT NULL
        );
    )SQL";

    constexpr u32 slot_index(u32 id) noexcept {
        return (id & 0xFFu) - 1;
    }

    constexpr u32 slot_generation(u32 id) noexcept {
        return id >> 8;
    }

    constexpr u32 make_handle_id(u32 index, u32 generation) noexcept {
        return ((generation & 0xFFFFFFu) << 8) | (index + 1);
    }

    constexpr const char* kThresholdKey = "file_size_threshold";

    Status write_setting(sqlite3* conn, const char* key, sqlite3_int64 value, bool replace) noexcept {
        const char* sql = replace
            ? "INSERT OR REPLACE INTO settings (key, value) VALUES (?, ?)"
            : "INSERT OR IGNORE INTO settings (key, value) VALUES (?, ?)";

        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(conn, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            return detail::sqlite_status(conn, rc);
        }
        sqlite3_bind_text(stmt, 1, key, -1, SQLITE_STATIC);
        sqlite3_bind_int64(stmt, 2, value);
        rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            return detail::sqlite_status(conn, rc);
        }
        return ok_status();
    }

    Status write_default_settings(sqlite3* conn) noexcept {
        const char* sql = "INSERT OR IGNORE INTO settings (key, value) VALUES (?, ?)";

        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(conn, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            return detail::sqlite_status(conn, rc);
        }

        struct Row {
            const char* key;
            sqlite3_int64 value;
        };
        const Row rows[] = {
            {"schema_version", static_cast<sqlite3_int64>(kSchemaVersion)},
            {"created_at", static_cast<sqlite3_int64>(system_now_ms())},
        };

        for (const Row& row : rows) {
            sqlite3_reset(stmt);
            sqlite3_bind_text(stmt, 1, row.key, -1, SQLITE_STATIC);
            sqlite3_bind_int64(stmt, 2, row.value);
            rc = sqlite3_step(stmt);
            if (rc != SQLITE_DONE) {
                sqlite3_finalize(stmt);
                return detail::sqlite_status(conn, rc);
            }
        }

        sqlite3_finalize(stmt);
        return ok_status();
    }

    Status read_settings(sqlite3* conn, SettingsRecord* out) noexcept {
        const char* sql = "SELECT key, value FROM settings";

        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(conn, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            return detail::sqlite_status(conn, rc);
        }

        *out = SettingsRecord{};
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            const char* key = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
            const sqlite3_int64 value = sqlite3_column_int64(stmt, 1);
            if (key == nullptr) continue;
            if (std::strcmp(key, "schema_version") == 0) {
                out->schema_version = static_cast<u32>(value);
            } else if (std::strcmp(key, "created_at") == 0) {
                out->created_at = static_cast<Timestamp>(value);
            } else if (std::strcmp(key, kThresholdKey) == 0) {
                out->file_size_threshold = static_cast<u32>(value);
            }
        }
        sqlite3_finalize(stmt);

        if (rc != SQLITE_DONE) {
            return detail::sqlite_status(conn, rc);
        }
        return ok_status();
    }

    Status configure_connection(sqlite3* conn, const DbConfig& cfg) noexcept {
        sqlite3_extended_result_codes(conn, 1);
        const int rc = sqlite3_busy_timeout(conn, static_cast<int>(cfg.busy_timeout_ms));
        if (rc != SQLITE_OK) {
            return detail::sqlite_status(conn, rc);
        }

        // WAL by default; in-memory databases report "memory" and carry on.
        const char* journal_mode = std::getenv("FILECENTER_DB_JOURNAL_MODE");
        if (!journal_mode || journal_mode[0] == '\0') {
            journal_mode = "WAL";
        }
        std::string journal_sql = "PRAGMA journal_mode=";
        journal_sql += journal_mode;
        Status s = detail::exec(conn, journal_sql.c_str());
        if (!is_ok(s)) {
            FILECENTER_LOG_WARN("journal mode not applied",
                {field_str("mode", journal_mode), field_int("rc", s.aux)});
        }

        s = detail::exec(conn, "PRAGMA synchronous=NORMAL");
        if (!is_ok(s)) return s;
        s = detail::exec(conn, "PRAGMA foreign_keys=ON");
        if (!is_ok(s)) return s;
        s = detail::exec(conn, "PRAGMA temp_store=MEMORY");
        if (!is_ok(s)) return s;

        s = detail::exec(conn, kSchemaSQL);
        if (!is_ok(s)) return s;

        s = write_default_settings(conn);
        if (!is_ok(s)) return s;

        SettingsRecord settings{};
        s = read_settings(conn, &settings);
        if (!is_ok(s)) return s;
        if (settings.schema_version == 0 || settings.schema_version > kSchemaVersion) {
            FILECENTER_LOG_ERROR("unsupported schema version",
                {field_int("found", settings.schema_version), field_int("supported", kSchemaVersion)});
            return make_status(StatusDomain::Db, StatusCode::Unsupported, settings.schema_version);
        }
        return ok_status();
    }
}

namespace detail {

Status slot_acquire(DbHandle db, DbSlot** out) noexcept {
    if (!db_handle_valid(db) || out == nullptr) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    const u32 index = slot_index(db.id);
    if (index >= kMaxDbHandles) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    DbSlot& slot = g_slots.slots[index];
    slot.mutex.lock();
    if (slot.conn == nullptr || (slot.generation & 0xFFFFFFu) != slot_generation(db.id)) {
        slot.mutex.unlock();
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    *out = &slot;
    return ok_status();
}

Status sqlite_status(sqlite3* conn, int rc) noexcept {
    const u32 aux = static_cast<u32>(rc);
    switch (rc & 0xFF) {
        case SQLITE_OK:
        case SQLITE_DONE:
        case SQLITE_ROW:
            return ok_status();
        case SQLITE_CONSTRAINT:
            return make_status(StatusDomain::Db, StatusCode::Conflict, aux);
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            FILECENTER_LOG_ERROR("sqlite reports corruption",
                {field_int("rc", rc), field_str("error", sqlite3_errstr(rc))});
            return make_status(StatusDomain::Db, StatusCode::Inconsistent, aux);
        case SQLITE_TOOBIG:
            return make_status(StatusDomain::Db, StatusCode::TooLarge, aux);
        default:
            FILECENTER_LOG_WARN("sqlite failure",
                {field_int("rc", rc), field_str("error", conn ? sqlite3_errmsg(conn) : sqlite3_errstr(rc))});
            return make_status(StatusDomain::Db, StatusCode::Unavailable, aux);
    }
}

Status exec(sqlite3* conn, const char* sql) noexcept {
    if (!conn || !sql) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    char* err_msg = nullptr;
    const int rc = sqlite3_exec(conn, sql, nullptr, nullptr, &err_msg);
    if (err_msg) sqlite3_free(err_msg);
    if (rc != SQLITE_OK) {
        return sqlite_status(conn, rc);
    }
    return ok_status();
}

} // namespace detail

// ============================================================================
// Database Lifecycle
// ============================================================================

Status db_open(const DbConfig& cfg, DbHandle* out) noexcept {
    if (!out || !cfg.path || cfg.path[0] == '\0') {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    u32 index = kMaxDbHandles;
    {
        std::lock_guard<std::mutex> lock(g_slots.mutex);
        for (u32 i = 0; i < kMaxDbHandles; ++i) {
            if (!g_slots.in_use[i]) {
                g_slots.in_use[i] = true;
                index = i;
                break;
            }
        }
    }
    if (index == kMaxDbHandles) {
        return make_status(StatusDomain::Db, StatusCode::Unavailable);
    }

    auto release_slot = [index]() noexcept {
        std::lock_guard<std::mutex> lock(g_slots.mutex);
        g_slots.in_use[index] = false;
    };

    sqlite3* conn = nullptr;
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = sqlite3_open_v2(cfg.path, &conn, flags, nullptr);
    if (rc != SQLITE_OK) {
        Status s = detail::sqlite_status(conn, rc);
        sqlite3_close(conn);
        release_slot();
        FILECENTER_LOG_ERROR("database open failed", {field_str("path", cfg.path), field_int("rc", rc)});
        return s;
    }

    Status s = configure_connection(conn, cfg);
    if (!is_ok(s)) {
        sqlite3_close(conn);
        release_slot();
        return s;
    }

    detail::DbSlot& slot = g_slots.slots[index];
    u32 generation = 0;
    {
        std::lock_guard<std::recursive_mutex> lock(slot.mutex);
        slot.conn = conn;
        slot.generation += 1;
        generation = slot.generation;
    }

    out->id = make_handle_id(index, generation);
    FILECENTER_LOG_DEBUG("database opened", {field_str("path", cfg.path), field_int("handle", out->id)});
    return ok_status();
}

Status db_close(DbHandle db) noexcept {
    detail::DbSlot* slot = nullptr;
    Status s = detail::slot_acquire(db, &slot);
    if (!is_ok(s)) {
        return s;
    }

    const u32 index = slot_index(db.id);
    {
        std::lock_guard<std::recursive_mutex> lock(slot->mutex, std::adopt_lock);
        const int rc = sqlite3_close(slot->conn);
        if (rc != SQLITE_OK) {
            return detail::sqlite_status(slot->conn, rc);
        }
        slot->conn = nullptr;
        if (g_slots.in_txn[index]) {
            // The abandoned transaction's hold on the slot.
            g_slots.in_txn[index] = false;
            slot->mutex.unlock();
        }
    }

    std::lock_guard<std::mutex> lock(g_slots.mutex);
    g_slots.in_use[index] = false;
    return ok_status();
}

// ============================================================================
// Transaction Management
// ============================================================================

Status db_txn_begin(DbHandle db, DbTxn* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    detail::DbSlot* slot = nullptr;
    Status s = detail::slot_acquire(db, &slot);
    if (!is_ok(s)) {
        return s;
    }

    const u32 index = slot_index(db.id);
    if (g_slots.in_txn[index]) {
        // Nested transactions on one handle are not supported.
        slot->mutex.unlock();
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    s = detail::exec(slot->conn, "BEGIN IMMEDIATE");
    if (!is_ok(s)) {
        slot->mutex.unlock();
        return s;
    }

    // The slot stays locked until commit or rollback.
    g_slots.in_txn[index] = true;
    out->id = db.id;
    return ok_status();
}

namespace {
    Status txn_finish(DbTxn txn, bool commit) noexcept {
        if (!db_txn_valid(txn)) {
            return make_status(StatusDomain::Db, StatusCode::Invalid);
        }

        detail::DbSlot* slot = nullptr;
        Status s = detail::slot_acquire(DbHandle{txn.id}, &slot);
        if (!is_ok(s)) {
            return s;
        }
        std::lock_guard<std::recursive_mutex> lock(slot->mutex, std::adopt_lock);

        const u32 index = slot_index(txn.id);
        if (!g_slots.in_txn[index]) {
            return make_status(StatusDomain::Db, StatusCode::Invalid);
        }

        if (sqlite3_get_autocommit(slot->conn) != 0) {
            // sqlite already rolled back (for example after SQLITE_FULL).
            s = commit ? make_status(StatusDomain::Db, StatusCode::Unavailable) : ok_status();
        } else {
            s = detail::exec(slot->conn, commit ? "COMMIT" : "ROLLBACK");
        }
        if (!is_ok(s) && sqlite3_get_autocommit(slot->conn) == 0) {
            // A failed COMMIT leaves the transaction open; end it here so
            // the handle is usable again.
            Status rb = detail::exec(slot->conn, "ROLLBACK");
            if (!is_ok(rb)) {
                FILECENTER_LOG_ERROR("rollback after failed commit failed", {field_int("rc", rb.aux)});
            }
        }

        g_slots.in_txn[index] = false;
        slot->mutex.unlock();  // hold taken by db_txn_begin
        return s;
    }
}

Status db_txn_commit(DbTxn txn) noexcept {
    return txn_finish(txn, true);
}

Status db_txn_rollback(DbTxn txn) noexcept {
    return txn_finish(txn, false);
}

Status db_settings_get(DbHandle db, SettingsRecord* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    detail::DbSlot* slot = nullptr;
    Status s = detail::slot_acquire(db, &slot);
    if (!is_ok(s)) {
        return s;
    }
    std::lock_guard<std::recursive_mutex> lock(slot->mutex, std::adopt_lock);
    return read_settings(slot->conn, out);
}

Status db_settings_init_threshold(DbHandle db, u32 initial, u32* out) noexcept {
    if (!out || initial == 0) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    detail::DbSlot* slot = nullptr;
    Status s = detail::slot_acquire(db, &slot);
    if (!is_ok(s)) {
        return s;
    }
    std::lock_guard<std::recursive_mutex> lock(slot->mutex, std::adopt_lock);

    s = write_setting(slot->conn, kThresholdKey, static_cast<sqlite3_int64>(initial), false);
    if (!is_ok(s)) {
        return s;
    }
    SettingsRecord settings{};
    s = read_settings(slot->conn, &settings);
    if (!is_ok(s)) {
        return s;
    }
    *out = settings.file_size_threshold;
    return ok_status();
}

Status db_settings_set_threshold(DbHandle db, u32 threshold) noexcept {
    if (threshold == 0) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    detail::DbSlot* slot = nullptr;
    Status s = detail::slot_acquire(db, &slot);
    if (!is_ok(s)) {
        return s;
    }
    std::lock_guard<std::recursive_mutex> lock(slot->mutex, std::adopt_lock);
    return write_setting(slot->conn, kThresholdKey, static_cast<sqlite3_int64>(threshold), true);
}

Status db_drop_schema(DbHandle db) noexcept {
    detail::DbSlot* slot = nullptr;
    Status s = detail::slot_acquire(db, &slot);
    if (!is_ok(s)) {
        return s;
    }
    std::lock_guard<std::recursive_mutex> lock(slot->mutex, std::adopt_lock);
    return detail::exec(slot->conn,
        "DROP TABLE IF EXISTS file_chunks;"
        "DROP TABLE IF EXISTS file_items;"
        "DROP TABLE IF EXISTS settings;");
}

} // namespace filecenter::db
