#include "filecenter/center/file_center.hpp"

#include <algorithm>
#include <utility>

#include "filecenter/core/clock.hpp"
#include "filecenter/core/log.hpp"
#include "filecenter/db/queries.hpp"
#include "filecenter/storage/hashing.hpp"
#include "filecenter/storage/spool.hpp"

namespace filecenter::center {

using namespace filecenter::core;
using filecenter::storage::ByteSource;

namespace {
    // Read-once sources up to this size are copied in memory, larger ones
    // to a scratch file.
    constexpr u64 kSpoolMemoryBytes = 1024 * 1024;

    Status not_open() noexcept {
        return make_status(StatusDomain::Center, StatusCode::Invalid);
    }

    bool threshold_valid(u32 threshold) noexcept {
        return threshold != 0 && threshold <= kMaxFileSizeThreshold;
    }
}

FileCenter::~FileCenter() noexcept {
    if (open_) {
        Status s = close();
        if (!is_ok(s)) {
            FILECENTER_LOG_WARN("file center close failed", {field_int("code", static_cast<i64>(s.code))});
        }
    }
}

Timestamp FileCenter::now() const noexcept {
    return clock_now(cfg_.clock);
}

// ========================================================================
// Lifecycle
// ========================================================================

Status FileCenter::open(const FileCenterConfig& cfg) noexcept {
    if (open_) {
        return make_status(StatusDomain::Center, StatusCode::Invalid);
    }

    Status s = config_validate(cfg);
    if (!is_ok(s)) {
        FILECENTER_LOG_ERROR("invalid file center configuration", {field_int("aux", s.aux)});
        return s;
    }

    s = security::id_token_keys_init(cfg.codec_key, &keys_);
    if (!is_ok(s)) {
        return s;
    }

    db_path_ = cfg.db_path;
    db::DbConfig db_cfg{};
    db_cfg.path = db_path_.c_str();
    s = db::db_open(db_cfg, &db_);
    if (!is_ok(s)) {
        security::id_token_keys_wipe(&keys_);
        return s;
    }

    u32 threshold = 0;
    s = db::db_settings_init_threshold(db_, cfg.file_size_threshold, &threshold);
    if (is_ok(s) && !threshold_valid(threshold)) {
        FILECENTER_LOG_ERROR("stored file size threshold out of range", {field_int("threshold", threshold)});
        s = make_status(StatusDomain::Config, StatusCode::Invalid, threshold);
    }
    if (!is_ok(s)) {
        Status cs = db::db_close(db_);
        if (!is_ok(cs)) {
            FILECENTER_LOG_WARN("database close failed", {field_int("rc", cs.aux)});
        }
        db_ = db::DbHandle{};
        security::id_token_keys_wipe(&keys_);
        return s;
    }
    if (threshold != cfg.file_size_threshold) {
        FILECENTER_LOG_INFO("using stored file size threshold",
            {field_int("stored", threshold), field_int("configured", cfg.file_size_threshold)});
    }

    spool_dir_ = cfg.spool_dir != nullptr ? cfg.spool_dir : "";
    cfg_ = cfg;
    cfg_.db_path = db_path_.c_str();
    cfg_.spool_dir = spool_dir_.empty() ? nullptr : spool_dir_.c_str();
    cfg_.file_size_threshold = threshold;
    cfg_.codec_key = nullptr;  // only the derived keys are kept
    threshold_.store(threshold, std::memory_order_relaxed);
    open_ = true;

    FILECENTER_LOG_INFO("file center opened",
        {field_str("db", db_path_), field_int("threshold", threshold),
         field_int("chunk_bytes", effective_chunk_bytes(cfg_)), field_int("lifetime_ms", cfg_.temporary_lifetime_ms)});
    return ok_status();
}

Status FileCenter::close() noexcept {
    if (!open_) {
        return not_open();
    }
    Status s = db::db_close(db_);
    security::id_token_keys_wipe(&keys_);
    db_ = db::DbHandle{};
    open_ = false;
    return s;
}

Status FileCenter::drop() noexcept {
    if (!open_) {
        return not_open();
    }

    db::DbTxn txn{};
    Status s = db::db_txn_begin(db_, &txn);
    if (!is_ok(s)) {
        return s;
    }
    s = db::db_drop_schema(db_);
    if (!is_ok(s)) {
        Status rb = db::db_txn_rollback(txn);
        if (!is_ok(rb)) {
            FILECENTER_LOG_ERROR("rollback failed", {field_int("rc", rb.aux)});
        }
        return s;
    }
    s = db::db_txn_commit(txn);
    if (!is_ok(s)) {
        return s;
    }

    FILECENTER_LOG_INFO("file center dropped", {field_str("db", db_path_)});
    return close();
}

// ========================================================================
// Files
// ========================================================================

Status FileCenter::put(const ByteSource& source, const PutOptions& opts, PutResult* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Center, StatusCode::Invalid);
    }
    if (!open_) {
        return not_open();
    }

    const Timestamp t = now();
    Status s = storage::repo_reclaim(db_, t, cfg_.temporary_lifetime_ms, nullptr);
    if (!is_ok(s)) {
        return s;
    }

    FileMeta meta{};
    meta.temporary = opts.temporary;
    meta.created_at = t;
    meta.expires_at = opts.temporary ? t + cfg_.temporary_lifetime_ms : 0;
    meta.mime_type = opts.mime_type;
    meta.file_name = opts.file_name;
    if (!meta.file_name) {
        if (const char* base = storage::source_base_name(source)) {
            meta.file_name = std::string(base);
        }
    }

    storage::SourceCursor cursor;
    s = cursor.open(source);
    if (!is_ok(s)) {
        return s;
    }

    const u32 threshold = threshold_.load(std::memory_order_relaxed);
    const u64 max_bytes = effective_max_file_bytes(cfg_);

    // Pipes and reader callbacks are drained into a private copy first, so
    // no caller code runs while the write transaction holds the database.
    storage::Spool spool;
    storage::SourceCursor spooled;
    storage::SourceCursor* in = &cursor;
    storage::HashState verify;
    storage::HashState* verify_hasher = nullptr;
    if (!cursor.rewindable()) {
        storage::HashState hasher;
        storage::hash_init(&hasher);
        const storage::SpoolPolicy spool_policy{
            std::max<u64>(threshold, kSpoolMemoryBytes),
            max_bytes,
            cfg_.spool_dir,
        };
        s = spool.fill(&cursor, spool_policy, opts.temporary ? nullptr : &hasher);
        if (!is_ok(s)) {
            return s;
        }
        cursor.close();
        s = spooled.open(spool.source());
        if (!is_ok(s)) {
            return s;
        }
        in = &spooled;
        if (!opts.temporary) {
            s = storage::hash_finalize(&hasher, &meta.content);
            if (!is_ok(s)) {
                return s;
            }
            meta.has_content_hash = true;
        }
    } else if (!opts.temporary) {
        // Hash first so a duplicate is answered without writing anything.
        s = storage::hash_cursor(&cursor, &meta.content);
        if (!is_ok(s)) {
            return s;
        }
        s = cursor.rewind();
        if (!is_ok(s)) {
            return s;
        }
        meta.has_content_hash = true;
        // The file may change between the two passes.
        storage::hash_init(&verify);
        verify_hasher = &verify;
    }

    if (meta.has_content_hash) {
        bool found = false;
        s = find_existing(meta.content, out, &found);
        if (!is_ok(s) || found) {
            return s;
        }
    }

    const storage::ChunkPolicy policy{
        threshold,
        effective_chunk_bytes(cfg_.chunk_size, threshold),
        max_bytes,
    };
    storage::ChunkWriter writer;
    s = writer.begin(in, policy, verify_hasher);
    if (!is_ok(s)) {
        return s;
    }

    storage::InsertResult inserted{};
    s = storage::repo_insert(db_, &writer, std::move(meta), verify_hasher, &inserted);
    if (!is_ok(s)) {
        if (s.code != StatusCode::TooLarge) {
            FILECENTER_LOG_WARN("put failed",
                {field_str("code", status_code_name(s.code)), field_str("domain", status_domain_name(s.domain))});
        }
        return s;
    }

    out->id = inserted.id;
    out->deduplicated = inserted.deduplicated;
    out->shape = inserted.shape;
    out->size_bytes = inserted.size_bytes;
    return ok_status();
}

Status FileCenter::find_existing(const Hash256& content, PutResult* out, bool* found) noexcept {
    *found = false;
    FileId existing{};
    Status s = storage::repo_find_by_hash(db_, content, &existing);
    if (s.code == StatusCode::NotFound) {
        return ok_status();
    }
    if (!is_ok(s)) {
        return s;
    }

    db::FileRecord record{};
    s = db::db_file_get(db_, existing, &record);
    if (s.code == StatusCode::NotFound) {
        // Deleted since the lookup: store it afresh.
        return ok_status();
    }
    if (!is_ok(s)) {
        return s;
    }

    out->id = existing;
    out->deduplicated = true;
    out->shape = record.meta.shape;
    out->size_bytes = record.meta.size_bytes;
    *found = true;
    FILECENTER_LOG_DEBUG("dedup hit", {field_int("file_id", static_cast<i64>(existing.v))});
    return ok_status();
}

Status FileCenter::get(FileId id, FileItem* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Center, StatusCode::Invalid);
    }
    if (!open_) {
        return not_open();
    }

    db::FileRecord record{};
    Status s = storage::repo_load(db_, id, now(), &record);
    if (!is_ok(s)) {
        return s;
    }

    FileMeta meta = record.meta;
    storage::FileData data;
    s = storage::chunk_read(db_, std::move(record), &data);
    if (!is_ok(s)) {
        return s;
    }

    out->meta = std::move(meta);
    out->data = std::move(data);
    return ok_status();
}

Status FileCenter::exists(FileId id, bool* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Center, StatusCode::Invalid);
    }
    if (!open_) {
        return not_open();
    }
    return storage::repo_exists(db_, id, now(), out);
}

Status FileCenter::stat(FileId id, FileMeta* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Center, StatusCode::Invalid);
    }
    if (!open_) {
        return not_open();
    }
    return storage::repo_stat(db_, id, now(), out);
}

Status FileCenter::remove(FileId id) noexcept {
    if (!open_) {
        return not_open();
    }
    return storage::repo_delete(db_, id);
}

// ========================================================================
// Tokens
// ========================================================================

Status FileCenter::encrypt_id(FileId id, std::string* out) const noexcept {
    if (!open_) {
        return not_open();
    }
    return security::id_token_encrypt(keys_, id, out);
}

Status FileCenter::decrypt_id_token(std::string_view token, FileId* out) const noexcept {
    if (!open_) {
        return not_open();
    }
    return security::id_token_decrypt(keys_, token, out);
}

// ========================================================================
// Maintenance
// ========================================================================

Status FileCenter::clear_garbage(GarbageReport* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Center, StatusCode::Invalid);
    }
    if (!open_) {
        return not_open();
    }

    Status s = storage::repo_clear_garbage(db_, now(), cfg_.temporary_lifetime_ms, out);
    if (!is_ok(s)) {
        return s;
    }
    FILECENTER_LOG_INFO("garbage cleared",
        {field_int("orphan_chunks", static_cast<i64>(out->orphan_chunks)),
         field_int("incomplete_files", static_cast<i64>(out->incomplete_files)),
         field_int("expired_temporaries", static_cast<i64>(out->expired_temporaries))});
    return ok_status();
}

Status FileCenter::set_file_size_threshold(u32 threshold) noexcept {
    if (!open_) {
        return not_open();
    }
    if (!threshold_valid(threshold)) {
        return make_status(StatusDomain::Config, StatusCode::Invalid, threshold);
    }
    if (threshold == threshold_.load(std::memory_order_relaxed)) {
        return ok_status();
    }

    Status s = db::db_settings_set_threshold(db_, threshold);
    if (!is_ok(s)) {
        return s;
    }
    threshold_.store(threshold, std::memory_order_relaxed);
    FILECENTER_LOG_INFO("file size threshold changed", {field_int("threshold", threshold)});
    return ok_status();
}

} // namespace filecenter::center
