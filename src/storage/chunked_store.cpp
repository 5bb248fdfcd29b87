#include "filecenter/storage/chunked_store.hpp"

#include <algorithm>
#include <cstring>
#include <utility>

#include "filecenter/core/log.hpp"
#include "filecenter/db/queries.hpp"

namespace filecenter::storage {

using namespace filecenter::core;

// ========================================================================
// ChunkWriter
// ========================================================================

Status ChunkWriter::begin(SourceCursor* cursor, const ChunkPolicy& policy, HashState* hasher) noexcept {
    if (cursor == nullptr || started_) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    if (policy.threshold == 0 || policy.chunk_bytes == 0 || policy.chunk_bytes > policy.threshold) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    cursor_ = cursor;
    hasher_ = hasher;
    policy_ = policy;
    started_ = true;

    // One byte past the threshold is enough to know the shape.
    head_.resize(static_cast<size_t>(policy.threshold) + 1);
    u64 n = 0;
    Status s = cursor_->read_full(BufferMut{head_.data(), head_.size()}, &n);
    if (!is_ok(s)) {
        return s;
    }
    head_.resize(static_cast<size_t>(n));

    if (hasher_ != nullptr) {
        s = hash_update(hasher_, BufferView{head_.data(), head_.size()});
        if (!is_ok(s)) {
            return s;
        }
    }

    if (n > policy_.max_file_bytes) {
        return make_status(StatusDomain::Storage, StatusCode::TooLarge);
    }

    shape_ = n <= policy.threshold ? StorageShape::Inline : StorageShape::Chunked;
    return ok_status();
}

BufferView ChunkWriter::inline_payload() const noexcept {
    if (!started_ || shape_ != StorageShape::Inline) {
        return BufferView{};
    }
    return BufferView{head_.data(), head_.size()};
}

Status ChunkWriter::write_chunks(db::DbHandle db, FileId parent, ChunkWriteResult* out) noexcept {
    if (out == nullptr || !started_ || shape_ != StorageShape::Chunked) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    const u64 chunk_bytes = policy_.chunk_bytes;
    std::vector<u8> chunk(static_cast<size_t>(chunk_bytes));

    u64 head_off = 0;
    u64 total = 0;
    u64 seq = 0;
    bool source_done = false;

    while (true) {
        u64 fill = std::min<u64>(head_.size() - head_off, chunk_bytes);
        if (fill > 0) {
            std::memcpy(chunk.data(), head_.data() + head_off, static_cast<size_t>(fill));
            head_off += fill;
        }

        if (fill < chunk_bytes && !source_done) {
            u64 n = 0;
            Status s = cursor_->read_full(BufferMut{chunk.data() + fill, chunk_bytes - fill}, &n);
            if (!is_ok(s)) {
                return s;
            }
            if (hasher_ != nullptr && n > 0) {
                s = hash_update(hasher_, BufferView{chunk.data() + fill, n});
                if (!is_ok(s)) {
                    return s;
                }
            }
            fill += n;
            source_done = fill < chunk_bytes;
        }

        if (fill == 0) {
            break;
        }

        total += fill;
        if (total > policy_.max_file_bytes) {
            return make_status(StatusDomain::Storage, StatusCode::TooLarge);
        }

        Status s = db::db_chunk_put(db, parent, seq, BufferView{chunk.data(), fill});
        if (!is_ok(s)) {
            return s;
        }
        ++seq;

        if (source_done) {
            break;
        }
    }

    head_.clear();
    head_.shrink_to_fit();

    out->size_bytes = total;
    out->chunk_count = seq;
    FILECENTER_LOG_DEBUG("chunks written",
        {field_int("file_id", static_cast<i64>(parent.v)), field_int("chunks", static_cast<i64>(seq)),
         field_int("bytes", static_cast<i64>(total))});
    return ok_status();
}

// ========================================================================
// ChunkStream
// ========================================================================

Status ChunkStream::open(db::DbHandle db, const FileMeta& meta) noexcept {
    if (open_ || meta.shape != StorageShape::Chunked) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    // Recorded layout must be self-consistent before any chunk is fetched.
    if (meta.chunk_bytes == 0 || meta.chunk_count == 0) {
        return make_status(StatusDomain::Storage, StatusCode::Inconsistent);
    }
    const u64 expected_chunks = (meta.size_bytes + meta.chunk_bytes - 1) / meta.chunk_bytes;
    if (expected_chunks != meta.chunk_count) {
        return make_status(StatusDomain::Storage, StatusCode::Inconsistent);
    }

    u64 stored = 0;
    Status s = db::db_chunk_count(db, meta.id, &stored);
    if (!is_ok(s)) {
        return s;
    }
    if (stored != meta.chunk_count) {
        FILECENTER_LOG_ERROR("chunk count mismatch",
            {field_int("file_id", static_cast<i64>(meta.id.v)), field_int("expected", static_cast<i64>(meta.chunk_count)),
             field_int("stored", static_cast<i64>(stored))});
        return make_status(StatusDomain::Storage, StatusCode::Inconsistent);
    }

    db_ = db;
    meta_ = meta;
    next_seq_ = 0;
    bytes_read_ = 0;
    open_ = true;
    finished_ = false;
    return ok_status();
}

Status ChunkStream::next(std::vector<u8>* chunk, bool* done) noexcept {
    if (chunk == nullptr || done == nullptr || !open_) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    *done = false;

    if (finished_ || next_seq_ == meta_.chunk_count) {
        if (bytes_read_ != meta_.size_bytes) {
            return make_status(StatusDomain::Storage, StatusCode::Inconsistent);
        }
        finished_ = true;
        chunk->clear();
        *done = true;
        return ok_status();
    }

    Status s = db::db_chunk_get(db_, meta_.id, next_seq_, chunk);
    if (s.code == StatusCode::NotFound) {
        // Parent gone means the file was deleted mid-read.
        db::FileRecord parent{};
        Status ps = db::db_file_get(db_, meta_.id, &parent);
        if (ps.code == StatusCode::NotFound) {
            return make_status(StatusDomain::Storage, StatusCode::NotFound);
        }
        FILECENTER_LOG_ERROR("chunk missing",
            {field_int("file_id", static_cast<i64>(meta_.id.v)), field_int("seq", static_cast<i64>(next_seq_))});
        return make_status(StatusDomain::Storage, StatusCode::Inconsistent);
    }
    if (!is_ok(s)) {
        return s;
    }

    if (chunk->size() != chunk_len_at(meta_, next_seq_)) {
        FILECENTER_LOG_ERROR("chunk length mismatch",
            {field_int("file_id", static_cast<i64>(meta_.id.v)), field_int("seq", static_cast<i64>(next_seq_)),
             field_int("len", static_cast<i64>(chunk->size()))});
        return make_status(StatusDomain::Storage, StatusCode::Inconsistent);
    }

    bytes_read_ += chunk->size();
    if (bytes_read_ > meta_.size_bytes) {
        return make_status(StatusDomain::Storage, StatusCode::Inconsistent);
    }
    ++next_seq_;
    return ok_status();
}

// ========================================================================
// FileData
// ========================================================================

FileData FileData::from_buffer(std::vector<u8>&& bytes) noexcept {
    FileData d;
    d.shape_ = StorageShape::Inline;
    d.buffer_ = std::move(bytes);
    return d;
}

FileData FileData::from_stream(ChunkStream&& stream) noexcept {
    FileData d;
    d.shape_ = StorageShape::Chunked;
    d.stream_ = std::move(stream);
    return d;
}

Status FileData::into_vec(std::vector<u8>* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    if (shape_ == StorageShape::Inline) {
        *out = std::move(buffer_);
        buffer_.clear();
        return ok_status();
    }

    out->clear();
    std::vector<u8> chunk;
    while (true) {
        bool done = false;
        Status s = stream_.next(&chunk, &done);
        if (!is_ok(s)) {
            return s;
        }
        if (done) {
            break;
        }
        out->insert(out->end(), chunk.begin(), chunk.end());
    }
    return ok_status();
}

// ========================================================================
// Payload operations
// ========================================================================

Status chunk_read(db::DbHandle db, db::FileRecord&& record, FileData* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    if (record.meta.shape == StorageShape::Inline) {
        if (record.inline_data.size() != record.meta.size_bytes) {
            return make_status(StatusDomain::Storage, StatusCode::Inconsistent);
        }
        *out = FileData::from_buffer(std::move(record.inline_data));
        return ok_status();
    }

    ChunkStream stream;
    Status s = stream.open(db, record.meta);
    if (!is_ok(s)) {
        return s;
    }
    *out = FileData::from_stream(std::move(stream));
    return ok_status();
}

Status chunk_delete(db::DbHandle db, FileId parent, u64* removed) noexcept {
    return db::db_chunk_delete_all(db, parent, removed);
}

} // namespace filecenter::storage
