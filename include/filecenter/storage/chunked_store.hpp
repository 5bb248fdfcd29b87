#pragma once

#include <vector>

#include "filecenter/core/errors.hpp"
#include "filecenter/core/models.hpp"
#include "filecenter/core/types.hpp"
#include "filecenter/db/db.hpp"
#include "filecenter/db/schema.hpp"
#include "filecenter/storage/buffer.hpp"
#include "filecenter/storage/hashing.hpp"
#include "filecenter/storage/source.hpp"

namespace filecenter::storage {

// Layout limits for one put
struct ChunkPolicy {
    u32 threshold;          // Largest payload stored inline
    u32 chunk_bytes;        // Size of every chunk but the last
    u64 max_file_bytes;     // Larger payloads fail with TooLarge
};

struct ChunkWriteResult {
    u64 size_bytes{0};
    u64 chunk_count{0};
};

// ========================================================================
// Writing
// ========================================================================

// Splits a source into inline or chunked form.
// - begin() buffers up to threshold + 1 bytes to pick the shape
// - Inline payloads are available from inline_payload() once begin() returns
// - Chunked payloads are flushed by write_chunks() in increasing seq order
// - Every byte read is fed to the optional hasher exactly once
class ChunkWriter {
public:
    ChunkWriter() noexcept = default;

    ChunkWriter(const ChunkWriter&) = delete;
    ChunkWriter& operator=(const ChunkWriter&) = delete;

    [[nodiscard]] filecenter::core::Status begin(SourceCursor* cursor,
                                                 const ChunkPolicy& policy,
                                                 HashState* hasher) noexcept;

    [[nodiscard]] filecenter::core::StorageShape shape() const noexcept { return shape_; }
    [[nodiscard]] u32 chunk_bytes() const noexcept { return policy_.chunk_bytes; }

    [[nodiscard]] BufferView inline_payload() const noexcept;

    // Streams the rest of the source into file_chunks rows of `parent`.
    // Must run inside the transaction that created `parent`.
    [[nodiscard]] filecenter::core::Status write_chunks(filecenter::db::DbHandle db,
                                                        filecenter::core::FileId parent,
                                                        ChunkWriteResult* out) noexcept;

private:
    SourceCursor* cursor_{nullptr};
    HashState* hasher_{nullptr};
    ChunkPolicy policy_{};
    std::vector<u8> head_;
    filecenter::core::StorageShape shape_{filecenter::core::StorageShape::Inline};
    bool started_{false};
};

// ========================================================================
// Reading
// ========================================================================

// Lazy reader over the chunks of one file. Yields chunks strictly by seq,
// one store fetch per chunk, and checks every length against the record.
// Finite and not restartable.
class ChunkStream {
public:
    ChunkStream() noexcept = default;

    ChunkStream(ChunkStream&&) noexcept = default;
    ChunkStream& operator=(ChunkStream&&) noexcept = default;
    ChunkStream(const ChunkStream&) = delete;
    ChunkStream& operator=(const ChunkStream&) = delete;

    // Fails with Inconsistent when the stored chunk count disagrees with
    // the record.
    [[nodiscard]] filecenter::core::Status open(filecenter::db::DbHandle db,
                                                const filecenter::core::FileMeta& meta) noexcept;

    // Replaces *chunk with the next chunk. Sets *done once every chunk has
    // been yielded and the total matched the recorded size.
    [[nodiscard]] filecenter::core::Status next(std::vector<u8>* chunk, bool* done) noexcept;

    [[nodiscard]] u64 bytes_read() const noexcept { return bytes_read_; }
    [[nodiscard]] u64 chunk_count() const noexcept { return meta_.chunk_count; }

private:
    filecenter::db::DbHandle db_{};
    filecenter::core::FileMeta meta_{};
    u64 next_seq_{0};
    u64 bytes_read_{0};
    bool open_{false};
    bool finished_{false};
};

// Payload of a loaded file: the inline buffer or a chunk stream.
class FileData {
public:
    FileData() noexcept = default;

    FileData(FileData&&) noexcept = default;
    FileData& operator=(FileData&&) noexcept = default;
    FileData(const FileData&) = delete;
    FileData& operator=(const FileData&) = delete;

    [[nodiscard]] static FileData from_buffer(std::vector<u8>&& bytes) noexcept;
    [[nodiscard]] static FileData from_stream(ChunkStream&& stream) noexcept;

    [[nodiscard]] filecenter::core::StorageShape shape() const noexcept { return shape_; }

    // Inline only.
    [[nodiscard]] const std::vector<u8>& buffer() const noexcept { return buffer_; }

    // Chunked only.
    [[nodiscard]] ChunkStream& stream() noexcept { return stream_; }

    // Drains either form into *out. A chunked payload can be drained once.
    [[nodiscard]] filecenter::core::Status into_vec(std::vector<u8>* out) noexcept;

private:
    filecenter::core::StorageShape shape_{filecenter::core::StorageShape::Inline};
    std::vector<u8> buffer_;
    ChunkStream stream_;
};

// ========================================================================
// Payload operations
// ========================================================================

// Turns a loaded row into its payload. Inline rows hand over their buffer;
// chunked rows open a stream.
[[nodiscard]] filecenter::core::Status chunk_read(filecenter::db::DbHandle db,
                                                  filecenter::db::FileRecord&& record,
                                                  FileData* out) noexcept;

// Removes all chunk rows of a file.
[[nodiscard]] filecenter::core::Status chunk_delete(filecenter::db::DbHandle db,
                                                    filecenter::core::FileId parent,
                                                    u64* removed) noexcept;

} // namespace filecenter::storage
