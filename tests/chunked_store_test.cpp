#include <vector>

#include <gtest/gtest.h>
#include <sqlite3.h>

#include "filecenter/db/db.hpp"
#include "filecenter/db/queries.hpp"
#include "filecenter/storage/chunked_store.hpp"
#include "test_util.hpp"

using namespace filecenter::core;
using namespace filecenter::storage;
namespace fdb = filecenter::db;

namespace {

class ChunkedStore : public ::testing::Test {
protected:
    void SetUp() override {
        fdb::DbConfig cfg{};
        ASSERT_TRUE(is_ok(fdb::db_open(cfg, &db_)));
    }
    void TearDown() override {
        EXPECT_TRUE(is_ok(fdb::db_close(db_)));
    }

    // Writes `data` as a chunked temporary file and returns its record.
    fdb::FileRecord store_chunked(const std::vector<u8>& data, u32 threshold, u32 chunk_bytes) {
        SourceCursor cursor;
        EXPECT_TRUE(is_ok(cursor.open(source_buffer({data.data(), data.size()}))));
        ChunkWriter writer;
        EXPECT_TRUE(is_ok(writer.begin(&cursor, ChunkPolicy{threshold, chunk_bytes, kStoreMaxFileBytes}, nullptr)));
        EXPECT_EQ(writer.shape(), StorageShape::Chunked);

        FileMeta meta{};
        meta.temporary = true;
        meta.created_at = 1;
        meta.expires_at = 100;
        meta.shape = StorageShape::Chunked;
        meta.chunk_bytes = chunk_bytes;
        FileId id{};
        EXPECT_TRUE(is_ok(fdb::db_file_insert(db_, meta, BufferView{}, &id)));

        ChunkWriteResult written{};
        EXPECT_TRUE(is_ok(writer.write_chunks(db_, id, &written)));
        EXPECT_TRUE(is_ok(fdb::db_file_finalize_chunked(db_, id, written.size_bytes, written.chunk_count, nullptr)));

        fdb::FileRecord rec{};
        EXPECT_TRUE(is_ok(fdb::db_file_get(db_, id, &rec)));
        return rec;
    }

    fdb::DbHandle db_{};
};

} // namespace

TEST_F(ChunkedStore, ShapeFollowsThreshold) {
    for (u64 n : {u64{0}, u64{1}, u64{9}, u64{10}, u64{11}, u64{25}}) {
        const std::vector<u8> data = filecenter::test::pattern_bytes(static_cast<size_t>(n));
        SourceCursor cursor;
        ASSERT_TRUE(is_ok(cursor.open(source_buffer({data.data(), data.size()}))));
        ChunkWriter writer;
        ASSERT_TRUE(is_ok(writer.begin(&cursor, ChunkPolicy{10, 10, kStoreMaxFileBytes}, nullptr)));
        EXPECT_EQ(writer.shape(), n <= 10 ? StorageShape::Inline : StorageShape::Chunked) << n;
        if (n <= 10) {
            EXPECT_EQ(writer.inline_payload().len, n);
        }
    }
}

TEST_F(ChunkedStore, ChunksAreSequentialAndBounded) {
    const std::vector<u8> data = filecenter::test::bytes_of("HELLOWORLD!");
    const fdb::FileRecord rec = store_chunked(data, 10, 10);
    EXPECT_EQ(rec.meta.size_bytes, 11u);
    EXPECT_EQ(rec.meta.chunk_count, 2u);

    std::vector<u8> chunk;
    ASSERT_TRUE(is_ok(fdb::db_chunk_get(db_, rec.meta.id, 0, &chunk)));
    EXPECT_EQ(chunk, filecenter::test::bytes_of("HELLOWORLD"));
    ASSERT_TRUE(is_ok(fdb::db_chunk_get(db_, rec.meta.id, 1, &chunk)));
    EXPECT_EQ(chunk, filecenter::test::bytes_of("!"));
}

TEST_F(ChunkedStore, ExactMultipleHasNoEmptyTail) {
    const std::vector<u8> data = filecenter::test::pattern_bytes(40);
    const fdb::FileRecord rec = store_chunked(data, 16, 8);
    EXPECT_EQ(rec.meta.chunk_count, 5u);
}

TEST_F(ChunkedStore, StreamYieldsChunksInOrder) {
    const std::vector<u8> data = filecenter::test::pattern_bytes(1000, 3);
    fdb::FileRecord rec = store_chunked(data, 100, 64);

    FileData payload;
    ASSERT_TRUE(is_ok(chunk_read(db_, std::move(rec), &payload)));
    ASSERT_EQ(payload.shape(), StorageShape::Chunked);

    std::vector<u8> joined;
    std::vector<u8> chunk;
    u64 yielded = 0;
    while (true) {
        bool done = false;
        ASSERT_TRUE(is_ok(payload.stream().next(&chunk, &done)));
        if (done) break;
        EXPECT_LE(chunk.size(), 64u);
        joined.insert(joined.end(), chunk.begin(), chunk.end());
        ++yielded;
    }
    EXPECT_EQ(yielded, payload.stream().chunk_count());
    EXPECT_EQ(payload.stream().bytes_read(), data.size());
    EXPECT_EQ(joined, data);
}

TEST_F(ChunkedStore, InlineReadHandsOverBuffer) {
    fdb::FileRecord rec{};
    rec.meta.shape = StorageShape::Inline;
    rec.meta.size_bytes = 3;
    rec.inline_data = filecenter::test::bytes_of("abc");

    FileData payload;
    ASSERT_TRUE(is_ok(chunk_read(db_, std::move(rec), &payload)));
    std::vector<u8> out;
    ASSERT_TRUE(is_ok(payload.into_vec(&out)));
    EXPECT_EQ(out, filecenter::test::bytes_of("abc"));
}

TEST_F(ChunkedStore, InlineSizeMismatchIsInconsistent) {
    fdb::FileRecord rec{};
    rec.meta.shape = StorageShape::Inline;
    rec.meta.size_bytes = 4;
    rec.inline_data = filecenter::test::bytes_of("abc");

    FileData payload;
    EXPECT_EQ(chunk_read(db_, std::move(rec), &payload).code, StatusCode::Inconsistent);
}

TEST_F(ChunkedStore, MissingChunkRowIsInconsistentAtOpen) {
    fdb::FileRecord rec = store_chunked(filecenter::test::pattern_bytes(30), 10, 10);
    fdb::FileRecord tampered = rec;
    tampered.meta.chunk_count = 4;
    tampered.meta.size_bytes = 40;

    FileData payload;
    EXPECT_EQ(chunk_read(db_, std::move(tampered), &payload).code, StatusCode::Inconsistent);
}

TEST_F(ChunkedStore, RecordedSizeDisagreeingWithCountIsInconsistent) {
    fdb::FileRecord rec = store_chunked(filecenter::test::pattern_bytes(30), 10, 10);
    rec.meta.size_bytes = 45;

    FileData payload;
    EXPECT_EQ(chunk_read(db_, std::move(rec), &payload).code, StatusCode::Inconsistent);
}

TEST_F(ChunkedStore, ShortChunkIsInconsistentWhileStreaming) {
    fdb::FileRecord rec = store_chunked(filecenter::test::pattern_bytes(30), 10, 10);
    // Same chunk count, but the recorded size claims a longer tail.
    rec.meta.size_bytes = 29;

    FileData payload;
    ASSERT_TRUE(is_ok(chunk_read(db_, std::move(rec), &payload)));
    std::vector<u8> out;
    EXPECT_EQ(payload.into_vec(&out).code, StatusCode::Inconsistent);
}

TEST_F(ChunkedStore, DeletedDuringStreamIsNotFound) {
    fdb::FileRecord rec = store_chunked(filecenter::test::pattern_bytes(30), 10, 10);
    const FileId id = rec.meta.id;

    FileData payload;
    ASSERT_TRUE(is_ok(chunk_read(db_, std::move(rec), &payload)));
    std::vector<u8> chunk;
    bool done = false;
    ASSERT_TRUE(is_ok(payload.stream().next(&chunk, &done)));

    bool deleted = false;
    ASSERT_TRUE(is_ok(fdb::db_file_delete(db_, id, &deleted)));
    ASSERT_TRUE(deleted);

    EXPECT_EQ(payload.stream().next(&chunk, &done).code, StatusCode::NotFound);
}

TEST_F(ChunkedStore, TooLargeIsRejected) {
    const std::vector<u8> data = filecenter::test::pattern_bytes(100);
    SourceCursor cursor;
    ASSERT_TRUE(is_ok(cursor.open(source_buffer({data.data(), data.size()}))));
    ChunkWriter writer;
    ASSERT_TRUE(is_ok(writer.begin(&cursor, ChunkPolicy{10, 10, 50}, nullptr)));

    FileMeta meta{};
    meta.temporary = true;
    meta.expires_at = 10;
    meta.shape = StorageShape::Chunked;
    meta.chunk_bytes = 10;
    FileId id{};
    ASSERT_TRUE(is_ok(fdb::db_file_insert(db_, meta, BufferView{}, &id)));

    ChunkWriteResult written{};
    EXPECT_EQ(writer.write_chunks(db_, id, &written).code, StatusCode::TooLarge);
}

TEST_F(ChunkedStore, HasherSeesEveryByteOnce) {
    const std::vector<u8> data = filecenter::test::pattern_bytes(777, 9);
    Hash256 expected{};
    ASSERT_TRUE(is_ok(hash_compute({data.data(), data.size()}, &expected)));

    SourceCursor cursor;
    ASSERT_TRUE(is_ok(cursor.open(source_buffer({data.data(), data.size()}))));
    HashState hasher;
    hash_init(&hasher);
    ChunkWriter writer;
    ASSERT_TRUE(is_ok(writer.begin(&cursor, ChunkPolicy{100, 64, kStoreMaxFileBytes}, &hasher)));

    FileMeta meta{};
    meta.temporary = true;
    meta.expires_at = 10;
    meta.shape = StorageShape::Chunked;
    meta.chunk_bytes = 64;
    FileId id{};
    ASSERT_TRUE(is_ok(fdb::db_file_insert(db_, meta, BufferView{}, &id)));
    ChunkWriteResult written{};
    ASSERT_TRUE(is_ok(writer.write_chunks(db_, id, &written)));
    EXPECT_EQ(written.size_bytes, data.size());

    Hash256 got{};
    ASSERT_TRUE(is_ok(hash_finalize(&hasher, &got)));
    EXPECT_EQ(got, expected);
}

TEST_F(ChunkedStore, PolicyIsValidated) {
    const std::vector<u8> data = filecenter::test::pattern_bytes(5);
    SourceCursor cursor;
    ASSERT_TRUE(is_ok(cursor.open(source_buffer({data.data(), data.size()}))));
    ChunkWriter writer;
    EXPECT_EQ(writer.begin(&cursor, ChunkPolicy{10, 20, kStoreMaxFileBytes}, nullptr).code, StatusCode::Invalid);
}
