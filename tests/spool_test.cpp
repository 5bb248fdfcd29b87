#include <filesystem>
#include <vector>

#include <gtest/gtest.h>

#include "filecenter/storage/hashing.hpp"
#include "filecenter/storage/source.hpp"
#include "filecenter/storage/spool.hpp"
#include "test_util.hpp"

using namespace filecenter::core;
using namespace filecenter::storage;

namespace {
struct PieceReader {
    const std::vector<u8>* data;
    u64 offset{0};
    u64 piece{7};
};

Status read_piece(void* ctx, BufferMut out, u64* n_read) noexcept {
    auto* r = static_cast<PieceReader*>(ctx);
    u64 n = r->data->size() - r->offset;
    if (n > r->piece) n = r->piece;
    if (n > out.len) n = out.len;
    for (u64 i = 0; i < n; ++i) {
        out.data[i] = (*r->data)[r->offset + i];
    }
    r->offset += n;
    *n_read = n;
    return ok_status();
}

std::vector<u8> read_back(const Spool& spool) {
    SourceCursor cursor;
    EXPECT_TRUE(is_ok(cursor.open(spool.source())));
    EXPECT_TRUE(cursor.rewindable());
    std::vector<u8> out(static_cast<size_t>(spool.size_bytes()) + 16);
    u64 n = 0;
    EXPECT_TRUE(is_ok(cursor.read_full(BufferMut{out.data(), out.size()}, &n)));
    out.resize(static_cast<size_t>(n));
    return out;
}
} // namespace

TEST(Spool, SmallSourceStaysInMemory) {
    const std::vector<u8> data = filecenter::test::pattern_bytes(100);
    PieceReader reader{&data};
    SourceCursor in;
    ASSERT_TRUE(is_ok(in.open(source_reader(&read_piece, &reader))));

    Spool spool;
    ASSERT_TRUE(is_ok(spool.fill(&in, SpoolPolicy{100, 1000, nullptr}, nullptr)));
    EXPECT_FALSE(spool.on_disk());
    EXPECT_EQ(spool.size_bytes(), 100u);
    EXPECT_EQ(read_back(spool), data);
}

TEST(Spool, LargeSourceSpillsAndHashesOnce) {
    filecenter::test::TempPath dir("spool_dir");
    ASSERT_TRUE(std::filesystem::create_directory(dir.str()));

    const std::vector<u8> data = filecenter::test::pattern_bytes(200000, 3);
    PieceReader reader{&data, 0, 4093};
    SourceCursor in;
    ASSERT_TRUE(is_ok(in.open(source_reader(&read_piece, &reader))));

    HashState hasher;
    hash_init(&hasher);
    Spool spool;
    ASSERT_TRUE(is_ok(spool.fill(&in, SpoolPolicy{1000, 1u << 20, dir.c_str()}, &hasher)));
    EXPECT_TRUE(spool.on_disk());
    EXPECT_EQ(spool.size_bytes(), data.size());

    Hash256 streamed{};
    Hash256 expected{};
    ASSERT_TRUE(is_ok(hash_finalize(&hasher, &streamed)));
    ASSERT_TRUE(is_ok(hash_compute(BufferView{data.data(), data.size()}, &expected)));
    EXPECT_EQ(streamed, expected);
    EXPECT_EQ(read_back(spool), data);

    // The scratch file is unlinked as soon as it is created.
    EXPECT_TRUE(std::filesystem::is_empty(dir.str()));
}

TEST(Spool, OversizedSourceIsTooLarge) {
    const std::vector<u8> data = filecenter::test::pattern_bytes(5000);
    PieceReader reader{&data, 0, 512};
    SourceCursor in;
    ASSERT_TRUE(is_ok(in.open(source_reader(&read_piece, &reader))));

    Spool spool;
    const Status s = spool.fill(&in, SpoolPolicy{100, 4999, nullptr}, nullptr);
    EXPECT_EQ(s.code, StatusCode::TooLarge);
}

TEST(Spool, MissingDirectoryIsIo) {
    const std::vector<u8> data = filecenter::test::pattern_bytes(300);
    PieceReader reader{&data};
    SourceCursor in;
    ASSERT_TRUE(is_ok(in.open(source_reader(&read_piece, &reader))));

    Spool spool;
    const Status s = spool.fill(&in, SpoolPolicy{10, 1000, "/nonexistent/filecenter"}, nullptr);
    EXPECT_EQ(s.code, StatusCode::Io);
}

TEST(Spool, FillsOnce) {
    const std::vector<u8> data = filecenter::test::bytes_of("once");
    SourceCursor in;
    ASSERT_TRUE(is_ok(in.open(source_buffer({data.data(), data.size()}))));
    Spool spool;
    ASSERT_TRUE(is_ok(spool.fill(&in, SpoolPolicy{16, 16, nullptr}, nullptr)));
    EXPECT_EQ(spool.fill(&in, SpoolPolicy{16, 16, nullptr}, nullptr).code, StatusCode::Invalid);
}
