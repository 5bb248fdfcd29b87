#pragma once

#include <type_traits>

#include "filecenter/core/errors.hpp"
#include "filecenter/core/types.hpp"
#include "filecenter/storage/buffer.hpp"

namespace filecenter::storage {

// Where the bytes of a put come from. One tagged value so hashing and the
// chunked store share a single ingestion path.
enum class SourceKind : u8 {
    Path = 0,    // file on disk, opened and closed by the cursor
    Buffer = 1,  // caller memory, must outlive the put
    Fd = 2,      // caller-owned descriptor, read to EOF, never closed
    Reader = 3,  // callback, read to n_read == 0
};

// Fills `out` with up to out.len bytes. *n_read == 0 signals end of data.
using ReadFn = filecenter::core::Status (*)(void* ctx, BufferMut out, u64* n_read) noexcept;

struct ByteSource {
    SourceKind kind{SourceKind::Buffer};
    const char* path{nullptr};
    BufferView buffer{};
    int fd{-1};
    ReadFn read{nullptr};
    void* ctx{nullptr};
};

[[nodiscard]] constexpr ByteSource source_path(const char* path) noexcept {
    ByteSource s{};
    s.kind = SourceKind::Path;
    s.path = path;
    return s;
}

[[nodiscard]] constexpr ByteSource source_buffer(BufferView data) noexcept {
    ByteSource s{};
    s.kind = SourceKind::Buffer;
    s.buffer = data;
    return s;
}

[[nodiscard]] constexpr ByteSource source_fd(int fd) noexcept {
    ByteSource s{};
    s.kind = SourceKind::Fd;
    s.fd = fd;
    return s;
}

[[nodiscard]] constexpr ByteSource source_reader(ReadFn read, void* ctx) noexcept {
    ByteSource s{};
    s.kind = SourceKind::Reader;
    s.read = read;
    s.ctx = ctx;
    return s;
}

// Final path component for Path sources, nullptr otherwise.
[[nodiscard]] const char* source_base_name(const ByteSource& s) noexcept;

class SourceCursor {
public:
    SourceCursor() noexcept = default;
    ~SourceCursor() noexcept;

    SourceCursor(const SourceCursor&) = delete;
    SourceCursor& operator=(const SourceCursor&) = delete;

    [[nodiscard]] filecenter::core::Status open(const ByteSource& src) noexcept;

    // Single read; *n_read == 0 at end of data.
    [[nodiscard]] filecenter::core::Status read(BufferMut out, u64* n_read) noexcept;

    // Reads until `out` is full or the source ends.
    [[nodiscard]] filecenter::core::Status read_full(BufferMut out, u64* n_read) noexcept;

    // Buffers, and Path or Fd sources backed by a regular file. Pipes,
    // sockets, terminals and Reader callbacks yield their bytes once.
    [[nodiscard]] bool rewindable() const noexcept { return rewindable_; }

    // Back to the first byte. Invalid unless rewindable().
    [[nodiscard]] filecenter::core::Status rewind() noexcept;

    void close() noexcept;

private:
    ByteSource src_{};
    int fd_{-1};
    bool owns_fd_{false};
    bool open_{false};
    bool rewindable_{false};
    u64 offset_{0};
    u64 start_{0};      // descriptor offset of the first byte
};

static_assert(std::is_trivially_copyable_v<ByteSource>);
static_assert(std::is_standard_layout_v<ByteSource>);

} // namespace filecenter::storage
