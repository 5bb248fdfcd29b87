#include "filecenter/storage/hashing.hpp"

#include <array>
#include <cstddef>

#include "filecenter/storage/source.hpp"

namespace filecenter::storage {
    namespace {
        constexpr size_t kHashReadBytes = 64 * 1024;
    } // namespace

    void hash_init(HashState* state) noexcept {
        if (state != nullptr) {
            blake3_hasher_init(&state->hasher);
        }
    }

    filecenter::core::Status hash_update(HashState* state, BufferView data) noexcept {
        if (state == nullptr || !buffer_ok(data)) {
            return filecenter::core::make_status(filecenter::core::StatusDomain::Storage, filecenter::core::StatusCode::Invalid);
        }
        if (data.len > 0) {
            blake3_hasher_update(&state->hasher, data.data, static_cast<size_t>(data.len));
        }
        return filecenter::core::ok_status();
    }

    filecenter::core::Status hash_finalize(HashState* state, filecenter::core::Hash256* out) noexcept {
        if (state == nullptr || out == nullptr) {
            return filecenter::core::make_status(filecenter::core::StatusDomain::Storage, filecenter::core::StatusCode::Invalid);
        }
        blake3_hasher_finalize(&state->hasher, out->b.data(), out->b.size());
        return filecenter::core::ok_status();
    }

    filecenter::core::Status hash_compute(BufferView data, filecenter::core::Hash256* out) noexcept {
        if (out == nullptr || !buffer_ok(data)) {
            return filecenter::core::make_status(filecenter::core::StatusDomain::Storage, filecenter::core::StatusCode::Invalid);
        }

        HashState state;
        hash_init(&state);
        filecenter::core::Status s = hash_update(&state, data);
        if (!filecenter::core::is_ok(s)) {
            return s;
        }
        return hash_finalize(&state, out);
    }

    filecenter::core::Status hash_source(const ByteSource& src, filecenter::core::Hash256* out) noexcept {
        if (out == nullptr) {
            return filecenter::core::make_status(filecenter::core::StatusDomain::Storage, filecenter::core::StatusCode::Invalid);
        }
        if (src.kind == SourceKind::Buffer) {
            return hash_compute(src.buffer, out);
        }

        SourceCursor cursor;
        filecenter::core::Status s = cursor.open(src);
        if (!filecenter::core::is_ok(s)) {
            return s;
        }
        return hash_cursor(&cursor, out);
    }

    filecenter::core::Status hash_cursor(SourceCursor* cursor, filecenter::core::Hash256* out) noexcept {
        if (cursor == nullptr || out == nullptr) {
            return filecenter::core::make_status(filecenter::core::StatusDomain::Storage, filecenter::core::StatusCode::Invalid);
        }

        HashState state;
        hash_init(&state);
        std::array<u8, kHashReadBytes> block;
        while (true) {
            u64 n = 0;
            filecenter::core::Status s = cursor->read(BufferMut{block.data(), block.size()}, &n);
            if (!filecenter::core::is_ok(s)) {
                return s;
            }
            if (n == 0) {
                break;
            }
            s = hash_update(&state, BufferView{block.data(), n});
            if (!filecenter::core::is_ok(s)) {
                return s;
            }
        }
        return hash_finalize(&state, out);
    }
} // namespace filecenter::storage
