#pragma once

#include <blake3.h>

#include "filecenter/core/errors.hpp"
#include "filecenter/core/types.hpp"
#include "filecenter/storage/buffer.hpp"

namespace filecenter::storage {
    struct ByteSource;
    class SourceCursor;

    [[nodiscard]] constexpr bool hash_is_zero(const filecenter::core::Hash256& h) noexcept {
        for (u8 b : h.b) {
            if (b != 0) {
                return false;
            }
        }
        return true;
    }

    // Incremental BLAKE3. Feeding the same bytes in any split yields the
    // digest hash_compute gives for the whole buffer.
    struct HashState {
        blake3_hasher hasher;
    };

    void hash_init(HashState* state) noexcept;
    filecenter::core::Status hash_update(HashState* state, BufferView data) noexcept;
    filecenter::core::Status hash_finalize(HashState* state, filecenter::core::Hash256* out) noexcept;

    filecenter::core::Status hash_compute(BufferView data, filecenter::core::Hash256* out) noexcept;

    // Reads the whole source once. Only meaningful for rewindable sources
    // when the bytes are needed again afterwards.
    filecenter::core::Status hash_source(const ByteSource& src, filecenter::core::Hash256* out) noexcept;

    // Hashes an open cursor from its current position to end of data. The
    // cursor is left at the end; rewind it to read the bytes again.
    filecenter::core::Status hash_cursor(SourceCursor* cursor, filecenter::core::Hash256* out) noexcept;

} // namespace filecenter::storage
